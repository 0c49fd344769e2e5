#pragma once
#include "../behavior/behavior_store.hpp"
#include "../embedder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lookbook {

// Prefix of search events recorded for an image search
constexpr const char* kImageSearchMarker = "[image-search]";

// Remove the image-search marker and surrounding whitespace
std::string strip_search_marker(const std::string& value);

// Element-wise mean of the vectors sharing the first vector's width,
// re-normalized. nullopt when nothing qualifies or the mean is zero.
std::optional<Embedding> fuse_embeddings(const std::vector<Embedding>& vectors);

// Builds a user's query vector from their most recent mixed behavior
class InterestVectorBuilder {
public:
    InterestVectorBuilder(EmbeddingProvider& embedder, BehaviorStore& store,
                          uint32_t recent_count);

    std::optional<Embedding> build(const std::string& user);

    // Clicks are encoded as images, searches as text
    std::optional<Embedding> build_from_events(const std::vector<BehaviorEvent>& events);

private:
    EmbeddingProvider& embedder_;
    BehaviorStore& store_;
    uint32_t recent_count_;
};

} // namespace lookbook
