#pragma once
#include "index_manager.hpp"
#include "../behavior/behavior_store.hpp"
#include "../recommend/session_cache.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lookbook {

struct SearchResult {
    std::string id;
    std::string caption;
    float score = 0.0f;
};

class SearchService {
public:
    SearchService(EmbeddingProvider& embedder, const IndexManager& indexes,
                  const Catalog& catalog, BehaviorStore& behavior, SessionCache& results);

    // Records the query as a search event for a signed-in user
    std::vector<SearchResult> text_search(const std::string& query, int64_t k,
                                          const std::optional<std::string>& user = std::nullopt);

    // The query image itself never appears in the results
    std::vector<SearchResult> image_search(const std::string& path, int64_t k,
                                           const std::optional<std::string>& user = std::nullopt);

    // Captions closest to the image
    std::vector<SearchResult> describe_image(const std::string& path, int64_t k);

private:
    std::optional<Embedding> encode_image(const std::string& path);
    std::vector<SearchResult> enrich(const std::vector<SearchHit>& hits) const;

    EmbeddingProvider& embedder_;
    const IndexManager& indexes_;
    const Catalog& catalog_;
    BehaviorStore& behavior_;
    SessionCache& results_;
};

} // namespace lookbook
