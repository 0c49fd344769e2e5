#include "interest_vector.hpp"
#include "../util.hpp"
#include <iostream>

namespace lookbook {

std::string strip_search_marker(const std::string& value) {
    return trim(replace_all(value, kImageSearchMarker, ""));
}

std::optional<Embedding> fuse_embeddings(const std::vector<Embedding>& vectors) {
    if (vectors.empty() || vectors.front().empty()) return std::nullopt;

    const size_t dim = vectors.front().size();
    std::vector<double> sum(dim, 0.0);
    size_t used = 0;
    for (const auto& v : vectors) {
        if (v.size() != dim) continue;
        for (size_t i = 0; i < dim; ++i) sum[i] += v[i];
        ++used;
    }

    Embedding mean(dim);
    for (size_t i = 0; i < dim; ++i) {
        mean[i] = static_cast<float>(sum[i] / static_cast<double>(used));
    }
    if (!l2_normalize(mean)) return std::nullopt;
    return mean;
}

InterestVectorBuilder::InterestVectorBuilder(EmbeddingProvider& embedder, BehaviorStore& store,
                                             uint32_t recent_count)
    : embedder_(embedder), store_(store), recent_count_(recent_count) {}

std::optional<Embedding> InterestVectorBuilder::build(const std::string& user) {
    return build_from_events(store_.get_recent_mixed(user, recent_count_));
}

std::optional<Embedding> InterestVectorBuilder::build_from_events(
    const std::vector<BehaviorEvent>& events) {
    std::vector<std::string> images;
    std::vector<std::string> texts;
    for (const auto& ev : events) {
        if (ev.type == BehaviorType::Click) {
            images.push_back(ev.value);
        } else {
            std::string text = strip_search_marker(ev.value);
            if (!text.empty()) texts.push_back(std::move(text));
        }
    }
    if (images.empty() && texts.empty()) return std::nullopt;

    std::vector<Embedding> vectors;
    if (!images.empty()) {
        try {
            auto encoded = embedder_.encode_images(images);
            vectors.insert(vectors.end(), encoded.begin(), encoded.end());
        } catch (const std::exception& e) {
            std::cerr << "[recommend] Image encoding failed: " << e.what() << "\n";
        }
    }
    if (!texts.empty()) {
        try {
            auto encoded = embedder_.encode_texts(texts);
            vectors.insert(vectors.end(), encoded.begin(), encoded.end());
        } catch (const std::exception& e) {
            std::cerr << "[recommend] Text encoding failed: " << e.what() << "\n";
        }
    }

    return fuse_embeddings(vectors);
}

} // namespace lookbook
