#include "search_service.hpp"
#include "../recommend/interest_vector.hpp"
#include "../util.hpp"
#include <filesystem>
#include <iostream>
#include <limits>

namespace lookbook {

namespace {

std::string normalized_path(const std::string& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) return path;
    return abs.lexically_normal().string();
}

std::vector<std::string> ids_of(const std::vector<SearchResult>& results) {
    std::vector<std::string> ids;
    ids.reserve(results.size());
    for (const auto& r : results) ids.push_back(r.id);
    return ids;
}

} // namespace

SearchService::SearchService(EmbeddingProvider& embedder, const IndexManager& indexes,
                             const Catalog& catalog, BehaviorStore& behavior,
                             SessionCache& results)
    : embedder_(embedder)
    , indexes_(indexes)
    , catalog_(catalog)
    , behavior_(behavior)
    , results_(results)
{}

std::vector<SearchResult> SearchService::enrich(const std::vector<SearchHit>& hits) const {
    std::vector<SearchResult> out;
    out.reserve(hits.size());
    for (const auto& hit : hits) {
        out.push_back({hit.id, catalog_.caption_for(hit.id), hit.score});
    }
    return out;
}

std::optional<Embedding> SearchService::encode_image(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[search] Image not found: " << path << "\n";
        return std::nullopt;
    }
    try {
        auto vectors = embedder_.encode_images({path});
        if (vectors.empty()) return std::nullopt;
        return vectors.front();
    } catch (const std::exception& e) {
        std::cerr << "[search] Image encoding failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::vector<SearchResult> SearchService::text_search(const std::string& query, int64_t k,
                                                     const std::optional<std::string>& user) {
    std::string text = trim(query);
    if (text.empty() || k < 1) return {};

    if (user) behavior_.add(*user, BehaviorType::Search, text);

    Embedding q;
    try {
        auto vectors = embedder_.encode_texts({text});
        if (vectors.empty()) return {};
        q = std::move(vectors.front());
    } catch (const std::exception& e) {
        std::cerr << "[search] Text encoding failed: " << e.what() << "\n";
        return {};
    }

    auto results = enrich(indexes_.image_slot().search(q, k));
    if (user) results_.record(*user, ids_of(results));
    return results;
}

std::vector<SearchResult> SearchService::image_search(const std::string& path, int64_t k,
                                                      const std::optional<std::string>& user) {
    if (k < 1) return {};
    auto q = encode_image(path);
    if (!q) return {};

    // One extra hit in case the query image is itself in the catalog
    const std::string self = normalized_path(path);
    std::vector<SearchHit> hits;
    const int64_t wanted = k == std::numeric_limits<int64_t>::max() ? k : k + 1;
    for (auto& hit : indexes_.image_slot().search(*q, wanted)) {
        if (normalized_path(hit.id) == self) continue;
        hits.push_back(std::move(hit));
        if (static_cast<int64_t>(hits.size()) >= k) break;
    }

    auto results = enrich(hits);
    if (user) {
        results_.record(*user, ids_of(results));
        if (!results.empty() && !results.front().caption.empty()) {
            behavior_.add(*user, BehaviorType::Search,
                          std::string(kImageSearchMarker) + " " + results.front().caption);
        }
    }
    return results;
}

std::vector<SearchResult> SearchService::describe_image(const std::string& path, int64_t k) {
    if (k < 1) return {};
    auto q = encode_image(path);
    if (!q) return {};
    return enrich(indexes_.caption_slot().search(*q, k));
}

} // namespace lookbook
