#include "similarity_index.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <unordered_set>

namespace lookbook {

namespace {

constexpr const char* kBlobFormat = "lookbook.similarity_index";
constexpr int kBlobVersion = 1;

nlohmann::json to_binary(const char* data, size_t len) {
    const auto* p = reinterpret_cast<const std::uint8_t*>(data);
    return nlohmann::json::binary(std::vector<std::uint8_t>(p, p + len));
}

} // namespace

SimilarityIndex::SimilarityIndex(std::vector<std::string> ids, FlatIpIndex index)
    : ids_(std::move(ids)), index_(std::move(index)) {}

SimilarityIndex SimilarityIndex::build(const std::vector<IndexedItem>& items) {
    if (items.empty()) {
        throw EmptyInputError("cannot build an index from zero items");
    }

    const size_t dim = items.front().vector.size();
    if (dim == 0) {
        throw DimensionMismatchError("first vector (" + items.front().id + ") is empty");
    }

    std::vector<std::string> ids;
    ids.reserve(items.size());
    std::unordered_set<std::string> seen;
    FlatIpIndex index(static_cast<uint32_t>(dim));

    for (const auto& item : items) {
        if (item.vector.size() != dim) {
            throw DimensionMismatchError(
                "vector for " + item.id + " has " + std::to_string(item.vector.size()) +
                " dimensions, expected " + std::to_string(dim));
        }
        if (!seen.insert(item.id).second) {
            throw DuplicateIdentifierError("duplicate identifier: " + item.id);
        }
        ids.push_back(item.id);
        index.add(item.vector.data(), 1);
    }

    return SimilarityIndex(std::move(ids), std::move(index));
}

std::vector<SearchHit> SimilarityIndex::search(const Embedding& query, int64_t k) const {
    std::vector<SearchHit> hits;
    if (k <= 0 || ids_.empty()) return hits;

    auto rows = index_.search(query.data(), query.size(), k);
    hits.reserve(rows.size());
    for (const auto& [row, score] : rows) {
        if (row < ids_.size()) hits.push_back({ids_[row], score});
    }
    return hits;
}

Embedding SimilarityIndex::vector(size_t row) const {
    if (row >= ids_.size()) return {};
    const float* v = index_.row(row);
    return Embedding(v, v + index_.dim());
}

std::string SimilarityIndex::serialize() const {
    const auto& matrix = index_.data();
    std::string payload = index_.serialize();

    nlohmann::json blob = {
        {"format", kBlobFormat},
        {"version", kBlobVersion},
        {"dim", index_.dim()},
        {"ids", ids_},
        {"vectors", to_binary(reinterpret_cast<const char*>(matrix.data()),
                              matrix.size() * sizeof(float))},
        {"index", to_binary(payload.data(), payload.size())}
    };

    auto bytes = nlohmann::json::to_msgpack(blob);
    return std::string(bytes.begin(), bytes.end());
}

SimilarityIndex SimilarityIndex::deserialize(const std::string& bytes) {
    nlohmann::json blob;
    try {
        blob = nlohmann::json::from_msgpack(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw CorruptIndexError(std::string("index blob is not valid MessagePack: ") + e.what());
    }

    if (!blob.is_object()) {
        throw CorruptIndexError("index blob is not a map");
    }
    if (!blob.contains("ids") || !blob["ids"].is_array()) {
        throw CorruptIndexError("index blob has no identifier list");
    }
    if (!blob.contains("index") || !blob["index"].is_binary()) {
        throw CorruptIndexError("index blob has no search payload");
    }

    std::vector<std::string> ids;
    ids.reserve(blob["ids"].size());
    std::unordered_set<std::string> seen;
    for (const auto& id : blob["ids"]) {
        if (!id.is_string()) {
            throw CorruptIndexError("index blob has a non-string identifier");
        }
        auto s = id.get<std::string>();
        if (!seen.insert(s).second) {
            throw CorruptIndexError("index blob has duplicate identifier: " + s);
        }
        ids.push_back(std::move(s));
    }

    const auto& bin = blob["index"].get_binary();
    FlatIpIndex index = FlatIpIndex::deserialize(std::string(bin.begin(), bin.end()));
    if (index.size() != ids.size()) {
        throw CorruptIndexError("index blob has " + std::to_string(ids.size()) +
                                " identifiers but " + std::to_string(index.size()) + " rows");
    }

    return SimilarityIndex(std::move(ids), std::move(index));
}

void SimilarityIndex::save(const std::string& path) const {
    if (!atomic_write_file(path, serialize())) {
        throw std::runtime_error("cannot write index file: " + path);
    }
}

SimilarityIndex SimilarityIndex::load(const std::string& path) {
    std::string bytes;
    if (!read_file(path, bytes)) {
        throw std::runtime_error("cannot read index file: " + path);
    }
    return deserialize(bytes);
}

} // namespace lookbook
