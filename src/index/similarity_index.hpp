#pragma once
#include "flat_index.hpp"
#include "../embedder.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace lookbook {

// Structural index failures. Expected query-time edge cases never throw.
class IndexError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EmptyInputError : public IndexError {
public:
    using IndexError::IndexError;
};

class DimensionMismatchError : public IndexError {
public:
    using IndexError::IndexError;
};

class DuplicateIdentifierError : public IndexError {
public:
    using IndexError::IndexError;
};

class CorruptIndexError : public IndexError {
public:
    using IndexError::IndexError;
};

struct IndexedItem {
    std::string id;
    Embedding vector;
};

struct SearchHit {
    std::string id;
    float score = 0.0f;
};

// Immutable identifier list + flat inner-product index. Row i of the index
// holds the vector of ids()[i].
class SimilarityIndex {
public:
    // Throws EmptyInputError, DimensionMismatchError, DuplicateIdentifierError
    static SimilarityIndex build(const std::vector<IndexedItem>& items);

    // At most min(k, size()) hits, descending score, ties by insertion order
    std::vector<SearchHit> search(const Embedding& query, int64_t k) const;

    // MessagePack blob: ids, raw vectors and the flat index payload
    std::string serialize() const;

    // Throws CorruptIndexError
    static SimilarityIndex deserialize(const std::string& bytes);

    // Throws std::runtime_error when the file cannot be written
    void save(const std::string& path) const;

    // Throws std::runtime_error when unreadable, CorruptIndexError when malformed
    static SimilarityIndex load(const std::string& path);

    size_t size() const { return ids_.size(); }
    uint32_t dim() const { return index_.dim(); }
    const std::vector<std::string>& ids() const { return ids_; }
    Embedding vector(size_t row) const;

private:
    SimilarityIndex(std::vector<std::string> ids, FlatIpIndex index);

    std::vector<std::string> ids_;
    FlatIpIndex index_;
};

} // namespace lookbook
