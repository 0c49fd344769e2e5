#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lookbook {

// Exact inner-product search over row-major float vectors. Rows are
// addressed by insertion order.
class FlatIpIndex {
public:
    explicit FlatIpIndex(uint32_t dim = 0);

    // Append rows (n * dim floats). Used while building only.
    void add(const float* rows, size_t n);

    // Top-k rows as (row, score), descending score, ties by lower row,
    // NaN scores last.
    // k <= 0, an empty index or a width mismatch yield no results.
    std::vector<std::pair<size_t, float>> search(const float* query, size_t query_dim,
                                                 int64_t k) const;

    uint32_t dim() const { return dim_; }
    size_t size() const { return dim_ == 0 ? 0 : data_.size() / dim_; }
    const float* row(size_t i) const { return data_.data() + i * dim_; }
    const std::vector<float>& data() const { return data_; }

    // Versioned binary payload: magic, version, dim, rows, row-major floats
    std::string serialize() const;

    // Throws CorruptIndexError on a malformed payload
    static FlatIpIndex deserialize(const std::string& payload);

private:
    uint32_t dim_;
    std::vector<float> data_;
};

} // namespace lookbook
