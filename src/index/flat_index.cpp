#include "flat_index.hpp"
#include "similarity_index.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace lookbook {

namespace {

constexpr char kMagic[4] = {'L', 'B', 'F', 'I'};
constexpr uint32_t kVersion = 1;
constexpr size_t kHeaderSize = sizeof(kMagic) + sizeof(uint32_t) * 2 + sizeof(uint64_t);

template <typename T>
void put(std::string& out, T value) {
    char buf[sizeof(T)];
    std::memcpy(buf, &value, sizeof(T));
    out.append(buf, sizeof(T));
}

template <typename T>
T take(const std::string& in, size_t& pos) {
    T value;
    std::memcpy(&value, in.data() + pos, sizeof(T));
    pos += sizeof(T);
    return value;
}

} // namespace

FlatIpIndex::FlatIpIndex(uint32_t dim) : dim_(dim) {}

void FlatIpIndex::add(const float* rows, size_t n) {
    data_.insert(data_.end(), rows, rows + n * dim_);
}

std::vector<std::pair<size_t, float>> FlatIpIndex::search(const float* query, size_t query_dim,
                                                          int64_t k) const {
    const size_t n = size();
    if (k <= 0 || n == 0 || query_dim != dim_) return {};

    std::vector<std::pair<size_t, float>> scored;
    scored.reserve(n);
    for (size_t r = 0; r < n; ++r) {
        const float* v = row(r);
        double dot = 0.0;
        for (size_t j = 0; j < dim_; ++j) {
            dot += static_cast<double>(query[j]) * static_cast<double>(v[j]);
        }
        scored.emplace_back(r, static_cast<float>(dot));
    }

    const size_t top = std::min(static_cast<size_t>(k), n);
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(top),
                      scored.end(),
                      [](const std::pair<size_t, float>& a, const std::pair<size_t, float>& b) {
                          // NaN scores sort after every number
                          bool a_nan = std::isnan(a.second);
                          bool b_nan = std::isnan(b.second);
                          if (a_nan != b_nan) return b_nan;
                          if (!a_nan && a.second != b.second) return a.second > b.second;
                          return a.first < b.first;
                      });
    scored.resize(top);
    return scored;
}

std::string FlatIpIndex::serialize() const {
    std::string out;
    out.reserve(kHeaderSize + data_.size() * sizeof(float));
    out.append(kMagic, sizeof(kMagic));
    put<uint32_t>(out, kVersion);
    put<uint32_t>(out, dim_);
    put<uint64_t>(out, static_cast<uint64_t>(size()));
    out.append(reinterpret_cast<const char*>(data_.data()), data_.size() * sizeof(float));
    return out;
}

FlatIpIndex FlatIpIndex::deserialize(const std::string& payload) {
    if (payload.size() < kHeaderSize ||
        std::memcmp(payload.data(), kMagic, sizeof(kMagic)) != 0) {
        throw CorruptIndexError("flat index payload: bad header");
    }

    size_t pos = sizeof(kMagic);
    auto version = take<uint32_t>(payload, pos);
    auto dim = take<uint32_t>(payload, pos);
    auto rows = take<uint64_t>(payload, pos);

    if (version != kVersion) {
        throw CorruptIndexError("flat index payload: unsupported version " +
                                std::to_string(version));
    }
    if (dim == 0 && rows != 0) {
        throw CorruptIndexError("flat index payload: zero dimension");
    }
    const uint64_t available = (payload.size() - kHeaderSize) / sizeof(float);
    if (dim != 0 && rows > available / dim) {
        throw CorruptIndexError("flat index payload: truncated matrix");
    }
    const uint64_t floats = rows * dim;
    if (payload.size() - kHeaderSize != floats * sizeof(float)) {
        throw CorruptIndexError("flat index payload: truncated matrix");
    }

    FlatIpIndex index(dim);
    index.data_.resize(static_cast<size_t>(floats));
    std::memcpy(index.data_.data(), payload.data() + kHeaderSize,
                static_cast<size_t>(floats) * sizeof(float));
    return index;
}

} // namespace lookbook
