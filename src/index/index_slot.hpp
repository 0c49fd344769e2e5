#pragma once
#include "similarity_index.hpp"
#include <memory>
#include <mutex>

namespace lookbook {

// Holds the current generation of one index. Readers take a shared_ptr and
// keep using it while a rebuild publishes the next one.
class IndexSlot {
public:
    std::shared_ptr<const SimilarityIndex> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void publish(std::shared_ptr<const SimilarityIndex> index) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(index);
    }

    // Empty slot or k <= 0 -> empty
    std::vector<SearchHit> search(const Embedding& query, int64_t k) const {
        auto index = get();
        if (!index) return {};
        return index->search(query, k);
    }

private:
    std::shared_ptr<const SimilarityIndex> current_;
    mutable std::mutex mutex_;
};

} // namespace lookbook
