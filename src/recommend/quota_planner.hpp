#pragma once
#include "../index/similarity_index.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lookbook {

class PartitionRegistry;
struct RecommendConfig;

struct PartitionQuota {
    std::string key;
    double ratio = 0.0;
    uint32_t floor = 0;
};

struct QuotaAllocation {
    std::string key;
    uint32_t quota = 0;
};

struct PartitionResult {
    std::string key;
    std::vector<SearchHit> hits;  // descending score
};

struct RankedCandidate {
    std::string id;
    float score = 0.0f;
    std::string partition;
    size_t priority = 0;  // position of the partition in the policy
    size_t rank = 0;      // position inside its partition's result list
};

// Splits a result budget across partitions and merges the per-partition
// candidate lists. Policy order is priority order.
class QuotaPlanner {
public:
    explicit QuotaPlanner(std::vector<PartitionQuota> policy);

    static QuotaPlanner from_config(const RecommendConfig& config);

    // floor(target * ratio) + floor per entry, ratio clamped to [0, 1]. An
    // oversubscribed total is trimmed from the entry with the most slack
    // above its floor (ties: lowest priority first) until it fits or every
    // entry is at its floor.
    std::vector<QuotaAllocation> allocate(uint32_t target) const;

    // Stable sort by descending score, so ties keep partition priority and
    // then per-partition rank. Truncated to limit.
    static std::vector<RankedCandidate> merge(const std::vector<PartitionResult>& results,
                                              size_t limit);

    // allocate + one search per partition + merge. Under-fill is not an error.
    std::vector<RankedCandidate> plan(const PartitionRegistry& registry,
                                      const Embedding& query, uint32_t target) const;

    const std::vector<PartitionQuota>& policy() const { return policy_; }

private:
    std::vector<PartitionQuota> policy_;
};

} // namespace lookbook
