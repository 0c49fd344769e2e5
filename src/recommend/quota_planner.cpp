#include "quota_planner.hpp"
#include "../config.hpp"
#include "../partition/partition_registry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace lookbook {

QuotaPlanner::QuotaPlanner(std::vector<PartitionQuota> policy)
    : policy_(std::move(policy)) {}

QuotaPlanner QuotaPlanner::from_config(const RecommendConfig& config) {
    std::vector<PartitionQuota> policy;
    policy.reserve(config.quotas.size());
    for (const auto& q : config.quotas) {
        policy.push_back({q.key, q.ratio, q.floor});
    }
    return QuotaPlanner(std::move(policy));
}

std::vector<QuotaAllocation> QuotaPlanner::allocate(uint32_t target) const {
    std::vector<QuotaAllocation> out;
    out.reserve(policy_.size());
    uint64_t total = 0;
    for (const auto& entry : policy_) {
        double ratio = entry.ratio >= 0.0 ? std::min(entry.ratio, 1.0) : 0.0;
        auto share = static_cast<uint64_t>(std::floor(static_cast<double>(target) * ratio));
        auto quota = static_cast<uint32_t>(
            std::min<uint64_t>(share + entry.floor, std::numeric_limits<uint32_t>::max()));
        out.push_back({entry.key, quota});
        total += quota;
    }

    while (total > target) {
        size_t pick = out.size();
        uint32_t best = 0;
        for (size_t i = 0; i < out.size(); ++i) {
            uint32_t slack = out[i].quota - policy_[i].floor;
            if (slack > 0 && slack >= best) {
                best = slack;
                pick = i;
            }
        }
        if (pick == out.size()) break;  // everything sits at its floor
        --out[pick].quota;
        --total;
    }
    return out;
}

std::vector<RankedCandidate> QuotaPlanner::merge(const std::vector<PartitionResult>& results,
                                                 size_t limit) {
    std::vector<RankedCandidate> merged;
    for (size_t p = 0; p < results.size(); ++p) {
        const auto& hits = results[p].hits;
        for (size_t r = 0; r < hits.size(); ++r) {
            merged.push_back({hits[r].id, hits[r].score, results[p].key, p, r});
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const RankedCandidate& a, const RankedCandidate& b) {
                         return a.score > b.score;
                     });
    if (merged.size() > limit) merged.resize(limit);
    return merged;
}

std::vector<RankedCandidate> QuotaPlanner::plan(const PartitionRegistry& registry,
                                                const Embedding& query,
                                                uint32_t target) const {
    std::vector<PartitionResult> results;
    for (const auto& alloc : allocate(target)) {
        if (alloc.quota == 0) continue;
        results.push_back({alloc.key, registry.search(alloc.key, query, alloc.quota)});
    }
    return merge(results, target);
}

} // namespace lookbook
