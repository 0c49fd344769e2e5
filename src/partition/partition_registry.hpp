#pragma once
#include "partition_rules.hpp"
#include "../index/similarity_index.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lookbook {

struct LabeledItem {
    std::string id;
    Embedding vector;
    std::string label;  // raw caption, classified by the rule table
};

using PartitionMap = std::map<std::string, std::shared_ptr<const SimilarityIndex>>;

// One similarity index per partition key. A generation is built or loaded
// off to the side and published by swapping one pointer, so readers never
// observe a half-built registry.
class PartitionRegistry {
public:
    explicit PartitionRegistry(PartitionRuleTable rules);

    // Classify, group in input order, build one index per non-empty group.
    // Index build errors propagate.
    PartitionMap build_all(const std::vector<LabeledItem>& items) const;

    // build_all, then publish. Returns the number of partitions.
    size_t build(const std::vector<LabeledItem>& items);

    // Write partition_<key>.idx for every published partition
    void save_all(const std::string& dir) const;

    // Write one file per partition and remove partition files of keys
    // that are no longer present
    static void save_map(const PartitionMap& partitions, const std::string& dir);

    // Load every partition_*.idx in filename order; corrupt files are
    // logged and skipped. Publishes what was loaded and returns its size.
    size_t load_all(const std::string& dir);

    void publish(PartitionMap partitions);

    // Absent key or k <= 0 -> empty
    std::vector<SearchHit> search(const std::string& key, const Embedding& query,
                                  int64_t k) const;

    std::vector<std::string> keys() const;
    size_t partition_size(const std::string& key) const;
    std::shared_ptr<const PartitionMap> snapshot() const;

    const PartitionRuleTable& rules() const { return rules_; }

    static std::string file_name(const std::string& key);

private:
    PartitionRuleTable rules_;
    std::shared_ptr<const PartitionMap> current_;
    mutable std::mutex mutex_;
};

} // namespace lookbook
