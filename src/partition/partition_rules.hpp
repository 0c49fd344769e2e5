#pragma once
#include <string>
#include <vector>

namespace lookbook {

struct PartitionConfig;

// Keys name files under the index directory: letters, digits, '_' and '-'
bool valid_partition_key(const std::string& key);

struct PartitionRule {
    std::string keyword;  // matched case-insensitively as a substring
    std::string key;
};

// Ordered keyword -> partition key table with a mandatory default arm.
// The first rule whose keyword occurs in the label wins.
class PartitionRuleTable {
public:
    // Throws std::invalid_argument on an empty keyword or an invalid key
    PartitionRuleTable(std::vector<PartitionRule> rules, std::string default_key);

    static PartitionRuleTable from_config(const PartitionConfig& config);
    static PartitionRuleTable defaults();

    const std::string& classify(const std::string& label) const;

    // Declared keys in rule order, default last, no duplicates
    std::vector<std::string> keys() const;

    const std::vector<PartitionRule>& rules() const { return rules_; }
    const std::string& default_key() const { return default_key_; }

private:
    std::vector<PartitionRule> rules_;
    std::string default_key_;
};

} // namespace lookbook
