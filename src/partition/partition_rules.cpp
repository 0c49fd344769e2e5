#include "partition_rules.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lookbook {

bool valid_partition_key(const std::string& key) {
    if (key.empty()) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

PartitionRuleTable::PartitionRuleTable(std::vector<PartitionRule> rules, std::string default_key)
    : default_key_(std::move(default_key))
{
    if (!valid_partition_key(default_key_)) {
        throw std::invalid_argument("invalid default partition key: '" + default_key_ + "'");
    }
    rules_.reserve(rules.size());
    for (auto& rule : rules) {
        if (rule.keyword.empty()) {
            throw std::invalid_argument("partition rule with empty keyword");
        }
        if (!valid_partition_key(rule.key)) {
            throw std::invalid_argument("invalid partition key: '" + rule.key + "'");
        }
        rules_.push_back({to_lower(rule.keyword), std::move(rule.key)});
    }
}

PartitionRuleTable PartitionRuleTable::from_config(const PartitionConfig& config) {
    std::vector<PartitionRule> rules;
    rules.reserve(config.rules.size());
    for (const auto& r : config.rules) {
        rules.push_back({r.keyword, r.key});
    }
    return PartitionRuleTable(std::move(rules), config.default_key);
}

PartitionRuleTable PartitionRuleTable::defaults() {
    return from_config(PartitionConfig{});
}

const std::string& PartitionRuleTable::classify(const std::string& label) const {
    std::string lower = to_lower(label);
    for (const auto& rule : rules_) {
        if (lower.find(rule.keyword) != std::string::npos) {
            return rule.key;
        }
    }
    return default_key_;
}

std::vector<std::string> PartitionRuleTable::keys() const {
    std::vector<std::string> out;
    auto add = [&out](const std::string& k) {
        if (std::find(out.begin(), out.end(), k) == out.end()) out.push_back(k);
    };
    for (const auto& rule : rules_) add(rule.key);
    // Default goes last even if a rule also names it
    out.erase(std::remove(out.begin(), out.end(), default_key_), out.end());
    out.push_back(default_key_);
    return out;
}

} // namespace lookbook
