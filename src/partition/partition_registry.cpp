#include "partition_registry.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace lookbook {

namespace {

const std::string kFilePrefix = "partition_";
const std::string kFileSuffix = ".idx";

// "partition_<key>.idx" -> key, empty when the name does not match
std::string key_from_file_name(const std::string& name) {
    if (name.size() <= kFilePrefix.size() + kFileSuffix.size()) return {};
    if (name.compare(0, kFilePrefix.size(), kFilePrefix) != 0) return {};
    if (name.compare(name.size() - kFileSuffix.size(), kFileSuffix.size(), kFileSuffix) != 0) {
        return {};
    }
    return name.substr(kFilePrefix.size(),
                       name.size() - kFilePrefix.size() - kFileSuffix.size());
}

} // namespace

PartitionRegistry::PartitionRegistry(PartitionRuleTable rules)
    : rules_(std::move(rules))
    , current_(std::make_shared<const PartitionMap>())
{}

std::string PartitionRegistry::file_name(const std::string& key) {
    return kFilePrefix + key + kFileSuffix;
}

PartitionMap PartitionRegistry::build_all(const std::vector<LabeledItem>& items) const {
    std::map<std::string, std::vector<IndexedItem>> groups;
    for (const auto& item : items) {
        groups[rules_.classify(item.label)].push_back({item.id, item.vector});
    }

    PartitionMap out;
    for (const auto& [key, members] : groups) {
        if (members.empty()) continue;
        out[key] = std::make_shared<const SimilarityIndex>(SimilarityIndex::build(members));
        std::cerr << "[partition] Built " << key << " with " << members.size() << " items\n";
    }
    return out;
}

size_t PartitionRegistry::build(const std::vector<LabeledItem>& items) {
    auto built = build_all(items);
    size_t count = built.size();
    publish(std::move(built));
    return count;
}

void PartitionRegistry::save_all(const std::string& dir) const {
    save_map(*snapshot(), dir);
}

void PartitionRegistry::save_map(const PartitionMap& partitions, const std::string& dir) {
    std::filesystem::create_directories(dir);
    for (const auto& [key, index] : partitions) {
        index->save((std::filesystem::path(dir) / file_name(key)).string());
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::string key = key_from_file_name(entry.path().filename().string());
        if (key.empty() || partitions.count(key)) continue;
        std::filesystem::remove(entry.path(), ec);
        std::cerr << "[partition] Removed stale " << entry.path().filename().string() << "\n";
    }
}

size_t PartitionRegistry::load_all(const std::string& dir) {
    PartitionMap loaded;
    std::error_code ec;

    if (std::filesystem::is_directory(dir, ec)) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file()) continue;
            if (key_from_file_name(entry.path().filename().string()).empty()) continue;
            files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());

        for (const auto& path : files) {
            std::string name = path.filename().string();
            std::string key = key_from_file_name(name);
            try {
                loaded[key] = std::make_shared<const SimilarityIndex>(
                    SimilarityIndex::load(path.string()));
            } catch (const std::exception& e) {
                std::cerr << "[partition] Skipping " << name << ": " << e.what() << "\n";
            }
        }
    }

    size_t count = loaded.size();
    publish(std::move(loaded));
    return count;
}

void PartitionRegistry::publish(PartitionMap partitions) {
    auto next = std::make_shared<const PartitionMap>(std::move(partitions));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

std::shared_ptr<const PartitionMap> PartitionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<SearchHit> PartitionRegistry::search(const std::string& key,
                                                 const Embedding& query, int64_t k) const {
    auto parts = snapshot();
    auto it = parts->find(key);
    if (it == parts->end()) return {};
    return it->second->search(query, k);
}

std::vector<std::string> PartitionRegistry::keys() const {
    auto parts = snapshot();
    std::vector<std::string> out;
    out.reserve(parts->size());
    for (const auto& entry : *parts) {
        out.push_back(entry.first);
    }
    return out;
}

size_t PartitionRegistry::partition_size(const std::string& key) const {
    auto parts = snapshot();
    auto it = parts->find(key);
    return it == parts->end() ? 0 : it->second->size();
}

} // namespace lookbook
