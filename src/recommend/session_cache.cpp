#include "session_cache.hpp"
#include "../config.hpp"
#include <algorithm>
#include <functional>

namespace lookbook {

SessionCache::SessionCache(uint32_t max_entries, uint32_t shards) {
    size_t count = std::max<uint32_t>(shards, 1);
    size_t limit = std::max<uint32_t>(max_entries, 1);
    per_shard_limit_ = std::max<size_t>((limit + count - 1) / count, 1);
    shards_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

SessionCache::SessionCache(const SessionCacheConfig& config)
    : SessionCache(config.max_entries, config.shards) {}

SessionCache::Shard& SessionCache::shard_for(const std::string& user) const {
    return *shards_[std::hash<std::string>{}(user) % shards_.size()];
}

void SessionCache::record(const std::string& user, std::vector<std::string> ids) {
    auto& shard = shard_for(user);
    uint64_t now = ++tick_;
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(user);
    if (it == shard.entries.end() && shard.entries.size() >= per_shard_limit_) {
        auto oldest = std::min_element(
            shard.entries.begin(), shard.entries.end(),
            [](const auto& a, const auto& b) { return a.second.written < b.second.written; });
        shard.entries.erase(oldest);
    }
    shard.entries[user] = Entry{std::move(ids), now};
}

std::optional<std::string> SessionCache::resolve(const std::string& user, int64_t index) const {
    if (index < 0) return std::nullopt;
    auto& shard = shard_for(user);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(user);
    if (it == shard.entries.end()) return std::nullopt;
    const auto& ids = it->second.ids;
    if (static_cast<uint64_t>(index) >= ids.size()) return std::nullopt;
    return ids[static_cast<size_t>(index)];
}

std::optional<std::vector<std::string>> SessionCache::get(const std::string& user) const {
    auto& shard = shard_for(user);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(user);
    if (it == shard.entries.end()) return std::nullopt;
    return it->second.ids;
}

bool SessionCache::erase(const std::string& user) {
    auto& shard = shard_for(user);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.erase(user) > 0;
}

size_t SessionCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

} // namespace lookbook
