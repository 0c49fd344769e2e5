#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lookbook {

struct SessionCacheConfig;

// Per-user most recent result list. Keys are spread over independently
// locked shards; a full shard evicts its oldest-written entry.
class SessionCache {
public:
    SessionCache(uint32_t max_entries, uint32_t shards);
    explicit SessionCache(const SessionCacheConfig& config);

    // Overwrites any previous list for the user
    void record(const std::string& user, std::vector<std::string> ids);

    // nullopt on unknown user or an index outside the recorded list
    std::optional<std::string> resolve(const std::string& user, int64_t index) const;

    std::optional<std::vector<std::string>> get(const std::string& user) const;
    bool erase(const std::string& user);
    size_t size() const;

private:
    struct Entry {
        std::vector<std::string> ids;
        uint64_t written = 0;
    };

    struct Shard {
        std::unordered_map<std::string, Entry> entries;
        mutable std::mutex mutex;
    };

    Shard& shard_for(const std::string& user) const;

    size_t per_shard_limit_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> tick_{0};
};

} // namespace lookbook
