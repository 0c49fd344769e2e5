#pragma once
#include "behavior_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare
struct sqlite3_stmt;

namespace lookbook {

class SqliteBehaviorStore : public BehaviorStore {
public:
    // Throws std::runtime_error when the database cannot be opened.
    // max_per_type == 0 keeps every event.
    SqliteBehaviorStore(const std::string& path, uint32_t max_per_type);
    ~SqliteBehaviorStore() override;

    // Non-copyable
    SqliteBehaviorStore(const SqliteBehaviorStore&) = delete;
    SqliteBehaviorStore& operator=(const SqliteBehaviorStore&) = delete;

    using BehaviorStore::add;
    int64_t add(const std::string& user, BehaviorType type,
                const std::string& value, uint64_t timestamp) override;

    std::vector<BehaviorEvent> recent(const std::string& user, BehaviorType type,
                                      uint32_t limit) override;

    std::vector<BehaviorEvent> history(const std::string& user, uint32_t limit) override;

    uint32_t count(const std::string& user, std::optional<BehaviorType> type) override;

    uint32_t delete_all(const std::string& user) override;

private:
    void init_schema();
    void trim_history(const std::string& user, BehaviorType type);
    std::vector<BehaviorEvent> collect(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    std::string path_;
    uint32_t max_per_type_;
    mutable std::mutex mutex_;
};

} // namespace lookbook
