#include "sqlite_behavior_store.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace lookbook {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

constexpr const char* kColumns = "id, user_id, type, value, timestamp";

} // namespace

SqliteBehaviorStore::SqliteBehaviorStore(const std::string& path, uint32_t max_per_type)
    : path_(path), max_per_type_(max_per_type)
{
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteBehaviorStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteBehaviorStore::~SqliteBehaviorStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteBehaviorStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS behavior_events ("
        "  id        INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  user_id   TEXT NOT NULL,"
        "  type      TEXT NOT NULL,"
        "  value     TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteBehaviorStore: failed to create schema: " + msg);
    }

    sqlite3_exec(db_,
        "CREATE INDEX IF NOT EXISTS behavior_user_type "
        "ON behavior_events(user_id, type, timestamp);",
        nullptr, nullptr, nullptr);
}

std::vector<BehaviorEvent> SqliteBehaviorStore::collect(sqlite3_stmt* stmt) {
    std::vector<BehaviorEvent> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        BehaviorEvent ev;
        ev.id = sqlite3_column_int64(stmt, 0);
        if (auto* v = sqlite3_column_text(stmt, 1)) ev.user_id = reinterpret_cast<const char*>(v);
        if (auto* v = sqlite3_column_text(stmt, 2)) {
            ev.type = behavior_type_from_string(reinterpret_cast<const char*>(v))
                          .value_or(BehaviorType::Search);
        }
        if (auto* v = sqlite3_column_text(stmt, 3)) ev.value = reinterpret_cast<const char*>(v);
        ev.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        out.push_back(std::move(ev));
    }
    return out;
}

int64_t SqliteBehaviorStore::add(const std::string& user, BehaviorType type,
                                 const std::string& value, uint64_t timestamp) {
    std::string cleaned = trim(value);
    if (cleaned.empty() || user.empty()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "INSERT INTO behavior_events (user_id, type, value, timestamp) VALUES (?, ?, ?, ?);";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[behavior] Insert failed: " << sqlite3_errmsg(db_) << "\n";
        return 0;
    }
    std::string type_str = behavior_type_to_string(type);
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, type_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, cleaned.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(timestamp));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[behavior] Insert failed: " << sqlite3_errmsg(db_) << "\n";
        return 0;
    }
    int64_t id = sqlite3_last_insert_rowid(db_);

    if (max_per_type_ > 0) trim_history(user, type);
    return id;
}

void SqliteBehaviorStore::trim_history(const std::string& user, BehaviorType type) {
    // Keep the newest max_per_type_ rows of this (user, type)
    const char* sql =
        "DELETE FROM behavior_events WHERE user_id = ?1 AND type = ?2 AND id NOT IN ("
        "  SELECT id FROM behavior_events WHERE user_id = ?1 AND type = ?2"
        "  ORDER BY timestamp DESC, id DESC LIMIT ?3);";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return;
    std::string type_str = behavior_type_to_string(type);
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, type_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(max_per_type_));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[behavior] Trim failed: " << sqlite3_errmsg(db_) << "\n";
    }
}

std::vector<BehaviorEvent> SqliteBehaviorStore::recent(const std::string& user,
                                                       BehaviorType type, uint32_t limit) {
    if (limit == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM behavior_events WHERE user_id = ? AND type = ?"
        " ORDER BY timestamp DESC, id DESC LIMIT ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    std::string type_str = behavior_type_to_string(type);
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, type_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(limit));
    return collect(g.stmt);
}

std::vector<BehaviorEvent> SqliteBehaviorStore::history(const std::string& user,
                                                        uint32_t limit) {
    if (limit == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kColumns +
        " FROM behavior_events WHERE user_id = ?"
        " ORDER BY timestamp DESC, id DESC LIMIT ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(limit));
    return collect(g.stmt);
}

uint32_t SqliteBehaviorStore::count(const std::string& user, std::optional<BehaviorType> type) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT COUNT(*) FROM behavior_events WHERE user_id = ?";
    if (type) sql += " AND type = ?";
    sql += ";";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    std::string type_str;
    if (type) {
        type_str = behavior_type_to_string(*type);
        sqlite3_bind_text(g.stmt, 2, type_str.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

uint32_t SqliteBehaviorStore::delete_all(const std::string& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM behavior_events WHERE user_id = ?;",
                           -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_text(g.stmt, 1, user.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[behavior] Delete failed: " << sqlite3_errmsg(db_) << "\n";
        return 0;
    }
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

} // namespace lookbook
