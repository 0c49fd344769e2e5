#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lookbook {

enum class BehaviorType { Search, Click };

std::string behavior_type_to_string(BehaviorType type);
std::optional<BehaviorType> behavior_type_from_string(const std::string& s);

struct BehaviorEvent {
    int64_t id = 0;        // store-wide sequence, breaks timestamp ties
    std::string user_id;
    BehaviorType type = BehaviorType::Search;
    std::string value;     // query text or clicked image path
    uint64_t timestamp = 0;
};

// Per-user append-only log of searches and clicks
class BehaviorStore {
public:
    virtual ~BehaviorStore() = default;

    // Value is trimmed; a blank value is ignored and 0 returned.
    // Otherwise returns the new event id.
    virtual int64_t add(const std::string& user, BehaviorType type,
                        const std::string& value, uint64_t timestamp) = 0;
    int64_t add(const std::string& user, BehaviorType type, const std::string& value);

    // Newest first (ties: higher id first)
    virtual std::vector<BehaviorEvent> recent(const std::string& user, BehaviorType type,
                                              uint32_t limit) = 0;

    // Both types, newest first
    virtual std::vector<BehaviorEvent> history(const std::string& user, uint32_t limit) = 0;

    virtual uint32_t count(const std::string& user, std::optional<BehaviorType> type) = 0;

    // Returns the number of events removed
    virtual uint32_t delete_all(const std::string& user) = 0;

    // recent() of each type with 2 * limit, merged newest first, cut to limit
    std::vector<BehaviorEvent> get_recent_mixed(const std::string& user, uint32_t limit);
};

// Events come out newest first; ties go to the later insert
bool newer_first(const BehaviorEvent& a, const BehaviorEvent& b);

} // namespace lookbook
