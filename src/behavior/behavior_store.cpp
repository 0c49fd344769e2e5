#include "behavior_store.hpp"
#include "../util.hpp"
#include <algorithm>

namespace lookbook {

std::string behavior_type_to_string(BehaviorType type) {
    switch (type) {
        case BehaviorType::Search: return "search";
        case BehaviorType::Click:  return "click";
    }
    return "search";
}

std::optional<BehaviorType> behavior_type_from_string(const std::string& s) {
    if (s == "search") return BehaviorType::Search;
    if (s == "click")  return BehaviorType::Click;
    return std::nullopt;
}

bool newer_first(const BehaviorEvent& a, const BehaviorEvent& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.id > b.id;
}

int64_t BehaviorStore::add(const std::string& user, BehaviorType type,
                           const std::string& value) {
    return add(user, type, value, epoch_seconds());
}

std::vector<BehaviorEvent> BehaviorStore::get_recent_mixed(const std::string& user,
                                                           uint32_t limit) {
    if (limit == 0) return {};
    auto events = recent(user, BehaviorType::Search, limit * 2);
    auto clicks = recent(user, BehaviorType::Click, limit * 2);
    events.insert(events.end(), clicks.begin(), clicks.end());
    std::sort(events.begin(), events.end(), newer_first);
    if (events.size() > limit) events.resize(limit);
    return events;
}

} // namespace lookbook
