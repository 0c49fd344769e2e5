#pragma once
#include "../behavior/behavior_store.hpp"
#include "../catalog/catalog.hpp"
#include "../recommend/session_cache.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lookbook {

// Turns clicks on previously shown result lists into click events
class BehaviorTracker {
public:
    BehaviorTracker(BehaviorStore& behavior, const Catalog& catalog,
                    const SessionCache& search_results, const SessionCache& recommendations);

    // Returns the clicked image, or nullopt when the index does not match
    // the user's last list
    std::optional<std::string> track_search_click(const std::string& user, int64_t index);
    std::optional<std::string> track_recommend_click(const std::string& user, int64_t index);

    // One line per event, newest first
    std::vector<std::string> activity_history(const std::string& user, uint32_t limit = 50);

    uint32_t clear_history(const std::string& user);

private:
    std::optional<std::string> track_click(const SessionCache& cache, const std::string& user,
                                           int64_t index);

    BehaviorStore& behavior_;
    const Catalog& catalog_;
    const SessionCache& search_results_;
    const SessionCache& recommendations_;
};

} // namespace lookbook
