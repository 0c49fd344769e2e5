#include "behavior_tracker.hpp"
#include "../util.hpp"
#include <iostream>

namespace lookbook {

namespace {

constexpr size_t kMaxCaptionDisplay = 50;

} // namespace

BehaviorTracker::BehaviorTracker(BehaviorStore& behavior, const Catalog& catalog,
                                 const SessionCache& search_results,
                                 const SessionCache& recommendations)
    : behavior_(behavior)
    , catalog_(catalog)
    , search_results_(search_results)
    , recommendations_(recommendations)
{}

std::optional<std::string> BehaviorTracker::track_click(const SessionCache& cache,
                                                        const std::string& user,
                                                        int64_t index) {
    auto id = cache.resolve(user, index);
    if (!id) return std::nullopt;
    behavior_.add(user, BehaviorType::Click, *id);
    std::cerr << "[behavior] " << user << " clicked " << base_name(*id) << "\n";
    return id;
}

std::optional<std::string> BehaviorTracker::track_search_click(const std::string& user,
                                                               int64_t index) {
    return track_click(search_results_, user, index);
}

std::optional<std::string> BehaviorTracker::track_recommend_click(const std::string& user,
                                                                  int64_t index) {
    return track_click(recommendations_, user, index);
}

std::vector<std::string> BehaviorTracker::activity_history(const std::string& user,
                                                           uint32_t limit) {
    std::vector<std::string> lines;
    for (const auto& ev : behavior_.history(user, limit)) {
        std::string line = "[" + format_timestamp(ev.timestamp) + "] ";
        if (ev.type == BehaviorType::Search) {
            line += "search: \"" + ev.value + "\"";
        } else {
            std::string caption = catalog_.caption_for(ev.value);
            if (caption.empty()) caption = base_name(ev.value);
            if (caption.size() > kMaxCaptionDisplay) {
                caption = caption.substr(0, kMaxCaptionDisplay) + "...";
            }
            line += "click: \"" + caption + "\"";
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

uint32_t BehaviorTracker::clear_history(const std::string& user) {
    return behavior_.delete_all(user);
}

} // namespace lookbook
