#include "recommend_service.hpp"
#include <algorithm>
#include <iostream>

namespace lookbook {

std::string item_source_to_string(ItemSource source) {
    switch (source) {
        case ItemSource::Personalized: return "personalized";
        case ItemSource::Fallback:     return "fallback";
    }
    return "fallback";
}

RecommendService::RecommendService(uint32_t target_count, InterestVectorBuilder& interest,
                                   const QuotaPlanner& planner, const IndexManager& indexes,
                                   const Catalog& catalog, BehaviorStore& behavior,
                                   SessionCache& results, uint32_t seed)
    : target_count_(target_count)
    , interest_(interest)
    , planner_(planner)
    , indexes_(indexes)
    , catalog_(catalog)
    , behavior_(behavior)
    , results_(results)
    , rng_(seed)
{}

std::vector<RecommendedItem> RecommendService::random_items(
    size_t n, const std::vector<std::string>& exclude) {
    std::vector<std::string> sample;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        sample = catalog_.random_sample(catalog_.image_paths().size(), rng_);
    }

    std::vector<RecommendedItem> out;
    for (auto& id : sample) {
        if (out.size() >= n) break;
        if (std::find(exclude.begin(), exclude.end(), id) != exclude.end()) continue;
        std::string caption = catalog_.caption_for(id);
        out.push_back({std::move(id), std::move(caption), 0.0f, ItemSource::Fallback});
    }
    return out;
}

void RecommendService::remember(const std::optional<std::string>& user,
                                const Recommendation& rec) {
    if (!user) return;
    std::vector<std::string> ids;
    ids.reserve(rec.items.size());
    for (const auto& item : rec.items) ids.push_back(item.id);
    results_.record(*user, std::move(ids));
}

Recommendation RecommendService::fallback(const std::optional<std::string>& user,
                                          std::string reason) {
    Recommendation rec;
    rec.items = random_items(target_count_, {});
    rec.reason = std::move(reason);
    remember(user, rec);
    return rec;
}

std::string RecommendService::reason_for(const std::string& user) {
    bool searched = behavior_.count(user, BehaviorType::Search) > 0;
    bool clicked = behavior_.count(user, BehaviorType::Click) > 0;
    std::string basis;
    if (searched && clicked) {
        basis = "your searches and clicks";
    } else if (searched) {
        basis = "your searches";
    } else {
        basis = "your clicks";
    }
    return "Picked for you based on " + basis;
}

Recommendation RecommendService::recommend(const std::optional<std::string>& user) {
    if (!user) {
        return fallback(user, "Sign in to get personalized recommendations");
    }
    if (behavior_.count(*user, std::nullopt) == 0) {
        return fallback(user, "No activity yet, showing popular items");
    }

    auto query = interest_.build(*user);
    if (!query) {
        std::cerr << "[recommend] No interest vector for " << *user << "\n";
        return fallback(user, "Could not build your profile, showing popular items");
    }

    Recommendation rec;
    rec.personalized = true;
    rec.reason = reason_for(*user);

    std::vector<std::string> shown;
    for (auto& c : planner_.plan(indexes_.partitions(), *query, target_count_)) {
        shown.push_back(c.id);
        std::string caption = catalog_.caption_for(c.id);
        rec.items.push_back({std::move(c.id), std::move(caption), c.score,
                             ItemSource::Personalized});
    }

    if (rec.items.size() < target_count_) {
        auto extra = random_items(target_count_ - rec.items.size(), shown);
        rec.items.insert(rec.items.end(), extra.begin(), extra.end());
    }

    remember(user, rec);
    return rec;
}

} // namespace lookbook
