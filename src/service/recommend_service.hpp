#pragma once
#include "index_manager.hpp"
#include "../behavior/behavior_store.hpp"
#include "../recommend/interest_vector.hpp"
#include "../recommend/quota_planner.hpp"
#include "../recommend/session_cache.hpp"
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace lookbook {

enum class ItemSource { Personalized, Fallback };

std::string item_source_to_string(ItemSource source);

struct RecommendedItem {
    std::string id;
    std::string caption;
    float score = 0.0f;
    ItemSource source = ItemSource::Fallback;
};

struct Recommendation {
    std::vector<RecommendedItem> items;
    std::string reason;
    bool personalized = false;
};

class RecommendService {
public:
    RecommendService(uint32_t target_count, InterestVectorBuilder& interest,
                     const QuotaPlanner& planner, const IndexManager& indexes,
                     const Catalog& catalog, BehaviorStore& behavior,
                     SessionCache& results, uint32_t seed = std::random_device{}());

    // Falls back to a random catalog sample without a user, without
    // behavior, or when no interest vector can be built. Personalized lists
    // are filled up to the target with random items. The shown ids are
    // recorded for the user.
    Recommendation recommend(const std::optional<std::string>& user);

private:
    std::vector<RecommendedItem> random_items(size_t n, const std::vector<std::string>& exclude);
    Recommendation fallback(const std::optional<std::string>& user, std::string reason);
    std::string reason_for(const std::string& user);
    void remember(const std::optional<std::string>& user, const Recommendation& rec);

    uint32_t target_count_;
    InterestVectorBuilder& interest_;
    const QuotaPlanner& planner_;
    const IndexManager& indexes_;
    const Catalog& catalog_;
    BehaviorStore& behavior_;
    SessionCache& results_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

} // namespace lookbook
