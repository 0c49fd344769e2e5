#pragma once
#include "behavior/sqlite_behavior_store.hpp"
#include "catalog/catalog.hpp"
#include "config.hpp"
#include "http.hpp"
#include "recommend/interest_vector.hpp"
#include "recommend/quota_planner.hpp"
#include "recommend/session_cache.hpp"
#include "service/behavior_tracker.hpp"
#include "service/index_manager.hpp"
#include "service/recommend_service.hpp"
#include "service/search_service.hpp"
#include <memory>

namespace lookbook {

// Every long-lived component of one process, wired from a Config.
// Members are declared in dependency order.
struct App {
    Config config;
    SocketHttpClient http;
    std::unique_ptr<EmbeddingProvider> embedder;
    Catalog catalog;
    SqliteBehaviorStore behavior;
    IndexManager indexes;
    SessionCache search_results;
    SessionCache recommendations;
    QuotaPlanner planner;
    InterestVectorBuilder interest;
    SearchService search;
    RecommendService recommend;
    BehaviorTracker tracker;

    // Throws std::runtime_error on an unknown embedder or an unusable database
    explicit App(Config cfg);

    App(const App&) = delete;
    App& operator=(const App&) = delete;
};

} // namespace lookbook
