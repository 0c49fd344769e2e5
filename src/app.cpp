#include "app.hpp"
#include "util.hpp"
#include <stdexcept>

namespace lookbook {

namespace {

std::unique_ptr<EmbeddingProvider> require_embedder(const Config& config, HttpClient& http) {
    auto embedder = create_embedder(config, http);
    if (!embedder) {
        throw std::runtime_error("unknown embedding provider: " + config.embedder.provider);
    }
    return embedder;
}

} // namespace

App::App(Config cfg)
    : config(std::move(cfg))
    , embedder(require_embedder(config, http))
    , catalog(Catalog::scan(expand_home(config.catalog.image_dir),
                            expand_home(config.catalog.captions_csv)))
    , behavior(config.db_path(), config.behavior.max_history_per_type)
    , indexes(config.index_dir(), PartitionRuleTable::from_config(config.partitions),
              *embedder, catalog)
    , search_results(config.session_cache)
    , recommendations(config.session_cache)
    , planner(QuotaPlanner::from_config(config.recommend))
    , interest(*embedder, behavior, config.recommend.recent_behavior_count)
    , search(*embedder, indexes, catalog, behavior, search_results)
    , recommend(config.recommend.target_count, interest, planner, indexes, catalog,
                behavior, recommendations)
    , tracker(behavior, catalog, search_results, recommendations)
{}

} // namespace lookbook
