#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace lookbook {

struct CatalogConfig {
    std::string image_dir = "images";
    std::string captions_csv = "styles.csv";
};

struct IndexConfig {
    std::string dir = "~/.lookbook/index";
};

struct EmbedderConfig {
    std::string provider = "http";
    std::string base_url = "http://localhost:8500";
    std::string model = "clip-vit-base-patch32";
    std::string api_key;
    std::string response_path = "/embeddings";
    uint32_t batch_size = 32;
    uint32_t timeout_seconds = 600;
    uint32_t dimensions = 512;  // fallback until first response
};

struct BehaviorConfig {
    std::string db_path = "~/.lookbook/behavior.db";
    uint32_t max_history_per_type = 20;
};

struct QuotaConfig {
    std::string key;
    double ratio = 0.0;
    uint32_t floor = 0;
};

struct RecommendConfig {
    uint32_t target_count = 12;
    uint32_t recent_behavior_count = 3;
    std::vector<QuotaConfig> quotas = {
        {"apparel", 0.5, 2},
        {"footwear", 0.3, 1},
        {"others", 0.2, 1},
    };
};

struct SearchConfig {
    uint32_t default_top_k = 5;
};

struct SessionCacheConfig {
    uint32_t max_entries = 10000;
    uint32_t shards = 16;
};

struct PartitionRuleConfig {
    std::string keyword;
    std::string key;
};

struct PartitionConfig {
    std::vector<PartitionRuleConfig> rules = {
        {"footwear", "footwear"},
        {"shoes", "footwear"},
        {"apparel", "apparel"},
    };
    std::string default_key = "others";
};

struct Config {
    CatalogConfig catalog;
    IndexConfig index;
    EmbedderConfig embedder;
    BehaviorConfig behavior;
    RecommendConfig recommend;
    SearchConfig search;
    SessionCacheConfig session_cache;
    PartitionConfig partitions;

    // Load from $LOOKBOOK_CONFIG or ~/.lookbook/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created
    // with defaults; a malformed one is ignored.
    static Config load_from(const std::string& path);

    // Parse an already-merged JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved on-disk locations (~ expanded)
    std::string index_dir() const;
    std::string db_path() const;
};

} // namespace lookbook
