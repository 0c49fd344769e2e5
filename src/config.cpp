#include "config.hpp"
#include "util.hpp"
#include "partition/partition_rules.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace lookbook {

nlohmann::json Config::defaults_json() {
    return {
        {"catalog", {
            {"image_dir", "images"},
            {"captions_csv", "styles.csv"}
        }},
        {"index", {
            {"dir", "~/.lookbook/index"}
        }},
        {"embedder", {
            {"provider", "http"},
            {"base_url", "http://localhost:8500"},
            {"model", "clip-vit-base-patch32"},
            {"api_key", ""},
            {"response_path", "/embeddings"},
            {"batch_size", 32},
            {"timeout_seconds", 600},
            {"dimensions", 512}
        }},
        {"behavior", {
            {"db_path", "~/.lookbook/behavior.db"},
            {"max_history_per_type", 20}
        }},
        {"recommend", {
            {"target_count", 12},
            {"recent_behavior_count", 3},
            {"quotas", nlohmann::json::array({
                {{"key", "apparel"}, {"ratio", 0.5}, {"floor", 2}},
                {{"key", "footwear"}, {"ratio", 0.3}, {"floor", 1}},
                {{"key", "others"}, {"ratio", 0.2}, {"floor", 1}}
            })}
        }},
        {"search", {
            {"default_top_k", 5}
        }},
        {"session_cache", {
            {"max_entries", 10000},
            {"shards", 16}
        }},
        {"partitions", {
            {"rules", nlohmann::json::array({
                {{"keyword", "footwear"}, {"key", "footwear"}},
                {{"keyword", "shoes"}, {"key", "footwear"}},
                {{"keyword", "apparel"}, {"key", "apparel"}}
            })},
            {"default", "others"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string())
        out = obj[name].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_unsigned())
        out = obj[name].get<uint32_t>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("catalog") && j["catalog"].is_object()) {
        auto& c = j["catalog"];
        read_string(c, "image_dir", cfg.catalog.image_dir);
        read_string(c, "captions_csv", cfg.catalog.captions_csv);
    }

    if (j.contains("index") && j["index"].is_object()) {
        read_string(j["index"], "dir", cfg.index.dir);
    }

    if (j.contains("embedder") && j["embedder"].is_object()) {
        auto& e = j["embedder"];
        read_string(e, "provider", cfg.embedder.provider);
        read_string(e, "base_url", cfg.embedder.base_url);
        read_string(e, "model", cfg.embedder.model);
        read_string(e, "api_key", cfg.embedder.api_key);
        read_string(e, "response_path", cfg.embedder.response_path);
        read_uint(e, "batch_size", cfg.embedder.batch_size);
        read_uint(e, "timeout_seconds", cfg.embedder.timeout_seconds);
        read_uint(e, "dimensions", cfg.embedder.dimensions);
        if (cfg.embedder.batch_size == 0) cfg.embedder.batch_size = 1;
    }

    if (j.contains("behavior") && j["behavior"].is_object()) {
        auto& b = j["behavior"];
        read_string(b, "db_path", cfg.behavior.db_path);
        read_uint(b, "max_history_per_type", cfg.behavior.max_history_per_type);
    }

    if (j.contains("recommend") && j["recommend"].is_object()) {
        auto& r = j["recommend"];
        read_uint(r, "target_count", cfg.recommend.target_count);
        read_uint(r, "recent_behavior_count", cfg.recommend.recent_behavior_count);
        if (r.contains("quotas") && r["quotas"].is_array()) {
            std::vector<QuotaConfig> quotas;
            for (const auto& q : r["quotas"]) {
                if (!q.is_object()) continue;
                QuotaConfig entry;
                read_string(q, "key", entry.key);
                if (q.contains("ratio") && q["ratio"].is_number())
                    entry.ratio = q["ratio"].get<double>();
                read_uint(q, "floor", entry.floor);
                if (entry.key.empty() || !(entry.ratio >= 0.0 && entry.ratio <= 1.0)) {
                    std::cerr << "[config] Ignoring invalid quota entry: " << q.dump() << "\n";
                    continue;
                }
                quotas.push_back(std::move(entry));
            }
            cfg.recommend.quotas = std::move(quotas);
        }
    }

    if (j.contains("search") && j["search"].is_object()) {
        read_uint(j["search"], "default_top_k", cfg.search.default_top_k);
    }

    if (j.contains("session_cache") && j["session_cache"].is_object()) {
        auto& s = j["session_cache"];
        read_uint(s, "max_entries", cfg.session_cache.max_entries);
        read_uint(s, "shards", cfg.session_cache.shards);
    }

    if (j.contains("partitions") && j["partitions"].is_object()) {
        auto& p = j["partitions"];
        if (p.contains("rules") && p["rules"].is_array()) {
            std::vector<PartitionRuleConfig> rules;
            for (const auto& r : p["rules"]) {
                if (!r.is_object()) continue;
                PartitionRuleConfig rule;
                read_string(r, "keyword", rule.keyword);
                read_string(r, "key", rule.key);
                if (rule.keyword.empty() || !valid_partition_key(rule.key)) {
                    std::cerr << "[config] Ignoring invalid partition rule: " << r.dump() << "\n";
                    continue;
                }
                rules.push_back(std::move(rule));
            }
            cfg.partitions.rules = std::move(rules);
        }
        read_string(p, "default", cfg.partitions.default_key);
        if (!valid_partition_key(cfg.partitions.default_key)) {
            std::cerr << "[config] Ignoring invalid default partition: '"
                      << cfg.partitions.default_key << "'\n";
            cfg.partitions.default_key = "others";
        }
    }

    return cfg;
}

static void apply_env_overrides(Config& cfg) {
    // Environment variables always override config file
    if (const char* v = std::getenv("LOOKBOOK_EMBEDDER_URL"))
        cfg.embedder.base_url = v;
    if (const char* v = std::getenv("LOOKBOOK_EMBEDDER_API_KEY"))
        cfg.embedder.api_key = v;
    if (const char* v = std::getenv("LOOKBOOK_INDEX_DIR"))
        cfg.index.dir = v;
    if (const char* v = std::getenv("LOOKBOOK_DB_PATH"))
        cfg.behavior.db_path = v;
    if (const char* v = std::getenv("LOOKBOOK_IMAGE_DIR"))
        cfg.catalog.image_dir = v;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load() {
    std::string path = expand_home("~/.lookbook/config.json");
    if (const char* v = std::getenv("LOOKBOOK_CONFIG")) path = v;
    return load_from(path);
}

std::string Config::index_dir() const {
    return expand_home(index.dir);
}

std::string Config::db_path() const {
    return expand_home(behavior.db_path);
}

} // namespace lookbook
