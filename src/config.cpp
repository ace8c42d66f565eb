#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace kairos {

nlohmann::json Config::defaults_json() {
    const ScoringWeights w;
    return {
        {"scoring", {
            {"alpha", w.alpha},
            {"beta", w.beta},
            {"gamma", w.gamma},
            {"delta", w.delta},
            {"epsilon", w.epsilon}
        }},
        {"store", {
            {"backend", "json"},
            {"path", ""},
            {"auto_save", true},
            {"max_conversations", 100},
            {"max_emotional_states", 50},
            {"idle_evict_seconds", 3600}
        }},
        {"context", {
            {"max_items", 5},
            {"candidate_limit", 50},
            {"max_life_events", 3},
            {"trend_window", 5},
            {"trend_min_states", 3}
        }},
        {"embeddings", {
            {"provider", ""},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
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

static void read_uint(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_unsigned())
        out = obj[name].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string())
        out = obj[name].get<std::string>();
}

static void read_weight(const nlohmann::json& obj, const char* name, double& out) {
    if (!obj.contains(name)) return;
    if (obj[name].is_number()) {
        out = obj[name].get<double>();
    } else {
        // Non-numeric values are rejected by validate_weights below
        out = -1.0;
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("scoring") && j["scoring"].is_object()) {
        auto& s = j["scoring"];
        read_weight(s, "alpha", cfg.scoring.alpha);
        read_weight(s, "beta", cfg.scoring.beta);
        read_weight(s, "gamma", cfg.scoring.gamma);
        read_weight(s, "delta", cfg.scoring.delta);
        read_weight(s, "epsilon", cfg.scoring.epsilon);
    }
    cfg.scoring = validate_weights(cfg.scoring);

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", cfg.store.backend);
        read_string(s, "path", cfg.store.path);
        if (s.contains("auto_save") && s["auto_save"].is_boolean())
            cfg.store.auto_save = s["auto_save"].get<bool>();
        read_uint(s, "max_conversations", cfg.store.max_conversations);
        read_uint(s, "max_emotional_states", cfg.store.max_emotional_states);
        read_uint(s, "idle_evict_seconds", cfg.store.idle_evict_seconds);
    }

    if (j.contains("context") && j["context"].is_object()) {
        auto& c = j["context"];
        read_uint(c, "max_items", cfg.context.max_items);
        read_uint(c, "candidate_limit", cfg.context.candidate_limit);
        read_uint(c, "max_life_events", cfg.context.max_life_events);
        read_uint(c, "trend_window", cfg.context.trend_window);
        read_uint(c, "trend_min_states", cfg.context.trend_min_states);
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "model", cfg.embeddings.model);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.kairos/config.json");
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
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.embeddings.api_key = v;
    if (const char* v = std::getenv("KAIROS_EMBEDDINGS_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("KAIROS_STORE_PATH"))
        cfg.store.path = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }

    return cfg;
}

} // namespace kairos
