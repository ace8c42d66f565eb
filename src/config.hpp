#pragma once
#include "scoring.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace kairos {

struct StoreConfig {
    std::string backend = "json";       // json | sqlite | none
    std::string path;                   // empty = backend default under ~/.kairos
    bool auto_save = true;              // persist after every write
    uint32_t max_conversations = 100;
    uint32_t max_emotional_states = 50;
    uint32_t idle_evict_seconds = 3600; // 0 = never unload idle owners
};

struct ContextConfig {
    uint32_t max_items = 5;         // Conversation entries per context
    uint32_t candidate_limit = 50;  // VectorIndex candidates before re-ranking
    uint32_t max_life_events = 3;
    uint32_t trend_window = 5;      // most recent EmotionalStates considered
    uint32_t trend_min_states = 3;  // states required before a trend is emitted
};

struct EmbeddingConfig {
    std::string provider; // "openai", "ollama", or empty (auto-detect / disabled)
    std::string api_key;
    std::string base_url;
    std::string model;
};

struct Config {
    ScoringWeights scoring;
    StoreConfig store;
    ContextConfig context;
    EmbeddingConfig embeddings;

    // Load from ~/.kairos/config.json + env vars
    static Config load();

    // Parse an already-merged JSON document. Scoring weights are validated.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();
};

// Fill keys missing from `existing` with the values in `defaults`, recursively.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace kairos
