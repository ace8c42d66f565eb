#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace kairos;

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.scoring.alpha == 0.6);
    REQUIRE(cfg.scoring.beta == 0.2);
    REQUIRE(cfg.scoring.gamma == 0.15);
    REQUIRE(cfg.scoring.delta == 0.05);
    REQUIRE(cfg.scoring.epsilon == 0.1);
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.store.auto_save);
    REQUIRE(cfg.store.max_conversations == 100);
    REQUIRE(cfg.store.max_emotional_states == 50);
    REQUIRE(cfg.context.max_items == 5);
    REQUIRE(cfg.context.candidate_limit == 50);
    REQUIRE(cfg.embeddings.provider.empty());
}

TEST_CASE("Config::from_json: defaults document matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.scoring.alpha == plain.scoring.alpha);
    REQUIRE(cfg.scoring.epsilon == plain.scoring.epsilon);
    REQUIRE(cfg.store.backend == plain.store.backend);
    REQUIRE(cfg.store.idle_evict_seconds == plain.store.idle_evict_seconds);
    REQUIRE(cfg.context.trend_window == plain.context.trend_window);
    REQUIRE(cfg.context.trend_min_states == plain.context.trend_min_states);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "scoring": { "alpha": 0.5, "beta": 0.3 },
        "store": { "backend": "sqlite", "path": "/tmp/x.db", "auto_save": false,
                   "max_conversations": 20, "idle_evict_seconds": 0 },
        "context": { "max_items": 8, "max_life_events": 1 },
        "embeddings": { "provider": "ollama", "model": "all-minilm" }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.scoring.alpha == 0.5);
    REQUIRE(cfg.scoring.beta == 0.3);
    REQUIRE(cfg.scoring.gamma == 0.15);
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.store.path == "/tmp/x.db");
    REQUIRE_FALSE(cfg.store.auto_save);
    REQUIRE(cfg.store.max_conversations == 20);
    REQUIRE(cfg.store.max_emotional_states == 50);
    REQUIRE(cfg.store.idle_evict_seconds == 0);
    REQUIRE(cfg.context.max_items == 8);
    REQUIRE(cfg.context.max_life_events == 1);
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.model == "all-minilm");
}

TEST_CASE("Config::from_json: invalid weights are replaced by defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "scoring": { "alpha": 2.5, "beta": -1, "gamma": "high", "delta": 0.5 }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.scoring.alpha == 0.6);
    REQUIRE(cfg.scoring.beta == 0.2);
    REQUIRE(cfg.scoring.gamma == 0.15);
    REQUIRE(cfg.scoring.delta == 0.5);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "store": { "backend": 5, "max_conversations": -3, "auto_save": "yes" },
        "context": "not an object"
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.store.max_conversations == 100);
    REQUIRE(cfg.store.auto_save);
    REQUIRE(cfg.context.max_items == 5);
}

TEST_CASE("merge_defaults: fills missing keys recursively", "[config]") {
    nlohmann::json existing = {{"store", {{"backend", "sqlite"}}}};
    auto merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["store"]["backend"] == "sqlite");
    REQUIRE(merged["store"]["max_conversations"] == 100);
    REQUIRE(merged.contains("scoring"));
    REQUIRE(merged.contains("embeddings"));
}

// ── Config::load ─────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "kairos_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("OPENAI_API_KEY");
        unsetenv("KAIROS_EMBEDDINGS_PROVIDER");
        unsetenv("KAIROS_STORE_PATH");
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.kairos/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.kairos");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string((std::istreambuf_iterator<char>(f)),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "scoring": { "alpha": 0.4 },
        "store": { "backend": "none" },
        "embeddings": { "provider": "openai", "api_key": "sk-file" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.scoring.alpha == 0.4);
    REQUIRE(cfg.store.backend == "none");
    REQUIRE(cfg.embeddings.provider == "openai");
    REQUIRE(cfg.embeddings.api_key == "sk-file");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"embeddings": {"provider": "openai", "api_key": "from-file"}})");
    setenv("OPENAI_API_KEY", "from-env", 1);
    setenv("KAIROS_STORE_PATH", "/tmp/elsewhere", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.api_key == "from-env");
    REQUIRE(cfg.store.path == "/tmp/elsewhere");

    unsetenv("OPENAI_API_KEY");
    unsetenv("KAIROS_STORE_PATH");
}

TEST_CASE("Config::load: OLLAMA_BASE_URL applies only to ollama", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("OLLAMA_BASE_URL", "http://gpu-box:11434", 1);
    Config plain = Config::load();
    REQUIRE(plain.embeddings.base_url.empty());

    setenv("KAIROS_EMBEDDINGS_PROVIDER", "ollama", 1);
    Config ollama = Config::load();
    REQUIRE(ollama.embeddings.provider == "ollama");
    REQUIRE(ollama.embeddings.base_url == "http://gpu-box:11434");

    unsetenv("OLLAMA_BASE_URL");
    unsetenv("KAIROS_EMBEDDINGS_PROVIDER");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.scoring.alpha == 0.6);
    // The broken file is left for the user to fix
    REQUIRE(g.read_config() == "not valid json {{{");
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(std::filesystem::exists(g.config_path()));

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j.contains("scoring"));
    REQUIRE(j["scoring"]["alpha"] == 0.6);
    REQUIRE(j["store"]["backend"] == "json");
    REQUIRE(j["context"]["max_items"] == 5);
    REQUIRE(j["embeddings"]["provider"] == "");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"store": {"backend": "sqlite"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "sqlite");

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["store"]["backend"] == "sqlite");
    REQUIRE(j["store"]["max_conversations"] == 100);
    REQUIRE(j.contains("scoring"));
    REQUIRE(j.contains("context"));
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["store"]["backend"] = "none";
    full["context"]["max_items"] = 9;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.store.backend == "none");
    REQUIRE(cfg.context.max_items == 9);
    REQUIRE(g.read_config() == before);
}
