#include "config.hpp"
#include "embedder.hpp"
#include "engine.hpp"
#include "http.hpp"
#include "util.hpp"
#include "memory/snapshot_store.hpp"
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: kairos <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  record OWNER USER_MSG ASSISTANT_MSG   Store a conversation turn\n"
              << "  context OWNER QUERY [MAX]             Print the assembled context\n"
              << "  fact OWNER TEXT                       Store a fact\n"
              << "  pref OWNER KEY VALUE                  Store or update a preference\n"
              << "  list OWNER KIND                       List memories of one kind\n"
              << "  search OWNER TEXT [KIND...]           Keyword search, most relevant first\n"
              << "  forget OWNER ID                       Delete one memory\n"
              << "  stats OWNER [QUERY]                   Counts per kind; with QUERY also\n"
              << "                                        score distribution and emotions\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Kinds: conversation, fact, preference, life_event, emotional_state,\n"
              << "       topic_pattern, long_term, relationship, goal, interest\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY              API key for OpenAI embeddings\n"
              << "  KAIROS_EMBEDDINGS_PROVIDER  openai, ollama or none\n"
              << "  KAIROS_STORE_PATH           Snapshot directory or database file\n"
              << "  OLLAMA_BASE_URL             Base URL for Ollama (default: http://localhost:11434)\n";
}

static void print_memory(const kairos::Memory& m) {
    std::cout << m.id << "  " << kairos::format_utc(m.created_at)
              << "  access=" << m.access_count
              << "  salience=" << std::fixed << std::setprecision(2) << m.salience << "  ";
    switch (m.kind) {
        case kairos::MemoryKind::Preference:
        case kairos::MemoryKind::Relationship:
            std::cout << m.key << ": " << m.value;
            break;
        case kairos::MemoryKind::EmotionalState:
            std::cout << m.emotion << " (" << kairos::level_to_string(m.level) << ")";
            break;
        case kairos::MemoryKind::TopicPattern:
            std::cout << kairos::join(m.topics, ",") << " / " << m.emotion
                      << " x" << m.frequency;
            break;
        case kairos::MemoryKind::LifeEvent:
            std::cout << "[" << m.category << "] " << m.content;
            break;
        case kairos::MemoryKind::Goal:
            std::cout << "[" << m.status << "] " << m.content;
            break;
        default:
            std::cout << m.content;
            break;
    }
    std::cout << "\n";
}

static bool need_args(const std::vector<std::string>& args, size_t n) {
    if (args.size() >= n) return true;
    std::cerr << "Missing arguments for '" << args[0] << "'\n";
    print_usage();
    return false;
}

static int run_command(kairos::MemoryEngine& engine, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "record") {
        if (!need_args(args, 4)) return 1;
        auto rec = engine.record_turn(args[1], args[2], args[3]);
        if (rec.conversation_id.empty()) {
            std::cerr << "Nothing to record: both messages are empty\n";
            return 1;
        }
        std::cout << "conversation: " << rec.conversation_id << "\n";
        if (!rec.emotional_state_id.empty())
            std::cout << "emotional state: " << rec.emotional_state_id << "\n";
        if (!rec.life_event_id.empty())
            std::cout << "life event: " << rec.life_event_id << "\n";
        if (!rec.topic_pattern_id.empty())
            std::cout << "topic pattern: " << rec.topic_pattern_id
                      << " (" << kairos::join(rec.topics, ", ") << ")\n";
        return 0;
    }

    if (cmd == "context") {
        if (!need_args(args, 3)) return 1;
        size_t max_items = engine.config().context.max_items;
        if (args.size() > 3) max_items = std::strtoul(args[3].c_str(), nullptr, 10);
        for (const auto& entry : engine.build_context(args[1], args[2], max_items)) {
            std::cout << "- " << entry.text << "\n";
        }
        return 0;
    }

    if (cmd == "fact") {
        if (!need_args(args, 3)) return 1;
        std::cout << engine.add_fact(args[1], args[2]) << "\n";
        return 0;
    }

    if (cmd == "pref") {
        if (!need_args(args, 4)) return 1;
        std::cout << engine.add_preference(args[1], args[2], args[3]) << "\n";
        return 0;
    }

    if (cmd == "list") {
        if (!need_args(args, 3)) return 1;
        auto kind = kairos::kind_from_string(args[2]);
        if (!kind) {
            std::cerr << "Unknown kind: " << args[2] << "\n";
            return 1;
        }
        for (const auto& m : engine.get_memories_by_kind(args[1], *kind)) {
            print_memory(m);
        }
        return 0;
    }

    if (cmd == "search") {
        if (!need_args(args, 3)) return 1;
        kairos::RecallQuery query;
        query.text = args[2];
        for (size_t i = 3; i < args.size(); i++) {
            auto kind = kairos::kind_from_string(args[i]);
            if (!kind) {
                std::cerr << "Unknown kind: " << args[i] << "\n";
                return 1;
            }
            query.kinds.push_back(*kind);
        }
        for (const auto& match : engine.query_memories(args[1], query)) {
            std::cout << "[" << match.relevance << "] ";
            print_memory(match.memory);
        }
        return 0;
    }

    if (cmd == "forget") {
        if (!need_args(args, 3)) return 1;
        if (!engine.delete_memory(args[1], args[2])) {
            std::cerr << "No memory " << args[2] << " for " << args[1] << "\n";
            return 1;
        }
        std::cout << "Deleted " << args[2] << "\n";
        return 0;
    }

    if (cmd == "stats") {
        if (!need_args(args, 2)) return 1;
        auto counts = engine.memory_stats(args[1]);
        std::cout << "memories: " << counts.total << "\n";
        for (const auto& [kind, n] : counts.by_kind) {
            if (n > 0) std::cout << "  " << kind << ": " << n << "\n";
        }
        if (counts.total > 0) {
            std::cout << "span: " << kairos::format_utc(counts.oldest_at) << " .. "
                      << kairos::format_utc(counts.newest_at) << "\n";
        }
        if (args.size() < 3) return 0;

        auto stats = engine.scoring_stats(args[1], engine.embed_query(args[2]));
        std::cout << std::fixed << std::setprecision(3)
                  << "scored: " << stats.count << "\n"
                  << "mean: " << stats.mean << "  median: " << stats.median
                  << "  min: " << stats.min << "  max: " << stats.max << "\n"
                  << "high: " << stats.distribution.high
                  << "  medium: " << stats.distribution.medium
                  << "  low: " << stats.distribution.low << "\n"
                  << "top: " << kairos::join(stats.top_ids, ", ") << "\n";

        auto emotions = engine.emotional_stats(args[1]);
        std::cout << "emotional states: " << emotions.total
                  << "  dominant: " << emotions.dominant << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
        args.emplace_back(argv[i]);
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }

    kairos::http_init();
    auto config = kairos::Config::load();

    kairos::CurlHttpClient http_client;
    auto embedder = kairos::create_embedder(config, http_client);
    int rc = 0;
    {
        kairos::MemoryEngine engine(config, kairos::create_snapshot_store(config),
                                    embedder.get());
        rc = run_command(engine, args);
    }

    kairos::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
