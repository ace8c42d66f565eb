#include <catch2/catch_test_macros.hpp>
#include "engine.hpp"
#include "embedder.hpp"
#include "util.hpp"
#include "memory/json_snapshot_store.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

using namespace kairos;

static constexpr uint64_t kNow = 1700000000;

// Maps any text mentioning "work" onto one axis and everything else onto the other.
class KeywordEmbedder : public Embedder {
public:
    Embedding embed(const std::string& text) override {
        embed_count++;
        if (fail) return {};
        if (text.find("work") != std::string::npos) return {1.0f, 0.0f};
        return {0.0f, 1.0f};
    }
    uint32_t dimensions() const override { return 2; }
    std::string embedder_name() const override { return "keyword"; }

    bool fail = false;
    int embed_count = 0;
};

// In-memory snapshots whose save/remove for one owner waits until opened.
class GatedSnapshotStore : public SnapshotStore {
public:
    std::string backend_name() const override { return "gated"; }

    std::optional<StoreSnapshot> load(const std::string& owner_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = saved_.find(owner_id);
        if (it == saved_.end()) return std::nullopt;
        return it->second;
    }

    bool save(const std::string& owner_id, const StoreSnapshot& snapshot) override {
        std::unique_lock<std::mutex> lock(mutex_);
        wait_at_gate(lock, owner_id);
        saved_[owner_id] = snapshot;
        return true;
    }

    bool remove(const std::string& owner_id) override {
        std::unique_lock<std::mutex> lock(mutex_);
        wait_at_gate(lock, owner_id);
        return saved_.erase(owner_id) > 0;
    }

    void close_for(const std::string& owner_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_owner_ = owner_id;
        open_ = false;
    }

    void wait_until_blocked() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return blocked_; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    void wait_at_gate(std::unique_lock<std::mutex>& lock, const std::string& owner_id) {
        if (owner_id != gated_owner_) return;
        blocked_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, StoreSnapshot> saved_;
    std::string gated_owner_;
    bool open_ = true;
    bool blocked_ = false;
};

struct EngineFixture {
    std::string dir = "/tmp/kairos_test_engine_" + std::to_string(getpid());
    uint64_t clock = kNow;
    Config config;

    std::unique_ptr<MemoryEngine> make(Embedder* embedder = nullptr, bool persistent = false) {
        std::unique_ptr<SnapshotStore> snapshots;
        if (persistent) {
            snapshots = std::make_unique<JsonSnapshotStore>(dir);
        } else {
            snapshots = std::make_unique<NoneSnapshotStore>();
        }
        auto engine = std::make_unique<MemoryEngine>(config, std::move(snapshots), embedder);
        engine->set_clock([this] { return clock; });
        return engine;
    }

    ~EngineFixture() {
        std::filesystem::remove_all(dir);
    }
};

static Memory conversation(const std::string& summary, uint64_t created_at, Embedding embedding) {
    Memory m;
    m.kind = MemoryKind::Conversation;
    m.content = summary;
    m.created_at = created_at;
    m.embedding = std::move(embedding);
    return m;
}

// ── Context assembly ─────────────────────────────────────────

TEST_CASE("MemoryEngine: relevant conversation first, then facts and preferences", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    engine->add_fact("alice", "likes tea");
    engine->add_preference("alice", "music", "jazz");
    auto work = engine->insert_memory("alice",
        conversation("work stress", kNow - 3 * kSecondsPerDay, {1.0f, 0.0f}));
    auto trip = engine->insert_memory("alice",
        conversation("weekend trip", kNow - 3600, {0.0f, 1.0f}));

    auto entries = engine->build_context("alice", "work", {1.0f, 0.0f}, 5);
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].source_ids == std::vector<std::string>{work});
    REQUIRE(entries[0].text.find("work stress") != std::string::npos);
    REQUIRE(entries[1].source_ids == std::vector<std::string>{trip});
    REQUIRE(entries[2].text == "Known facts: likes tea");
    REQUIRE(entries[3].text == "Preferences: music: jazz");

    auto surfaced = engine->get_memory("alice", work);
    REQUIRE(surfaced.has_value());
    REQUIRE(surfaced->access_count == 1);
}

TEST_CASE("MemoryEngine: build_context by text embeds the query", "[engine]") {
    EngineFixture f;
    KeywordEmbedder embedder;
    auto engine = f.make(&embedder);

    f.clock = kNow - 3 * kSecondsPerDay;
    engine->record_turn("alice", "I am stressed about work", "That sounds hard");
    f.clock = kNow - 3600;
    engine->record_turn("alice", "We planned a weekend trip", "Sounds fun");
    f.clock = kNow;

    auto entries = engine->build_context("alice", "work", 5);
    REQUIRE_FALSE(entries.empty());
    REQUIRE(entries[0].source_kind == MemoryKind::Conversation);
    REQUIRE(entries[0].text.find("stressed about work") != std::string::npos);
}

TEST_CASE("MemoryEngine: owners never see each other's memories", "[engine]") {
    EngineFixture f;
    auto engine = f.make();
    engine->add_fact("alice", "likes tea");

    REQUIRE(engine->build_context("bob", "tea", {}, 5).empty());
    REQUIRE(engine->get_memories_by_kind("bob", MemoryKind::Fact).empty());
}

// ── Core operations ──────────────────────────────────────────

TEST_CASE("MemoryEngine: insert, get and delete", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    Memory m;
    m.kind = MemoryKind::Interest;
    m.content = "chess";
    auto id = engine->insert_memory("alice", m);
    REQUIRE(id.rfind("interest_", 0) == 0);

    auto got = engine->get_memory("alice", id);
    REQUIRE(got.has_value());
    REQUIRE(got->content == "chess");
    REQUIRE(got->created_at == kNow);

    REQUIRE(engine->delete_memory("alice", id));
    REQUIRE_FALSE(engine->delete_memory("alice", id));
    REQUIRE_FALSE(engine->get_memory("alice", id).has_value());
}

TEST_CASE("MemoryEngine: insert refuses another owner's memory", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    Memory m;
    m.kind = MemoryKind::Fact;
    m.owner_id = "bob";
    m.content = "not yours";
    REQUIRE(engine->insert_memory("alice", m).empty());
    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Fact).empty());
}

// ── record_turn ──────────────────────────────────────────────

TEST_CASE("MemoryEngine: record_turn stores every derived memory", "[engine]") {
    EngineFixture f;
    KeywordEmbedder embedder;
    auto engine = f.make(&embedder);

    auto rec = engine->record_turn("alice", "I just got a new job at work", "Congratulations!");
    REQUIRE_FALSE(rec.conversation_id.empty());
    REQUIRE_FALSE(rec.emotional_state_id.empty());
    REQUIRE_FALSE(rec.life_event_id.empty());
    REQUIRE_FALSE(rec.topic_pattern_id.empty());
    REQUIRE(rec.topics == std::vector<std::string>{"work"});

    auto conv = engine->get_memory("alice", rec.conversation_id);
    REQUIRE(conv->content ==
            "User: \"I just got a new job at work\" | Assistant: \"Congratulations!\"");
    REQUIRE(conv->embedding == Embedding{1.0f, 0.0f});
    REQUIRE(conv->topics == std::vector<std::string>{"work"});

    auto event = engine->get_memory("alice", rec.life_event_id);
    REQUIRE(event->category == "career");
    REQUIRE(event->conversation_id == rec.conversation_id);

    auto state = engine->get_memory("alice", rec.emotional_state_id);
    REQUIRE(state->emotion == "neutral");
    REQUIRE(state->conversation_id == rec.conversation_id);

    auto pattern = engine->get_memory("alice", rec.topic_pattern_id);
    REQUIRE(pattern->frequency == 1);
    REQUIRE(pattern->related_conversations == std::vector<std::string>{rec.conversation_id});
}

TEST_CASE("MemoryEngine: repeated turn merges pattern and skips duplicate event", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto first = engine->record_turn("alice", "I just got a new job", "Nice");
    f.clock += 3600;
    auto second = engine->record_turn("alice", "I just got a new job", "Nice");

    REQUIRE_FALSE(first.life_event_id.empty());
    REQUIRE(second.life_event_id.empty());
    REQUIRE(second.topic_pattern_id == first.topic_pattern_id);

    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Conversation).size() == 2);
    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::LifeEvent).size() == 1);

    auto patterns = engine->topic_patterns("alice");
    REQUIRE(patterns.size() == 1);
    REQUIRE(patterns[0].frequency == 2);
    REQUIRE(patterns[0].related_conversations.size() == 2);
}

TEST_CASE("MemoryEngine: blank turn stores nothing", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto rec = engine->record_turn("alice", "  ", "");
    REQUIRE(rec.conversation_id.empty());
    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Conversation).empty());
}

TEST_CASE("MemoryEngine: assistant-only turn keeps just the conversation", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto rec = engine->record_turn("alice", "", "Good morning! How did the job interview go?");
    REQUIRE_FALSE(rec.conversation_id.empty());
    REQUIRE(rec.emotional_state_id.empty());
    REQUIRE(rec.life_event_id.empty());
    REQUIRE(rec.topic_pattern_id.empty());
}

TEST_CASE("MemoryEngine: failed embedding still records the turn", "[engine]") {
    EngineFixture f;
    KeywordEmbedder embedder;
    embedder.fail = true;
    auto engine = f.make(&embedder);

    auto rec = engine->record_turn("alice", "Hello", "Hi");
    REQUIRE(embedder.embed_count == 1);
    auto conv = engine->get_memory("alice", rec.conversation_id);
    REQUIRE(conv.has_value());
    REQUIRE(conv->embedding.empty());
}

TEST_CASE("MemoryEngine: conversation cap applies to recorded turns", "[engine]") {
    EngineFixture f;
    f.config.store.max_conversations = 3;
    auto engine = f.make();

    std::vector<std::string> ids;
    for (int i = 0; i < 5; i++) {
        f.clock = kNow + static_cast<uint64_t>(i);
        ids.push_back(engine->record_turn("alice", "message " + std::to_string(i), "ok")
                          .conversation_id);
    }
    auto convs = engine->get_memories_by_kind("alice", MemoryKind::Conversation);
    REQUIRE(convs.size() == 3);
    REQUIRE_FALSE(engine->get_memory("alice", ids[0]).has_value());
    REQUIRE_FALSE(engine->get_memory("alice", ids[1]).has_value());
    REQUIRE(engine->get_memory("alice", ids[4]).has_value());
}

// ── Typed writers ────────────────────────────────────────────

TEST_CASE("MemoryEngine: preference with the same key is updated", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto id = engine->add_preference("alice", "music", "jazz");
    f.clock += 60;
    REQUIRE(engine->add_preference("alice", "music", "blues") == id);

    auto prefs = engine->get_memories_by_kind("alice", MemoryKind::Preference);
    REQUIRE(prefs.size() == 1);
    REQUIRE(prefs[0].value == "blues");
    REQUIRE(prefs[0].created_at == kNow);
}

TEST_CASE("MemoryEngine: relationship stores person and relation", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto id = engine->add_relationship("alice", "Maria", "sister");
    auto m = engine->get_memory("alice", id);
    REQUIRE(m->kind == MemoryKind::Relationship);
    REQUIRE(m->key == "Maria");
    REQUIRE(m->value == "sister");
}

TEST_CASE("MemoryEngine: goals start active and can be completed", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto goal = engine->add_goal("alice", "run a marathon", "health");
    REQUIRE(engine->get_memory("alice", goal)->status == "active");

    REQUIRE(engine->complete_goal("alice", goal));
    REQUIRE(engine->get_memory("alice", goal)->status == "completed");
    REQUIRE(engine->build_context("alice", "", {}, 5).empty());

    auto fact = engine->add_fact("alice", "likes tea");
    REQUIRE_FALSE(engine->complete_goal("alice", fact));
    REQUIRE_FALSE(engine->complete_goal("alice", "goal_missing"));
}

TEST_CASE("MemoryEngine: long-term memory salience follows importance", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto high = engine->add_long_term_memory("alice", "survived a storm at sea", "life",
                                             Level::High);
    auto low = engine->add_long_term_memory("alice", "ate a sandwich", "life", Level::Low);
    REQUIRE(engine->get_memory("alice", high)->salience >
            engine->get_memory("alice", low)->salience);
}

TEST_CASE("MemoryEngine: typed writers embed their text", "[engine]") {
    EngineFixture f;
    KeywordEmbedder embedder;
    auto engine = f.make(&embedder);

    auto id = engine->add_interest("alice", "woodwork");
    REQUIRE(engine->get_memory("alice", id)->embedding == Embedding{1.0f, 0.0f});
    REQUIRE(embedder.embed_count == 1);
}

// ── Views ────────────────────────────────────────────────────

TEST_CASE("MemoryEngine: emotional_stats over recorded turns", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    REQUIRE(engine->emotional_stats("alice").total == 0);
    REQUIRE(engine->emotional_stats("alice").dominant == "neutral");

    engine->record_turn("alice", "I am so happy today", "Great");
    f.clock += 10;
    engine->record_turn("alice", "I am sad", "Sorry to hear");
    f.clock += 10;
    engine->record_turn("alice", "Still happy", "Good");

    auto stats = engine->emotional_stats("alice");
    REQUIRE(stats.total == 3);
    REQUIRE(stats.counts["happy"] == 2);
    REQUIRE(stats.counts["sad"] == 1);
    REQUIRE(stats.dominant == "happy");
    REQUIRE(stats.recent.size() == 3);
    REQUIRE(stats.recent.front().emotion == "happy");
    REQUIRE(stats.recent[1].emotion == "sad");
}

TEST_CASE("MemoryEngine: life_event_timeline is oldest first", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    Memory later;
    later.kind = MemoryKind::LifeEvent;
    later.content = "moved";
    later.created_at = kNow - 100;
    Memory earlier = later;
    earlier.content = "graduated";
    earlier.created_at = kNow - 900;

    engine->insert_memory("alice", later);
    engine->insert_memory("alice", earlier);

    auto timeline = engine->life_event_timeline("alice");
    REQUIRE(timeline.size() == 2);
    REQUIRE(timeline[0].content == "graduated");
    REQUIRE(timeline[1].content == "moved");
}

TEST_CASE("MemoryEngine: topic_patterns by descending frequency", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    Memory rare;
    rare.kind = MemoryKind::TopicPattern;
    rare.topics = {"hobbies"};
    rare.emotion = "calm";
    rare.frequency = 1;
    Memory common = rare;
    common.topics = {"work"};
    common.emotion = "anxious";
    common.frequency = 4;

    engine->insert_memory("alice", rare);
    engine->insert_memory("alice", common);

    auto patterns = engine->topic_patterns("alice");
    REQUIRE(patterns.size() == 2);
    REQUIRE(patterns[0].frequency == 4);
    REQUIRE(patterns[1].frequency == 1);
}

TEST_CASE("MemoryEngine: scoring_stats covers every kind", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    engine->add_fact("alice", "likes tea");
    engine->add_goal("alice", "learn chess");
    engine->insert_memory("alice", conversation("chat", kNow, {1.0f, 0.0f}));

    auto stats = engine->scoring_stats("alice", {1.0f, 0.0f});
    REQUIRE(stats.count == 3);
    REQUIRE(stats.top_ids.size() == 3);
    REQUIRE(stats.max <= 1.0);
}

TEST_CASE("MemoryEngine: query_memories searches by keyword and time", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    f.clock = kNow - 10 * kSecondsPerDay;
    engine->add_fact("alice", "likes green tea");
    f.clock = kNow;
    engine->insert_memory("alice", conversation("had tea with grandma", kNow - 60, {}));
    engine->add_interest("alice", "tea ceremonies");
    engine->add_fact("bob", "likes tea too");

    RecallQuery q;
    q.text = "tea";
    auto matches = engine->query_memories("alice", q);
    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].memory.kind == MemoryKind::Conversation);
    REQUIRE(matches[0].relevance == 13);
    REQUIRE(matches[1].memory.content == "likes green tea");
    REQUIRE(matches[1].relevance == 11);

    q.from = kNow - kSecondsPerDay;
    REQUIRE(engine->query_memories("alice", q).size() == 1);

    q.from = 0;
    q.kinds = {MemoryKind::Interest};
    matches = engine->query_memories("alice", q);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].memory.content == "tea ceremonies");
}

TEST_CASE("MemoryEngine: memory_stats counts every kind", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    auto empty = engine->memory_stats("alice");
    REQUIRE(empty.total == 0);
    REQUIRE(empty.by_kind.size() == 10);
    REQUIRE(empty.by_kind["fact"] == 0);
    REQUIRE(empty.oldest_at == 0);

    f.clock = kNow - 500;
    engine->add_fact("alice", "likes tea");
    f.clock = kNow;
    engine->add_fact("alice", "plays chess");
    engine->add_goal("alice", "run a marathon");

    auto stats = engine->memory_stats("alice");
    REQUIRE(stats.total == 3);
    REQUIRE(stats.by_kind["fact"] == 2);
    REQUIRE(stats.by_kind["goal"] == 1);
    REQUIRE(stats.by_kind["conversation"] == 0);
    REQUIRE(stats.oldest_at == kNow - 500);
    REQUIRE(stats.newest_at == kNow);
}

// ── Persistence and lifecycle ────────────────────────────────

TEST_CASE("MemoryEngine: memories survive a restart", "[engine]") {
    EngineFixture f;
    std::string fact_id;
    std::string conv_id;
    {
        auto engine = f.make(nullptr, true);
        fact_id = engine->add_fact("alice", "likes tea");
        conv_id = engine->insert_memory("alice", conversation("chat", kNow, {0.5f, 0.5f}));
    }

    auto engine = f.make(nullptr, true);
    auto fact = engine->get_memory("alice", fact_id);
    REQUIRE(fact.has_value());
    REQUIRE(fact->content == "likes tea");
    auto conv = engine->get_memory("alice", conv_id);
    REQUIRE(conv->embedding == Embedding{0.5f, 0.5f});
}

TEST_CASE("MemoryEngine: an unreadable record does not wipe the owner", "[engine]") {
    EngineFixture f;
    std::filesystem::create_directories(f.dir);
    {
        std::ofstream out(f.dir + "/alice.json");
        out << R"({"owner_id": "alice", "memories": [
            {"id": "fact_a", "kind": "fact", "content": "likes tea", "created_at": 1},
            {"id": "fact_b", "kind": "fact", "content": 5}
        ]})";
    }

    auto engine = f.make(nullptr, true);
    REQUIRE(engine->build_context("alice", "tea", {}, 5).size() == 1);
    engine->add_fact("alice", "new fact");

    auto reopened = f.make(nullptr, true);
    auto facts = reopened->get_memories_by_kind("alice", MemoryKind::Fact);
    REQUIRE(facts.size() == 2);
    REQUIRE(facts[0].content == "likes tea");
    REQUIRE(facts[1].content == "new fact");
}

TEST_CASE("MemoryEngine: delete_owner removes memory and snapshot", "[engine]") {
    EngineFixture f;
    auto engine = f.make(nullptr, true);
    REQUIRE(engine->snapshots().backend_name() == "json");

    engine->add_fact("alice", "likes tea");
    REQUIRE(std::filesystem::exists(f.dir + "/alice.json"));

    REQUIRE(engine->delete_owner("alice"));
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/alice.json"));
    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Fact).empty());

    REQUIRE_FALSE(engine->delete_owner("ghost"));
}

TEST_CASE("MemoryEngine: evict_idle unloads and reloads on demand", "[engine]") {
    EngineFixture f;
    auto engine = f.make(nullptr, true);

    auto id = engine->add_fact("alice", "likes tea");
    engine->add_fact("bob", "likes coffee");
    f.clock = kNow + 100;
    engine->add_fact("bob", "likes cake");

    REQUIRE(engine->evict_idle(1000) == 0);
    REQUIRE(engine->evict_idle(50) == 1);

    auto loaded = engine->loaded_owners();
    REQUIRE(loaded == std::vector<std::string>{"bob"});

    auto fact = engine->get_memory("alice", id);
    REQUIRE(fact.has_value());
    REQUIRE(fact->content == "likes tea");
    REQUIRE(engine->loaded_owners().size() == 2);
}

TEST_CASE("MemoryEngine: writes unload owners idle past the configured limit", "[engine]") {
    EngineFixture f;
    f.config.store.idle_evict_seconds = 60;
    auto engine = f.make(nullptr, true);

    auto id = engine->add_fact("alice", "likes tea");
    f.clock = kNow + 30;
    engine->add_fact("bob", "likes coffee");
    REQUIRE(engine->loaded_owners().size() == 2);

    f.clock = kNow + 120;
    engine->add_fact("bob", "likes cake");
    REQUIRE(engine->loaded_owners() == std::vector<std::string>{"bob"});
    REQUIRE(std::filesystem::exists(f.dir + "/alice.json"));

    auto fact = engine->get_memory("alice", id);
    REQUIRE(fact.has_value());
    REQUIRE(fact->content == "likes tea");
}

TEST_CASE("MemoryEngine: idle unloading off when disabled or unpersisted", "[engine]") {
    EngineFixture f;
    SECTION("limit of zero") {
        f.config.store.idle_evict_seconds = 0;
        auto engine = f.make(nullptr, true);
        engine->add_fact("alice", "likes tea");
        f.clock = kNow + 10 * kSecondsPerDay;
        engine->add_fact("bob", "likes coffee");
        REQUIRE(engine->loaded_owners().size() == 2);
    }
    SECTION("no snapshot backend") {
        f.config.store.idle_evict_seconds = 60;
        auto engine = f.make();
        engine->add_fact("alice", "likes tea");
        f.clock = kNow + 10 * kSecondsPerDay;
        engine->add_fact("bob", "likes coffee");
        REQUIRE(engine->loaded_owners().size() == 2);
        REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Fact).size() == 1);
    }
}

TEST_CASE("MemoryEngine: evict_idle does not stall other owners during a save", "[engine]") {
    EngineFixture f;
    f.config.store.auto_save = false;
    f.config.store.idle_evict_seconds = 0;
    auto gated = std::make_unique<GatedSnapshotStore>();
    GatedSnapshotStore* store = gated.get();
    MemoryEngine engine(f.config, std::move(gated));
    engine.set_clock([&f] { return f.clock; });

    engine.add_fact("slow", "likes tea");
    f.clock = kNow + 100;
    store->close_for("slow");

    std::thread evictor([&engine] { engine.evict_idle(50); });
    store->wait_until_blocked();

    auto other = std::async(std::launch::async, [&engine] {
        return engine.add_fact("fast", "likes coffee");
    });
    bool finished = other.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    store->open();
    evictor.join();

    REQUIRE(finished);
    REQUIRE_FALSE(other.get().empty());
    REQUIRE(engine.get_memories_by_kind("slow", MemoryKind::Fact).size() == 1);
}

TEST_CASE("MemoryEngine: delete_owner does not stall other owners", "[engine]") {
    EngineFixture f;
    f.config.store.idle_evict_seconds = 0;
    auto gated = std::make_unique<GatedSnapshotStore>();
    GatedSnapshotStore* store = gated.get();
    MemoryEngine engine(f.config, std::move(gated));
    engine.set_clock([&f] { return f.clock; });

    engine.add_fact("slow", "likes tea");
    store->close_for("slow");

    std::thread deleter([&engine] { engine.delete_owner("slow"); });
    store->wait_until_blocked();

    auto other = std::async(std::launch::async, [&engine] {
        return engine.add_fact("fast", "likes coffee");
    });
    bool finished = other.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    store->open();
    deleter.join();

    REQUIRE(finished);
    REQUIRE(engine.get_memories_by_kind("slow", MemoryKind::Fact).empty());
    REQUIRE(engine.get_memories_by_kind("fast", MemoryKind::Fact).size() == 1);
}

TEST_CASE("MemoryEngine: flush writes when auto_save is off", "[engine]") {
    EngineFixture f;
    f.config.store.auto_save = false;
    auto engine = f.make(nullptr, true);

    engine->add_fact("alice", "likes tea");
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/alice.json"));

    REQUIRE(engine->flush("alice"));
    REQUIRE(std::filesystem::exists(f.dir + "/alice.json"));
    REQUIRE(engine->flush("nobody"));
}

TEST_CASE("MemoryEngine: destructor flushes when auto_save is off", "[engine]") {
    EngineFixture f;
    f.config.store.auto_save = false;
    {
        auto engine = f.make(nullptr, true);
        engine->add_fact("alice", "likes tea");
    }
    REQUIRE(std::filesystem::exists(f.dir + "/alice.json"));
}

TEST_CASE("MemoryEngine: invalid weights fall back to defaults", "[engine]") {
    EngineFixture f;
    f.config.scoring.alpha = 3.0;
    auto engine = f.make();
    REQUIRE(engine->config().scoring.alpha == 0.6);
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("MemoryEngine: concurrent writers on one owner lose nothing", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&engine, t] {
            for (int i = 0; i < 25; i++) {
                engine->add_fact("alice", "fact " + std::to_string(t) + "-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(engine->get_memories_by_kind("alice", MemoryKind::Fact).size() == 100);
}

TEST_CASE("MemoryEngine: concurrent owners stay separate", "[engine]") {
    EngineFixture f;
    auto engine = f.make();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&engine, t] {
            std::string owner = "owner" + std::to_string(t);
            for (int i = 0; i < 10; i++) {
                engine->record_turn(owner, "I am happy about work", "Great");
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 0; t < 4; t++) {
        std::string owner = "owner" + std::to_string(t);
        REQUIRE(engine->get_memories_by_kind(owner, MemoryKind::Conversation).size() == 10);
        auto patterns = engine->topic_patterns(owner);
        REQUIRE(patterns.size() == 1);
        REQUIRE(patterns[0].frequency == 10);
    }
}
