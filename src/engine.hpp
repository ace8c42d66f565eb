#pragma once
#include "config.hpp"
#include "context.hpp"
#include "extractor.hpp"
#include "memory.hpp"
#include "recall.hpp"
#include "scoring.hpp"
#include "memory/owner_store.hpp"
#include "memory/snapshot_store.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kairos {

class Embedder;

// Ids of everything one recorded turn produced (empty when not produced).
struct TurnRecord {
    std::string conversation_id;
    std::string emotional_state_id;
    std::string life_event_id;
    std::string topic_pattern_id;
    std::vector<std::string> topics;
};

struct EmotionalStats {
    uint32_t total = 0;
    std::map<std::string, uint32_t> counts;
    std::string dominant = "neutral";
    std::vector<Memory> recent; // last 10, oldest first
};

constexpr size_t kRecentEmotionalStates = 10;

struct MemoryStats {
    uint32_t total = 0;
    std::map<std::string, uint32_t> by_kind; // every kind, zero included
    uint64_t oldest_at = 0;                  // created_at range, 0 when empty
    uint64_t newest_at = 0;
};

// Per-owner memory stores behind one registry.
//
// Each owner has its own lock; the registry lock is held only to find,
// create or drop an owner slot, never across I/O. Stores are loaded from the
// SnapshotStore on first access and saved after every mutation when
// store.auto_save is set. Embeddings are computed before the owner lock is
// taken. Writes also unload owners idle for store.idle_evict_seconds, at
// most once per that interval, unless persistence is disabled.
class MemoryEngine {
public:
    // `embedder` is optional and not owned.
    MemoryEngine(const Config& config, std::unique_ptr<SnapshotStore> snapshots,
                 Embedder* embedder = nullptr);
    ~MemoryEngine();

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    // ── Core operations ─────────────────────────────────────────

    // Store or replace a memory as given (no embedding is computed).
    // Returns its id, or empty if the memory belongs to another owner.
    std::string insert_memory(const std::string& owner_id, Memory memory);

    bool delete_memory(const std::string& owner_id, const std::string& id);

    std::optional<Memory> get_memory(const std::string& owner_id, const std::string& id);

    // Copies, in insertion order.
    std::vector<Memory> get_memories_by_kind(const std::string& owner_id, MemoryKind kind);

    // Summarize a turn into a Conversation and store what the extractor
    // derives from it. Nothing is stored when both messages are blank.
    TurnRecord record_turn(const std::string& owner_id, const std::string& user_message,
                           const std::string& assistant_message);

    std::vector<ContextEntry> build_context(const std::string& owner_id,
                                            const std::string& query_text,
                                            const Embedding& query_embedding,
                                            size_t max_items);

    // Same, embedding query_text with the configured embedder.
    std::vector<ContextEntry> build_context(const std::string& owner_id,
                                            const std::string& query_text,
                                            size_t max_items);

    ScoringStats scoring_stats(const std::string& owner_id, const Embedding& query_embedding);

    // Embedding of a query text, empty without a working embedder.
    Embedding embed_query(const std::string& text);

    // ── Typed writers ───────────────────────────────────────────

    std::string add_fact(const std::string& owner_id, const std::string& text,
                         const std::string& category = "general");

    // An existing preference with the same key is updated in place.
    std::string add_preference(const std::string& owner_id, const std::string& key,
                               const std::string& value);

    std::string add_relationship(const std::string& owner_id, const std::string& person,
                                 const std::string& relation);

    std::string add_goal(const std::string& owner_id, const std::string& text,
                         const std::string& category = "general");

    // Returns false if the id is not a Goal of this owner.
    bool complete_goal(const std::string& owner_id, const std::string& goal_id);

    std::string add_interest(const std::string& owner_id, const std::string& text,
                             const std::string& category = "general");

    std::string add_long_term_memory(const std::string& owner_id, const std::string& text,
                                     const std::string& category = "general",
                                     Level importance = Level::Medium);

    // ── Views ───────────────────────────────────────────────────

    EmotionalStats emotional_stats(const std::string& owner_id);

    // LifeEvents oldest first.
    std::vector<Memory> life_event_timeline(const std::string& owner_id);

    // TopicPatterns by descending frequency (ties keep insertion order).
    std::vector<Memory> topic_patterns(const std::string& owner_id);

    // Keyword search without embeddings, most relevant first.
    std::vector<RecallMatch> query_memories(const std::string& owner_id,
                                            const RecallQuery& query);

    // Record counts per kind.
    MemoryStats memory_stats(const std::string& owner_id);

    // ── Lifecycle ───────────────────────────────────────────────

    // Drop the owner from memory and from the snapshot store.
    // Returns true if anything existed.
    bool delete_owner(const std::string& owner_id);

    // Save and unload owners idle longer than max_idle_seconds.
    // Owners busy in another thread, or whose save fails, stay loaded.
    // Returns the number unloaded.
    size_t evict_idle(uint64_t max_idle_seconds);

    // Save one owner (if loaded) or every loaded owner. False if a save failed.
    bool flush(const std::string& owner_id);
    bool flush_all();

    std::vector<std::string> loaded_owners() const;

    // Replace the epoch-seconds clock (tests).
    void set_clock(std::function<uint64_t()> clock);

    const Config& config() const { return config_; }
    const SnapshotStore& snapshots() const { return *snapshots_; }

private:
    struct OwnerSlot {
        std::mutex mutex;
        std::unique_ptr<OwnerStore> store; // loaded under `mutex` on first use
        uint64_t last_active = 0;
        std::atomic<bool> retired{false};  // unloaded or deleted; look up again
    };

    // Live slot for the owner; a retired one is replaced.
    std::shared_ptr<OwnerSlot> acquire_slot(const std::string& owner_id);
    // Forget a retired slot unless it was already replaced.
    void release_slot(const std::string& owner_id, const std::shared_ptr<OwnerSlot>& slot);
    void maybe_evict_idle();
    void load_into(OwnerSlot& slot, const std::string& owner_id);
    bool save(const OwnerStore& store);
    void persist(const OwnerStore& store);
    uint64_t now() const;
    Embedding embed_or_empty(const std::string& text, const char* purpose);
    std::string add_typed(const std::string& owner_id, Memory memory, const std::string& text);

    // Run fn(OwnerStore&) under the owner's lock.
    template <typename Fn>
    auto with_owner(const std::string& owner_id, Fn&& fn) -> decltype(fn(std::declval<OwnerStore&>())) {
        for (;;) {
            auto slot = acquire_slot(owner_id);
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->retired) continue;
            if (!slot->store) load_into(*slot, owner_id);
            slot->last_active = now();
            return fn(*slot->store);
        }
    }

    Config config_;
    std::unique_ptr<SnapshotStore> snapshots_;
    Embedder* embedder_ = nullptr;
    MemoryExtractor extractor_;
    ContextAssembler assembler_;
    std::function<uint64_t()> clock_;

    std::unordered_map<std::string, std::shared_ptr<OwnerSlot>> owners_;
    mutable std::mutex registry_mutex_;
    std::atomic<uint64_t> last_sweep_{0};
};

} // namespace kairos
