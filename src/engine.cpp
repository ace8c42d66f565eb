#include "engine.hpp"
#include "embedder.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace kairos {

static Config with_valid_weights(Config config) {
    config.scoring = validate_weights(config.scoring);
    return config;
}

MemoryEngine::MemoryEngine(const Config& config, std::unique_ptr<SnapshotStore> snapshots,
                           Embedder* embedder)
    : config_(with_valid_weights(config))
    , snapshots_(std::move(snapshots))
    , embedder_(embedder)
    , assembler_(config_.scoring, config_.context)
    , clock_(epoch_seconds)
{
    if (!snapshots_) snapshots_ = std::make_unique<NoneSnapshotStore>();
}

MemoryEngine::~MemoryEngine() {
    // Failures are already logged per owner
    if (!config_.store.auto_save && !flush_all()) {
        std::cerr << "[engine] Some owners could not be saved on shutdown\n";
    }
}

void MemoryEngine::set_clock(std::function<uint64_t()> clock) {
    clock_ = clock ? std::move(clock) : std::function<uint64_t()>(epoch_seconds);
}

uint64_t MemoryEngine::now() const {
    return clock_();
}

// ── Registry ─────────────────────────────────────────────────────

std::shared_ptr<MemoryEngine::OwnerSlot> MemoryEngine::acquire_slot(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = owners_[owner_id];
    if (!slot || slot->retired) slot = std::make_shared<OwnerSlot>();
    return slot;
}

void MemoryEngine::release_slot(const std::string& owner_id,
                                const std::shared_ptr<OwnerSlot>& slot) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = owners_.find(owner_id);
    if (it != owners_.end() && it->second == slot) owners_.erase(it);
}

void MemoryEngine::maybe_evict_idle() {
    uint64_t idle = config_.store.idle_evict_seconds;
    // Without a backend an unloaded owner would lose its memories
    if (idle == 0 || snapshots_->backend_name() == "none") return;

    uint64_t ts = now();
    uint64_t last = last_sweep_.load();
    if (ts < last + idle) return;
    if (!last_sweep_.compare_exchange_strong(last, ts)) return;
    evict_idle(idle);
}

void MemoryEngine::load_into(OwnerSlot& slot, const std::string& owner_id) {
    StoreLimits limits;
    limits.max_conversations = config_.store.max_conversations;
    limits.max_emotional_states = config_.store.max_emotional_states;
    slot.store = std::make_unique<OwnerStore>(owner_id, limits);

    auto snapshot = snapshots_->load(owner_id);
    if (snapshot) slot.store->restore(*snapshot, now());
}

bool MemoryEngine::save(const OwnerStore& store) {
    if (snapshots_->save(store.owner_id(), store.snapshot())) return true;
    std::cerr << "[engine] Failed to persist memories for " << store.owner_id()
              << " (" << snapshots_->backend_name() << " backend), keeping in-memory state\n";
    return false;
}

void MemoryEngine::persist(const OwnerStore& store) {
    if (config_.store.auto_save) save(store);
}

Embedding MemoryEngine::embed_or_empty(const std::string& text, const char* purpose) {
    if (!embedder_ || trim(text).empty()) return {};
    Embedding embedding = embedder_->embed(text);
    if (embedding.empty()) {
        std::cerr << "[engine] Embedding unavailable for " << purpose << " ("
                  << embedder_->embedder_name() << "), semantic relevance disabled\n";
    }
    return embedding;
}

// ── Core operations ──────────────────────────────────────────────

std::string MemoryEngine::insert_memory(const std::string& owner_id, Memory memory) {
    std::string id = with_owner(owner_id, [&](OwnerStore& store) {
        std::string put_id = store.put(std::move(memory), now());
        if (!put_id.empty()) persist(store);
        return put_id;
    });
    maybe_evict_idle();
    return id;
}

bool MemoryEngine::delete_memory(const std::string& owner_id, const std::string& id) {
    bool removed = with_owner(owner_id, [&](OwnerStore& store) {
        if (!store.remove(id)) return false;
        persist(store);
        return true;
    });
    maybe_evict_idle();
    return removed;
}

std::optional<Memory> MemoryEngine::get_memory(const std::string& owner_id,
                                               const std::string& id) {
    return with_owner(owner_id, [&](OwnerStore& store) -> std::optional<Memory> {
        const Memory* m = store.find(id);
        if (!m) return std::nullopt;
        return *m;
    });
}

static std::vector<Memory> copy_all(const std::vector<const Memory*>& memories) {
    std::vector<Memory> out;
    out.reserve(memories.size());
    for (const Memory* m : memories) out.push_back(*m);
    return out;
}

std::vector<Memory> MemoryEngine::get_memories_by_kind(const std::string& owner_id,
                                                       MemoryKind kind) {
    return with_owner(owner_id, [&](OwnerStore& store) {
        return copy_all(store.by_kind(kind));
    });
}

TurnRecord MemoryEngine::record_turn(const std::string& owner_id,
                                     const std::string& user_message,
                                     const std::string& assistant_message) {
    TurnRecord record;
    if (trim(user_message).empty() && trim(assistant_message).empty()) return record;

    std::string summary = summarize_turn(user_message, assistant_message);
    Embedding embedding = embed_or_empty(summary, "conversation");

    with_owner(owner_id, [&](OwnerStore& store) {
        uint64_t ts = now();

        ExtractionHistory history;
        history.life_events = store.by_kind(MemoryKind::LifeEvent);
        history.topic_patterns = store.by_kind(MemoryKind::TopicPattern);
        ExtractedMemories extracted =
            extractor_.extract({owner_id, user_message, assistant_message}, history, ts);

        EmotionalState state = extracted.emotional_state.value_or(EmotionalState{});
        double emotion_score = emotion_score_for(state.primary, state.intensity);
        record.topics = extracted.topics;

        Memory conversation;
        conversation.kind = MemoryKind::Conversation;
        conversation.content = summary;
        conversation.topics = extracted.topics;
        conversation.emotion = state.primary;
        conversation.emotion_score = emotion_score;
        conversation.embedding = std::move(embedding);
        conversation.created_at = ts;
        record.conversation_id = store.put(std::move(conversation), ts);

        if (extracted.emotional_state) {
            Memory m;
            m.kind = MemoryKind::EmotionalState;
            m.emotion = state.primary;
            m.secondary_emotions = state.secondary;
            m.level = state.intensity;
            m.emotion_score = emotion_score;
            m.content = truncate_utf8(trim(user_message), kSummaryQuoteMax);
            m.conversation_id = record.conversation_id;
            m.created_at = ts;
            record.emotional_state_id = store.put(std::move(m), ts);
        }

        if (extracted.life_event) {
            const auto& event = *extracted.life_event;
            Memory m;
            m.kind = MemoryKind::LifeEvent;
            m.category = event.category;
            m.content = event.description;
            m.level = event.importance;
            m.salience = salience_for_importance(event.importance);
            m.emotion = state.primary;
            m.emotion_score = emotion_score;
            m.conversation_id = record.conversation_id;
            m.created_at = ts;
            record.life_event_id = store.put(std::move(m), ts);
        }

        if (extracted.topic_pattern) {
            const auto& pattern = *extracted.topic_pattern;
            record.topic_pattern_id = store.apply_topic_pattern(
                pattern.topics, pattern.emotion, record.conversation_id, pattern.merge_into, ts);
        }

        persist(store);
    });
    maybe_evict_idle();
    return record;
}

std::vector<ContextEntry> MemoryEngine::build_context(const std::string& owner_id,
                                                      const std::string& query_text,
                                                      const Embedding& query_embedding,
                                                      size_t max_items) {
    if (query_embedding.empty()) {
        std::cerr << "[engine] No query embedding for " << owner_id
                  << ", ranking conversations without semantic relevance\n";
    }

    return with_owner(owner_id, [&](OwnerStore& store) {
        auto entries = assembler_.assemble(store, query_text, query_embedding, max_items, now());
        bool touched = std::any_of(entries.begin(), entries.end(), [](const ContextEntry& e) {
            return e.source_kind == MemoryKind::Conversation;
        });
        if (touched) persist(store);
        return entries;
    });
}

Embedding MemoryEngine::embed_query(const std::string& text) {
    return embed_or_empty(text, "query");
}

std::vector<ContextEntry> MemoryEngine::build_context(const std::string& owner_id,
                                                      const std::string& query_text,
                                                      size_t max_items) {
    return build_context(owner_id, query_text, embed_query(query_text), max_items);
}

ScoringStats MemoryEngine::scoring_stats(const std::string& owner_id,
                                         const Embedding& query_embedding) {
    return with_owner(owner_id, [&](OwnerStore& store) {
        std::vector<const Memory*> all;
        for (int k = static_cast<int>(MemoryKind::Conversation);
             k <= static_cast<int>(MemoryKind::Interest); ++k) {
            auto of_kind = store.by_kind(static_cast<MemoryKind>(k));
            all.insert(all.end(), of_kind.begin(), of_kind.end());
        }
        return compute_scoring_stats(query_embedding, all, config_.scoring, now());
    });
}

// ── Typed writers ────────────────────────────────────────────────

std::string MemoryEngine::add_typed(const std::string& owner_id, Memory memory,
                                    const std::string& text) {
    memory.embedding = embed_or_empty(text, kind_to_string(memory.kind).c_str());
    return insert_memory(owner_id, std::move(memory));
}

std::string MemoryEngine::add_fact(const std::string& owner_id, const std::string& text,
                                   const std::string& category) {
    Memory m;
    m.kind = MemoryKind::Fact;
    m.content = text;
    m.category = category;
    return add_typed(owner_id, std::move(m), text);
}

std::string MemoryEngine::add_preference(const std::string& owner_id, const std::string& key,
                                         const std::string& value) {
    Memory m;
    m.kind = MemoryKind::Preference;
    m.key = key;
    m.value = value;
    m.embedding = embed_or_empty(key + ": " + value, "preference");

    std::string id = with_owner(owner_id, [&](OwnerStore& store) {
        for (const Memory* existing : store.by_kind(MemoryKind::Preference)) {
            if (existing->key == key) {
                m.id = existing->id;
                break;
            }
        }
        std::string put_id = store.put(std::move(m), now());
        persist(store);
        return put_id;
    });
    maybe_evict_idle();
    return id;
}

std::string MemoryEngine::add_relationship(const std::string& owner_id,
                                           const std::string& person,
                                           const std::string& relation) {
    Memory m;
    m.kind = MemoryKind::Relationship;
    m.key = person;
    m.value = relation;
    return add_typed(owner_id, std::move(m), person + " (" + relation + ")");
}

std::string MemoryEngine::add_goal(const std::string& owner_id, const std::string& text,
                                   const std::string& category) {
    Memory m;
    m.kind = MemoryKind::Goal;
    m.content = text;
    m.category = category;
    m.status = "active";
    return add_typed(owner_id, std::move(m), text);
}

bool MemoryEngine::complete_goal(const std::string& owner_id, const std::string& goal_id) {
    bool completed = with_owner(owner_id, [&](OwnerStore& store) {
        const Memory* goal = store.find(goal_id);
        if (!goal || goal->kind != MemoryKind::Goal) return false;

        Memory updated = *goal;
        updated.status = "completed";
        store.put(std::move(updated), now());
        persist(store);
        return true;
    });
    maybe_evict_idle();
    return completed;
}

std::string MemoryEngine::add_interest(const std::string& owner_id, const std::string& text,
                                       const std::string& category) {
    Memory m;
    m.kind = MemoryKind::Interest;
    m.content = text;
    m.category = category;
    return add_typed(owner_id, std::move(m), text);
}

std::string MemoryEngine::add_long_term_memory(const std::string& owner_id,
                                               const std::string& text,
                                               const std::string& category,
                                               Level importance) {
    Memory m;
    m.kind = MemoryKind::LongTerm;
    m.content = text;
    m.category = category;
    m.level = importance;
    m.salience = salience_for_importance(importance);
    return add_typed(owner_id, std::move(m), text);
}

// ── Views ────────────────────────────────────────────────────────

EmotionalStats MemoryEngine::emotional_stats(const std::string& owner_id) {
    return with_owner(owner_id, [&](OwnerStore& store) {
        EmotionalStats stats;
        auto states = store.by_kind(MemoryKind::EmotionalState);
        std::stable_sort(states.begin(), states.end(), [](const Memory* a, const Memory* b) {
            return a->created_at < b->created_at;
        });

        stats.total = static_cast<uint32_t>(states.size());
        for (const Memory* s : states) {
            stats.counts[s->emotion.empty() ? "neutral" : s->emotion]++;
        }

        auto trend = emotional_trend(states, stats.total, 1);
        if (trend) stats.dominant = trend->dominant;

        size_t begin = states.size() > kRecentEmotionalStates
                           ? states.size() - kRecentEmotionalStates : 0;
        for (size_t i = begin; i < states.size(); ++i) {
            stats.recent.push_back(*states[i]);
        }
        return stats;
    });
}

std::vector<Memory> MemoryEngine::life_event_timeline(const std::string& owner_id) {
    auto events = get_memories_by_kind(owner_id, MemoryKind::LifeEvent);
    std::stable_sort(events.begin(), events.end(), [](const Memory& a, const Memory& b) {
        return a.created_at < b.created_at;
    });
    return events;
}

std::vector<Memory> MemoryEngine::topic_patterns(const std::string& owner_id) {
    auto patterns = get_memories_by_kind(owner_id, MemoryKind::TopicPattern);
    std::stable_sort(patterns.begin(), patterns.end(), [](const Memory& a, const Memory& b) {
        return a.frequency > b.frequency;
    });
    return patterns;
}

std::vector<RecallMatch> MemoryEngine::query_memories(const std::string& owner_id,
                                                      const RecallQuery& query) {
    return with_owner(owner_id, [&](OwnerStore& store) {
        return recall(store, query, now());
    });
}

MemoryStats MemoryEngine::memory_stats(const std::string& owner_id) {
    return with_owner(owner_id, [&](OwnerStore& store) {
        MemoryStats stats;
        for (int k = static_cast<int>(MemoryKind::Conversation);
             k <= static_cast<int>(MemoryKind::Interest); ++k) {
            auto kind = static_cast<MemoryKind>(k);
            auto of_kind = store.by_kind(kind);
            stats.by_kind[kind_to_string(kind)] = static_cast<uint32_t>(of_kind.size());
            for (const Memory* m : of_kind) {
                if (stats.total == 0 || m->created_at < stats.oldest_at) {
                    stats.oldest_at = m->created_at;
                }
                if (stats.total == 0 || m->created_at > stats.newest_at) {
                    stats.newest_at = m->created_at;
                }
                stats.total++;
            }
        }
        return stats;
    });
}

// ── Lifecycle ────────────────────────────────────────────────────

bool MemoryEngine::delete_owner(const std::string& owner_id) {
    for (;;) {
        auto slot = acquire_slot(owner_id);
        std::unique_lock<std::mutex> slot_lock(slot->mutex);
        if (slot->retired) continue;

        // The live slot stays locked until the snapshot is gone, so a
        // concurrent first access cannot reload it.
        bool existed = slot->store && slot->store->size() > 0;
        if (snapshots_->remove(owner_id)) existed = true;
        slot->retired = true;
        slot->store.reset();
        slot_lock.unlock();

        release_slot(owner_id, slot);
        return existed;
    }
}

size_t MemoryEngine::evict_idle(uint64_t max_idle_seconds) {
    std::vector<std::pair<std::string, std::shared_ptr<OwnerSlot>>> slots;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        slots.assign(owners_.begin(), owners_.end());
    }

    uint64_t ts = now();
    size_t evicted = 0;
    for (const auto& [owner_id, slot] : slots) {
        {
            std::unique_lock<std::mutex> slot_lock(slot->mutex, std::try_to_lock);
            if (!slot_lock.owns_lock() || slot->retired || ts < slot->last_active ||
                ts - slot->last_active <= max_idle_seconds) {
                continue;
            }
            // Keep it resident rather than lose unsaved state
            if (slot->store && !save(*slot->store)) continue;
            slot->retired = true;
            slot->store.reset();
        }
        release_slot(owner_id, slot);
        evicted++;
    }

    if (evicted > 0) {
        std::cerr << "[engine] Unloaded " << evicted << " idle owner(s)\n";
    }
    return evicted;
}

bool MemoryEngine::flush(const std::string& owner_id) {
    std::shared_ptr<OwnerSlot> slot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = owners_.find(owner_id);
        if (it == owners_.end()) return true;
        slot = it->second;
    }
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->retired || !slot->store) return true;
    return save(*slot->store);
}

bool MemoryEngine::flush_all() {
    bool ok = true;
    for (const auto& owner_id : loaded_owners()) {
        if (!flush(owner_id)) ok = false;
    }
    return ok;
}

std::vector<std::string> MemoryEngine::loaded_owners() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    ids.reserve(owners_.size());
    for (const auto& [id, _] : owners_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace kairos
