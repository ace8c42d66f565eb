#include "context.hpp"
#include "memory/owner_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>
#include <unordered_set>

namespace kairos {

static std::vector<const Memory*> oldest_first(std::vector<const Memory*> memories) {
    std::stable_sort(memories.begin(), memories.end(), [](const Memory* a, const Memory* b) {
        return a->created_at < b->created_at;
    });
    return memories;
}

std::optional<EmotionalTrend> emotional_trend(const std::vector<const Memory*>& states,
                                              uint32_t window, uint32_t min_states) {
    if (states.empty() || states.size() < min_states || window == 0) return std::nullopt;

    auto ordered = oldest_first(states);
    size_t begin = ordered.size() > window ? ordered.size() - window : 0;

    std::map<std::string, uint32_t> counts;
    for (size_t i = begin; i < ordered.size(); ++i) {
        counts[ordered[i]->emotion.empty() ? "neutral" : ordered[i]->emotion]++;
    }

    // Walk newest to oldest so the first emotion reaching the top count wins ties
    EmotionalTrend trend;
    for (size_t i = ordered.size(); i > begin; --i) {
        const Memory* m = ordered[i - 1];
        const std::string emotion = m->emotion.empty() ? "neutral" : m->emotion;
        if (counts[emotion] > trend.occurrences) {
            trend.dominant = emotion;
            trend.occurrences = counts[emotion];
        }
    }
    trend.window = static_cast<uint32_t>(ordered.size() - begin);
    trend.latest_id = ordered.back()->id;
    return trend;
}

std::vector<const Memory*> relevant_life_events(const std::vector<const Memory*>& events,
                                                const std::string& query_text,
                                                size_t limit) {
    std::unordered_set<std::string> query_words;
    for (auto& w : tokenize_words(query_text)) query_words.insert(std::move(w));
    if (query_words.empty() || limit == 0) return {};

    std::vector<const Memory*> matched;
    for (const Memory* event : oldest_first(events)) {
        auto words = tokenize_words(event->content);
        bool shared = std::any_of(words.begin(), words.end(),
            [&](const std::string& w) { return query_words.count(w) > 0; });
        if (shared) matched.push_back(event);
    }
    if (matched.size() > limit) {
        matched.erase(matched.begin(), matched.end() - static_cast<ptrdiff_t>(limit));
    }
    return matched;
}

ContextAssembler::ContextAssembler(ScoringWeights weights, ContextConfig config)
    : weights_(weights), config_(config) {}

namespace {

// Tracks emitted ids so no memory is surfaced twice.
class EntryWriter {
public:
    explicit EntryWriter(std::vector<ContextEntry>& out) : out_(out) {}

    bool claim(const std::string& id) { return emitted_.insert(id).second; }

    void emit(std::string text, MemoryKind kind, std::vector<std::string> ids) {
        out_.push_back({std::move(text), kind, std::move(ids)});
    }

    // One aggregate entry for every unclaimed memory in `items`.
    template <typename Format>
    void emit_joined(const std::string& label, MemoryKind kind,
                     const std::vector<const Memory*>& items, Format format) {
        std::vector<std::string> parts;
        std::vector<std::string> ids;
        for (const Memory* m : items) {
            if (!claim(m->id)) continue;
            parts.push_back(format(*m));
            ids.push_back(m->id);
        }
        if (parts.empty()) return;
        emit(label + ": " + join(parts, "; "), kind, std::move(ids));
    }

private:
    std::vector<ContextEntry>& out_;
    std::unordered_set<std::string> emitted_;
};

} // namespace

std::vector<ContextEntry> ContextAssembler::assemble(OwnerStore& store,
                                                     const std::string& query_text,
                                                     const Embedding& query_embedding,
                                                     size_t max_items, uint64_t now) const {
    std::vector<ContextEntry> out;
    EntryWriter writer(out);

    // 1. Conversations: vector candidates re-ranked by the full score
    std::vector<std::string> surfaced;
    if (max_items > 0) {
        SearchFilter filter;
        filter.owner_id = store.owner_id();
        filter.kind = MemoryKind::Conversation;
        auto result = store.index().search(query_embedding, config_.candidate_limit, filter);

        std::vector<const Memory*> candidates;
        candidates.reserve(result.hits.size());
        for (const auto& hit : result.hits) {
            if (const Memory* m = store.find(hit.id)) candidates.push_back(m);
        }

        for (const auto& scored : top_k_memories(query_embedding, candidates, max_items,
                                                 weights_, now)) {
            const Memory& m = *scored.memory;
            if (!writer.claim(m.id)) continue;
            std::string emotion = m.emotion.empty() ? "neutral" : m.emotion;
            writer.emit("Previous conversation (" + format_utc(m.created_at) +
                            ", emotion: " + emotion + "): " + m.content,
                        MemoryKind::Conversation, {m.id});
            surfaced.push_back(m.id);
        }
    }

    // 2. Emotional trend
    auto trend = emotional_trend(store.by_kind(MemoryKind::EmotionalState),
                                 config_.trend_window, config_.trend_min_states);
    if (trend && writer.claim(trend->latest_id)) {
        writer.emit("Recent emotional state: mostly " + trend->dominant + " (" +
                        std::to_string(trend->occurrences) + " of last " +
                        std::to_string(trend->window) + ")",
                    MemoryKind::EmotionalState, {trend->latest_id});
    }

    // 3. Life events related to the query
    for (const Memory* event : relevant_life_events(store.by_kind(MemoryKind::LifeEvent),
                                                    query_text, config_.max_life_events)) {
        if (!writer.claim(event->id)) continue;
        writer.emit("Life event (" + event->category + "): " + event->content,
                    MemoryKind::LifeEvent, {event->id});
    }

    // 4-8. Category stores, insertion order
    writer.emit_joined("Known facts", MemoryKind::Fact, store.by_kind(MemoryKind::Fact),
                       [](const Memory& m) { return m.content; });
    writer.emit_joined("Preferences", MemoryKind::Preference,
                       store.by_kind(MemoryKind::Preference),
                       [](const Memory& m) { return m.key + ": " + m.value; });
    writer.emit_joined("Relationships", MemoryKind::Relationship,
                       store.by_kind(MemoryKind::Relationship),
                       [](const Memory& m) { return m.key + " (" + m.value + ")"; });

    std::vector<const Memory*> active_goals;
    for (const Memory* g : store.by_kind(MemoryKind::Goal)) {
        if (g->status == "active") active_goals.push_back(g);
    }
    writer.emit_joined("Current goals", MemoryKind::Goal, active_goals,
                       [](const Memory& m) { return m.content; });
    writer.emit_joined("Interests", MemoryKind::Interest, store.by_kind(MemoryKind::Interest),
                       [](const Memory& m) { return m.content; });

    // Access updates last, after every read of the store
    store.touch(surfaced, now);
    return out;
}

} // namespace kairos
