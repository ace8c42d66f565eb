#pragma once
#include "config.hpp"
#include "memory.hpp"
#include "scoring.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kairos {

class OwnerStore;

// One line of assembled context plus the memories it was built from.
struct ContextEntry {
    std::string text;
    MemoryKind source_kind = MemoryKind::Conversation;
    std::vector<std::string> source_ids;
};

struct EmotionalTrend {
    std::string dominant;
    uint32_t occurrences = 0; // of `window` states
    uint32_t window = 0;
    std::string latest_id;    // most recent EmotionalState considered
};

// Dominant primary emotion over the last `window` states (ordered oldest
// first). Ties go to the emotion seen most recently. nullopt when fewer than
// `min_states` states exist.
std::optional<EmotionalTrend> emotional_trend(const std::vector<const Memory*>& states,
                                              uint32_t window, uint32_t min_states);

// LifeEvents sharing at least one word with `query_text`,
// oldest first, limited to the `limit` most recent.
std::vector<const Memory*> relevant_life_events(const std::vector<const Memory*>& events,
                                                const std::string& query_text,
                                                size_t limit);

// Builds the ordered context for a query:
//   Conversations (ranked), emotional trend, relevant life events, facts,
//   preferences, relationships, active goals, interests.
// Every surfaced Conversation is touched once. The caller holds the owner lock.
class ContextAssembler {
public:
    ContextAssembler(ScoringWeights weights, ContextConfig config);

    std::vector<ContextEntry> assemble(OwnerStore& store,
                                       const std::string& query_text,
                                       const Embedding& query_embedding,
                                       size_t max_items, uint64_t now) const;

private:
    ScoringWeights weights_;
    ContextConfig config_;
};

} // namespace kairos
