#pragma once
#include "memory.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace kairos {

class OwnerStore;

// Keyword lookup over stored memories, independent of embeddings.
struct RecallQuery {
    std::string text;                  // case-insensitive substring; empty matches all
    std::vector<std::string> keywords; // when set, any keyword matching is enough
    std::vector<MemoryKind> kinds;     // empty = default_recall_kinds()
    uint64_t from = 0;                 // created_at lower bound, 0 = open
    uint64_t to = 0;                   // created_at upper bound, 0 = open
};

struct RecallMatch {
    Memory memory;
    int relevance = 0;
};

// Conversation, Fact, Preference, LifeEvent, EmotionalState.
const std::vector<MemoryKind>& default_recall_kinds();

// Lowercased text fields of a memory, space separated.
std::string searchable_text(const Memory& memory);

// +10 for the query text, +5 per keyword, +3/+2/+1 when younger than
// 1/7/30 days.
int recall_relevance(const Memory& memory, const RecallQuery& query, uint64_t now);

// Matches by descending relevance; ties keep kind order, then insertion order.
std::vector<RecallMatch> recall(const OwnerStore& store, const RecallQuery& query,
                                uint64_t now);

} // namespace kairos
