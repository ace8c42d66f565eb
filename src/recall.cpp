#include "recall.hpp"
#include "util.hpp"
#include "memory/owner_store.hpp"
#include <algorithm>
#include <cctype>

namespace kairos {

static std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool contains_lower(const std::string& haystack, const std::string& needle) {
    return haystack.find(lowercase(needle)) != std::string::npos;
}

const std::vector<MemoryKind>& default_recall_kinds() {
    static const std::vector<MemoryKind> kinds = {
        MemoryKind::Conversation, MemoryKind::Fact, MemoryKind::Preference,
        MemoryKind::LifeEvent, MemoryKind::EmotionalState
    };
    return kinds;
}

std::string searchable_text(const Memory& memory) {
    std::vector<std::string> parts = {memory.content, memory.category, memory.key,
                                      memory.value, memory.status, memory.emotion};
    parts.insert(parts.end(), memory.secondary_emotions.begin(),
                 memory.secondary_emotions.end());
    parts.insert(parts.end(), memory.topics.begin(), memory.topics.end());
    parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());
    return lowercase(join(parts, " "));
}

static bool matches(const std::string& text, const RecallQuery& query) {
    if (!query.keywords.empty()) {
        return std::any_of(query.keywords.begin(), query.keywords.end(),
            [&](const std::string& k) { return contains_lower(text, k); });
    }
    return contains_lower(text, query.text);
}

static bool in_range(const Memory& memory, const RecallQuery& query) {
    if (query.from > 0 && memory.created_at < query.from) return false;
    if (query.to > 0 && memory.created_at > query.to) return false;
    return true;
}

int recall_relevance(const Memory& memory, const RecallQuery& query, uint64_t now) {
    std::string text = searchable_text(memory);
    int score = 0;
    if (!query.text.empty() && contains_lower(text, query.text)) score += 10;
    for (const auto& k : query.keywords) {
        if (contains_lower(text, k)) score += 5;
    }

    uint64_t age = now > memory.created_at ? now - memory.created_at : 0;
    if (age < kSecondsPerDay) score += 3;
    else if (age < 7 * kSecondsPerDay) score += 2;
    else if (age < 30 * kSecondsPerDay) score += 1;
    return score;
}

std::vector<RecallMatch> recall(const OwnerStore& store, const RecallQuery& query,
                                uint64_t now) {
    const auto& kinds = query.kinds.empty() ? default_recall_kinds() : query.kinds;

    std::vector<RecallMatch> out;
    std::vector<MemoryKind> seen;
    for (MemoryKind kind : kinds) {
        if (std::find(seen.begin(), seen.end(), kind) != seen.end()) continue;
        seen.push_back(kind);
        for (const Memory* m : store.by_kind(kind)) {
            if (!in_range(*m, query) || !matches(searchable_text(*m), query)) continue;
            out.push_back({*m, recall_relevance(*m, query, now)});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const RecallMatch& a, const RecallMatch& b) {
        return a.relevance > b.relevance;
    });
    return out;
}

} // namespace kairos
