#include "owner_store.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace kairos {

OwnerStore::OwnerStore(std::string owner_id, StoreLimits limits)
    : owner_id_(std::move(owner_id)), limits_(limits) {}

void OwnerStore::rebuild_id_index() {
    id_index_.clear();
    id_index_.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        id_index_[records_[i].id] = i;
    }
}

std::string OwnerStore::put(Memory memory, uint64_t now) {
    if (memory.owner_id.empty()) {
        memory.owner_id = owner_id_;
    } else if (memory.owner_id != owner_id_) {
        std::cerr << "[store] Refusing memory owned by " << memory.owner_id
                  << " in store of " << owner_id_ << "\n";
        return {};
    }
    if (memory.id.empty()) memory.id = generate_id(kind_id_prefix(memory.kind));

    auto it = id_index_.find(memory.id);
    if (it != id_index_.end()) {
        const Memory& existing = records_[it->second];
        memory.created_at = existing.created_at;
        memory.last_accessed_at = existing.last_accessed_at;
        memory.access_count = existing.access_count;
    } else {
        if (memory.created_at == 0) memory.created_at = now;
        if (memory.last_accessed_at == 0) memory.last_accessed_at = memory.created_at;
    }
    normalize_memory(memory);

    std::string id = memory.id;
    MemoryKind kind = memory.kind;
    index_.insert(id, memory.embedding, {owner_id_, kind, memory.created_at});

    if (it != id_index_.end()) {
        records_[it->second] = std::move(memory);
    } else {
        id_index_[id] = records_.size();
        records_.push_back(std::move(memory));
    }

    if (kind == MemoryKind::Conversation) {
        evict_oldest(kind, limits_.max_conversations);
    } else if (kind == MemoryKind::EmotionalState) {
        evict_oldest(kind, limits_.max_emotional_states);
    }
    return id;
}

void OwnerStore::erase_positions(std::vector<size_t> positions) {
    // Erase back to front so earlier positions stay valid
    std::sort(positions.begin(), positions.end(), std::greater<size_t>());
    for (size_t pos : positions) {
        index_.remove(records_[pos].id);
        records_.erase(records_.begin() + static_cast<ptrdiff_t>(pos));
    }
    rebuild_id_index();
}

void OwnerStore::evict_oldest(MemoryKind kind, uint32_t cap) {
    std::vector<size_t> positions;
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].kind == kind) positions.push_back(i);
    }
    if (positions.size() <= cap) return;

    // Oldest first; equal timestamps keep insertion order
    std::stable_sort(positions.begin(), positions.end(), [this](size_t a, size_t b) {
        return records_[a].created_at < records_[b].created_at;
    });
    positions.resize(positions.size() - cap);
    erase_positions(std::move(positions));
}

bool OwnerStore::remove(const std::string& id) {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return false;
    erase_positions({it->second});
    return true;
}

const Memory* OwnerStore::find(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return nullptr;
    return &records_[it->second];
}

std::vector<const Memory*> OwnerStore::by_kind(MemoryKind kind) const {
    std::vector<const Memory*> out;
    for (const auto& m : records_) {
        if (m.kind == kind) out.push_back(&m);
    }
    return out;
}

size_t OwnerStore::count(MemoryKind kind) const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [kind](const Memory& m) { return m.kind == kind; }));
}

void OwnerStore::touch(const std::vector<std::string>& ids, uint64_t now) {
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        auto it = id_index_.find(id);
        if (it == id_index_.end()) continue;

        auto& m = records_[it->second];
        m.access_count++;
        m.last_accessed_at = std::max(now, m.created_at);
    }
}

std::string OwnerStore::apply_topic_pattern(const std::vector<std::string>& topics,
                                            const std::string& emotion,
                                            const std::string& conversation_id,
                                            const std::optional<std::string>& merge_into,
                                            uint64_t now) {
    if (merge_into) {
        auto it = id_index_.find(*merge_into);
        if (it != id_index_.end() && records_[it->second].kind == MemoryKind::TopicPattern) {
            auto& pattern = records_[it->second];
            pattern.frequency++;
            if (!conversation_id.empty()) {
                pattern.related_conversations.push_back(conversation_id);
            }
            merge_duplicate_patterns();
            return pattern.id;
        }
    }

    Memory pattern;
    pattern.kind = MemoryKind::TopicPattern;
    pattern.topics = topics;
    pattern.emotion = emotion;
    pattern.frequency = 1;
    if (!conversation_id.empty()) pattern.related_conversations.push_back(conversation_id);
    std::string id = put(std::move(pattern), now);

    merge_duplicate_patterns();
    // The new pattern may have been folded into an older one
    if (find(id)) return id;
    for (const Memory* p : by_kind(MemoryKind::TopicPattern)) {
        if (p->emotion == emotion &&
            std::find_first_of(p->topics.begin(), p->topics.end(),
                               topics.begin(), topics.end()) != p->topics.end()) {
            return p->id;
        }
    }
    return id;
}

uint32_t OwnerStore::merge_duplicate_patterns() {
    std::vector<size_t> doomed;
    std::vector<size_t> keepers;

    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].kind != MemoryKind::TopicPattern) continue;
        auto& candidate = records_[i];

        bool folded = false;
        for (size_t k : keepers) {
            auto& keeper = records_[k];
            if (keeper.emotion != candidate.emotion) continue;
            bool shared = std::find_first_of(keeper.topics.begin(), keeper.topics.end(),
                                             candidate.topics.begin(),
                                             candidate.topics.end()) != keeper.topics.end();
            if (!shared) continue;

            keeper.frequency += candidate.frequency;
            keeper.related_conversations.insert(keeper.related_conversations.end(),
                                                candidate.related_conversations.begin(),
                                                candidate.related_conversations.end());
            folded = true;
            break;
        }

        if (folded) {
            doomed.push_back(i);
        } else {
            keepers.push_back(i);
        }
    }

    if (doomed.empty()) return 0;
    auto merged = static_cast<uint32_t>(doomed.size());
    erase_positions(std::move(doomed));
    return merged;
}

StoreSnapshot OwnerStore::snapshot() const {
    return StoreSnapshot{owner_id_, records_};
}

void OwnerStore::restore(const StoreSnapshot& snapshot, uint64_t now) {
    records_.clear();
    id_index_.clear();
    index_.clear();

    for (const auto& m : snapshot.memories) {
        if (!m.owner_id.empty() && m.owner_id != owner_id_) continue;
        put(m, now);
    }

    uint32_t merged = merge_duplicate_patterns();
    if (merged > 0) {
        std::cerr << "[store] Merged " << merged << " duplicate topic patterns for "
                  << owner_id_ << "\n";
    }
}

} // namespace kairos
