#pragma once
#include "../memory.hpp"
#include "vector_index.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kairos {

struct StoreLimits {
    uint32_t max_conversations = 100;
    uint32_t max_emotional_states = 50;
};

// Everything persisted for one owner.
struct StoreSnapshot {
    std::string owner_id;
    std::vector<Memory> memories; // insertion order
};

// All memories of a single owner plus their vector index.
// Not internally synchronized: MemoryEngine holds the owner lock around every
// call, including read-then-mutate sequences.
class OwnerStore {
public:
    OwnerStore(std::string owner_id, StoreLimits limits);

    const std::string& owner_id() const { return owner_id_; }

    // Insert or replace by id and return the id (generated when empty).
    // Replacing keeps created_at, last_accessed_at and access_count.
    // Values are normalized; bounded kinds evict their oldest records.
    // Returns an empty string (and stores nothing) for another owner's memory.
    std::string put(Memory memory, uint64_t now);

    // Remove a memory. Returns false if absent.
    bool remove(const std::string& id);

    const Memory* find(const std::string& id) const;

    // Memories of one kind, in insertion order.
    std::vector<const Memory*> by_kind(MemoryKind kind) const;

    size_t size() const { return records_.size(); }
    size_t count(MemoryKind kind) const;

    // Bump access_count and last_accessed_at once per distinct id.
    void touch(const std::vector<std::string>& ids, uint64_t now);

    // Merge a topic pattern occurrence into `merge_into` when it names an
    // existing TopicPattern, otherwise store a new pattern with frequency 1.
    // Runs the duplicate merge pass afterwards. Returns the pattern id.
    std::string apply_topic_pattern(const std::vector<std::string>& topics,
                                    const std::string& emotion,
                                    const std::string& conversation_id,
                                    const std::optional<std::string>& merge_into,
                                    uint64_t now);

    // Fold TopicPatterns that share a topic and emotion into the earliest one.
    // Returns the number of records folded away.
    uint32_t merge_duplicate_patterns();

    const VectorIndex& index() const { return index_; }

    StoreSnapshot snapshot() const;

    // Replace the contents with a snapshot's memories (other owners' records
    // are skipped), then evict and merge as if freshly written.
    void restore(const StoreSnapshot& snapshot, uint64_t now);

private:
    void rebuild_id_index();
    void evict_oldest(MemoryKind kind, uint32_t cap);
    void erase_positions(std::vector<size_t> positions);

    std::string owner_id_;
    StoreLimits limits_;
    std::vector<Memory> records_;
    std::unordered_map<std::string, size_t> id_index_; // id -> records_ index
    VectorIndex index_;
};

} // namespace kairos
