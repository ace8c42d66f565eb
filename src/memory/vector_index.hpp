#pragma once
#include "../memory.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kairos {

struct IndexMetadata {
    std::string owner_id;
    MemoryKind kind = MemoryKind::LongTerm;
    uint64_t created_at = 0;
};

// Restricts a search to entries matching every set field.
struct SearchFilter {
    std::optional<std::string> owner_id;
    std::optional<MemoryKind> kind;
};

struct SearchHit {
    std::string id;
    double similarity = 0.0;
    IndexMetadata metadata;
};

struct SearchResult {
    std::vector<SearchHit> hits;
    uint32_t dimension_mismatches = 0; // candidates skipped by this search
};

// Exact (brute-force) cosine index over one owner's memories.
// Not internally synchronized; the owning store's lock covers it.
class VectorIndex {
public:
    // dimensions == 0 adopts the length of the first non-empty embedding.
    explicit VectorIndex(uint32_t dimensions = 0);

    // Insert or overwrite. An overwritten id keeps its insertion position.
    // Embeddings may be empty (non-semantic kinds); they score similarity 0.
    void insert(const std::string& id, Embedding embedding, IndexMetadata metadata);

    // Remove an entry. Returns false (no-op) if absent.
    bool remove(const std::string& id);

    // Top-k entries matching `filter`, sorted by similarity desc, then
    // created_at desc, then insertion order. An empty query scores every
    // candidate 0. A non-empty query whose length differs from a non-empty
    // stored embedding excludes that candidate and counts a mismatch.
    SearchResult search(const Embedding& query, size_t k,
                        const SearchFilter& filter = {}) const;

    bool contains(const std::string& id) const;
    size_t size() const { return entries_.size(); }
    uint32_t dimensions() const { return dimensions_; }

    // Cumulative mismatches over every search on this index.
    uint64_t total_dimension_mismatches() const {
        return total_mismatches_.load(std::memory_order_relaxed);
    }

    void clear();

private:
    struct Entry {
        std::string id;
        Embedding embedding;
        IndexMetadata metadata;
        uint64_t seq = 0;
    };

    void rebuild_index();

    uint32_t dimensions_;
    uint64_t next_seq_ = 0;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> id_index_; // id -> entries_ index
    mutable std::atomic<uint64_t> total_mismatches_{0};
};

} // namespace kairos
