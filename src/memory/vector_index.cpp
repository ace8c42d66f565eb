#include "vector_index.hpp"
#include "vector.hpp"
#include <algorithm>
#include <iostream>

namespace kairos {

VectorIndex::VectorIndex(uint32_t dimensions) : dimensions_(dimensions) {}

void VectorIndex::rebuild_index() {
    id_index_.clear();
    id_index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        id_index_[entries_[i].id] = i;
    }
}

void VectorIndex::insert(const std::string& id, Embedding embedding, IndexMetadata metadata) {
    if (dimensions_ == 0 && !embedding.empty()) {
        dimensions_ = static_cast<uint32_t>(embedding.size());
    } else if (!embedding.empty() && embedding.size() != dimensions_) {
        std::cerr << "[vector_index] Embedding for " << id << " has " << embedding.size()
                  << " dimensions, index has " << dimensions_ << "\n";
    }

    auto it = id_index_.find(id);
    if (it != id_index_.end()) {
        auto& entry = entries_[it->second];
        entry.embedding = std::move(embedding);
        entry.metadata = std::move(metadata);
        return;
    }

    Entry entry;
    entry.id = id;
    entry.embedding = std::move(embedding);
    entry.metadata = std::move(metadata);
    entry.seq = next_seq_++;
    id_index_[id] = entries_.size();
    entries_.push_back(std::move(entry));
}

bool VectorIndex::remove(const std::string& id) {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return false;

    entries_.erase(entries_.begin() + static_cast<ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}

SearchResult VectorIndex::search(const Embedding& query, size_t k,
                                 const SearchFilter& filter) const {
    SearchResult result;
    if (k == 0) return result;

    struct Candidate {
        double similarity;
        const Entry* entry;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(entries_.size());

    for (const auto& entry : entries_) {
        if (filter.owner_id && entry.metadata.owner_id != *filter.owner_id) continue;
        if (filter.kind && entry.metadata.kind != *filter.kind) continue;

        if (!query.empty() && !entry.embedding.empty() &&
            query.size() != entry.embedding.size()) {
            result.dimension_mismatches++;
            continue;
        }
        candidates.push_back({cosine_similarity(query, entry.embedding), &entry});
    }

    if (result.dimension_mismatches > 0) {
        total_mismatches_.fetch_add(result.dimension_mismatches, std::memory_order_relaxed);
        std::cerr << "[vector_index] Skipped " << result.dimension_mismatches
                  << " entries: query has " << query.size() << " dimensions\n";
    }

    // partial_sort: only order the top-K; the comparator is total so the
    // result is deterministic.
    size_t n = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<ptrdiff_t>(n),
                      candidates.end(),
                      [](const Candidate& a, const Candidate& b) {
                          if (a.similarity != b.similarity) return a.similarity > b.similarity;
                          if (a.entry->metadata.created_at != b.entry->metadata.created_at) {
                              return a.entry->metadata.created_at > b.entry->metadata.created_at;
                          }
                          return a.entry->seq < b.entry->seq;
                      });

    result.hits.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.hits.push_back({candidates[i].entry->id, candidates[i].similarity,
                               candidates[i].entry->metadata});
    }
    return result;
}

bool VectorIndex::contains(const std::string& id) const {
    return id_index_.count(id) > 0;
}

void VectorIndex::clear() {
    entries_.clear();
    id_index_.clear();
}

} // namespace kairos
