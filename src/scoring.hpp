#pragma once
#include "memory.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace kairos {

// Multi-signal relevance weights. They need not sum to 1; the total is
// clamped, not renormalized.
struct ScoringWeights {
    double alpha = 0.6;    // semantic similarity
    double beta = 0.2;     // time decay
    double gamma = 0.15;   // salience
    double delta = 0.05;   // emotion
    double epsilon = 0.1;  // access frequency
};

// Replace any weight that is non-finite or outside [0, 1] with its default,
// logging each replacement.
ScoringWeights validate_weights(const ScoringWeights& weights);

// Raw signals, each in [0, 1].
struct ScoreSignals {
    double semantic = 0.0;
    double time_decay = 0.0;
    double salience = 0.0;
    double emotion = 0.0;
    double access_frequency = 0.0;
};

// Weighted terms; their sum is the unclamped total.
struct ScoreBreakdown {
    double semantic = 0.0;
    double time_decay = 0.0;
    double salience = 0.0;
    double emotion = 0.0;
    double access_frequency = 0.0;

    double sum() const {
        return semantic + time_decay + salience + emotion + access_frequency;
    }
};

struct ScoreResult {
    double total = 0.0; // clamp01(breakdown.sum())
    ScoreSignals signals;
    ScoreBreakdown breakdown;
};

struct ScoredMemory {
    const Memory* memory = nullptr;
    ScoreResult score;
};

constexpr double kDecayLambdaPerDay = 0.1;

// 0.7 * e^(-lambda * days_since_creation) + 0.3 * e^(-lambda * days_since_access).
// Negative ages count as 0.
double time_decay(double days_since_creation, double days_since_access);

// min(1, ln(1 + access_count / max(1, days_since_creation)) / ln(10))
double access_frequency(uint32_t access_count, double days_since_creation);

// Maps emotion_score in [-1, 1] onto [0, 1].
double emotion_signal(double emotion_score);

// Days elapsed from `then` to `now` (epoch seconds), 0 if `then` is later.
double days_between(uint64_t then, uint64_t now);

// Score one memory against a query embedding at time `now`.
// An empty query (or memory embedding) contributes 0 semantic relevance.
ScoreResult score_memory(const Embedding& query, const Memory& memory,
                         const ScoringWeights& weights, uint64_t now);

// Score every memory and sort descending by total. Stable: equal totals keep
// their input order.
std::vector<ScoredMemory> rank_memories(const Embedding& query,
                                        const std::vector<const Memory*>& memories,
                                        const ScoringWeights& weights, uint64_t now);

// First k entries of rank_memories().
std::vector<ScoredMemory> top_k_memories(const Embedding& query,
                                         const std::vector<const Memory*>& memories,
                                         size_t k, const ScoringWeights& weights,
                                         uint64_t now);

struct ScoreDistribution {
    uint32_t high = 0;   // total > 0.7
    uint32_t medium = 0; // 0.3 < total <= 0.7
    uint32_t low = 0;    // total <= 0.3
};

struct ScoringStats {
    uint32_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    ScoreDistribution distribution;
    std::vector<std::string> top_ids; // up to 5, best first
};

// Aggregate scores for diagnostics. All fields are zero for an empty input.
ScoringStats compute_scoring_stats(const Embedding& query,
                                   const std::vector<const Memory*>& memories,
                                   const ScoringWeights& weights, uint64_t now);

} // namespace kairos
