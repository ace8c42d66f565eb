#include "scoring.hpp"
#include "memory/vector.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace kairos {

static double checked_weight(double value, double fallback, const char* name) {
    if (std::isfinite(value) && value >= 0.0 && value <= 1.0) return value;
    std::cerr << "[scoring] Invalid weight " << name << "=" << value
              << ", using default " << fallback << "\n";
    return fallback;
}

ScoringWeights validate_weights(const ScoringWeights& weights) {
    const ScoringWeights defaults;
    ScoringWeights out;
    out.alpha   = checked_weight(weights.alpha,   defaults.alpha,   "alpha");
    out.beta    = checked_weight(weights.beta,    defaults.beta,    "beta");
    out.gamma   = checked_weight(weights.gamma,   defaults.gamma,   "gamma");
    out.delta   = checked_weight(weights.delta,   defaults.delta,   "delta");
    out.epsilon = checked_weight(weights.epsilon, defaults.epsilon, "epsilon");
    return out;
}

double days_between(uint64_t then, uint64_t now) {
    if (then >= now) return 0.0;
    return static_cast<double>(now - then) / static_cast<double>(kSecondsPerDay);
}

double time_decay(double days_since_creation, double days_since_access) {
    double creation = std::max(0.0, days_since_creation);
    double access = std::max(0.0, days_since_access);
    return 0.7 * std::exp(-kDecayLambdaPerDay * creation) +
           0.3 * std::exp(-kDecayLambdaPerDay * access);
}

double access_frequency(uint32_t access_count, double days_since_creation) {
    double days = std::max(1.0, days_since_creation);
    double daily_rate = static_cast<double>(access_count) / days;
    return std::min(1.0, std::log(1.0 + daily_rate) / std::log(10.0));
}

double emotion_signal(double emotion_score) {
    double clamped = std::min(1.0, std::max(-1.0, emotion_score));
    return (clamped + 1.0) / 2.0;
}

ScoreResult score_memory(const Embedding& query, const Memory& memory,
                         const ScoringWeights& weights, uint64_t now) {
    ScoreResult r;

    r.signals.semantic = std::max(0.0, cosine_similarity(query, memory.embedding));

    double age_days = days_between(memory.created_at, now);
    uint64_t accessed = std::max(memory.last_accessed_at, memory.created_at);
    r.signals.time_decay = time_decay(age_days, days_between(accessed, now));

    r.signals.salience = std::isfinite(memory.salience) ? clamp01(memory.salience) : kDefaultSalience;
    r.signals.emotion = std::isfinite(memory.emotion_score) ? emotion_signal(memory.emotion_score) : 0.5;
    r.signals.access_frequency = access_frequency(memory.access_count, age_days);

    r.breakdown.semantic         = weights.alpha   * r.signals.semantic;
    r.breakdown.time_decay       = weights.beta    * r.signals.time_decay;
    r.breakdown.salience         = weights.gamma   * r.signals.salience;
    r.breakdown.emotion          = weights.delta   * r.signals.emotion;
    r.breakdown.access_frequency = weights.epsilon * r.signals.access_frequency;

    r.total = clamp01(r.breakdown.sum());
    return r;
}

std::vector<ScoredMemory> rank_memories(const Embedding& query,
                                        const std::vector<const Memory*>& memories,
                                        const ScoringWeights& weights, uint64_t now) {
    std::vector<ScoredMemory> scored;
    scored.reserve(memories.size());
    for (const Memory* m : memories) {
        if (!m) continue;
        scored.push_back({m, score_memory(query, *m, weights, now)});
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredMemory& a, const ScoredMemory& b) {
                         return a.score.total > b.score.total;
                     });
    return scored;
}

std::vector<ScoredMemory> top_k_memories(const Embedding& query,
                                         const std::vector<const Memory*>& memories,
                                         size_t k, const ScoringWeights& weights,
                                         uint64_t now) {
    auto ranked = rank_memories(query, memories, weights, now);
    if (ranked.size() > k) ranked.resize(k);
    return ranked;
}

ScoringStats compute_scoring_stats(const Embedding& query,
                                   const std::vector<const Memory*>& memories,
                                   const ScoringWeights& weights, uint64_t now) {
    ScoringStats stats;
    auto ranked = rank_memories(query, memories, weights, now);
    if (ranked.empty()) return stats;

    std::vector<double> totals;
    totals.reserve(ranked.size());
    double sum = 0.0;
    for (const auto& s : ranked) {
        double t = s.score.total;
        totals.push_back(t);
        sum += t;
        if (t > 0.7) {
            stats.distribution.high++;
        } else if (t > 0.3) {
            stats.distribution.medium++;
        } else {
            stats.distribution.low++;
        }
    }

    stats.count = static_cast<uint32_t>(totals.size());
    stats.mean = sum / static_cast<double>(totals.size());
    // ranked is descending
    stats.max = totals.front();
    stats.min = totals.back();

    size_t mid = totals.size() / 2;
    if (totals.size() % 2 == 1) {
        stats.median = totals[mid];
    } else {
        stats.median = (totals[mid - 1] + totals[mid]) / 2.0;
    }

    for (size_t i = 0; i < ranked.size() && i < 5; ++i) {
        stats.top_ids.push_back(ranked[i].memory->id);
    }
    return stats;
}

} // namespace kairos
