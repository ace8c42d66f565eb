#include "vector.hpp"
#include <cmath>
#include <cstring>

namespace kairos {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12 || !std::isfinite(denom)) return 0.0;

    double sim = dot / denom;
    if (!std::isfinite(sim)) return 0.0;
    return sim;
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace kairos
