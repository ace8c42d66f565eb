#pragma once
#include "../embedder.hpp"
#include <string>

namespace kairos {

// Cosine similarity in [-1, 1]. Returns 0.0 if either vector is empty,
// zero-magnitude, or the lengths differ (callers that must tell a length
// mismatch apart from "no similarity" check sizes first).
double cosine_similarity(const Embedding& a, const Embedding& b);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const std::string& data);

} // namespace kairos
