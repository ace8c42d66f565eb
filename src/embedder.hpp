#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace kairos {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface.
// Implementations return an empty vector when the embedding is unavailable;
// callers treat that as "no semantic signal", never as an error.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace kairos
