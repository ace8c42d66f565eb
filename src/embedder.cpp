#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace kairos {

static std::string or_default(const std::string& value, const char* fallback) {
    return value.empty() ? fallback : value;
}

static EmbeddingEndpoint openai_endpoint(const EmbeddingConfig& emb) {
    EmbeddingEndpoint ep;
    ep.name = "openai";
    ep.url = or_default(emb.base_url, "https://api.openai.com/v1") + "/embeddings";
    ep.api_key = emb.api_key;
    ep.model = or_default(emb.model, "text-embedding-3-small");
    ep.vector_pointer = "/data/0/embedding";
    ep.default_dims = 1536;
    return ep;
}

static EmbeddingEndpoint ollama_endpoint(const EmbeddingConfig& emb) {
    EmbeddingEndpoint ep;
    ep.name = "ollama";
    ep.url = or_default(emb.base_url, "http://localhost:11434") + "/api/embed";
    ep.model = or_default(emb.model, "nomic-embed-text");
    ep.vector_pointer = "/embeddings/0";
    ep.default_dims = 768;
    return ep;
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;

    // Resolve provider: explicit config, or auto-detect from an API key
    std::string provider = emb.provider;
    if (provider.empty() && !emb.api_key.empty()) {
        provider = "openai";
        std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
    }
    if (provider.empty() || provider == "none") return nullptr;

    if (provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return std::make_unique<HttpEmbedder>(openai_endpoint(emb), http);
    }

    if (provider == "ollama") {
        return std::make_unique<HttpEmbedder>(ollama_endpoint(emb), http);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace kairos
