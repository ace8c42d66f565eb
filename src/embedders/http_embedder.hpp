#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace kairos {

// Where and how to ask for an embedding.
struct EmbeddingEndpoint {
    std::string name;            // reported by embedder_name()
    std::string url;             // full request URL
    std::string api_key;         // empty = no Authorization header
    std::string model;
    std::string vector_pointer;  // JSON pointer to the float array in the reply
    uint32_t default_dims = 0;   // reported until the first good reply
    long timeout_seconds = 30;
};

// Float array at `pointer` inside a reply body. Empty when the body is not
// JSON, the pointer is missing, or any element is not a number.
Embedding parse_embedding_reply(const std::string& body, const std::string& pointer);

// Embedder that POSTs {"model", "input"} to one endpoint.
// Safe to call from several threads if the HttpClient is.
class HttpEmbedder : public Embedder {
public:
    HttpEmbedder(EmbeddingEndpoint endpoint, HttpClient& http);

    // Empty on transport errors, non-200 replies and malformed bodies.
    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dimensions_.load(); }
    std::string embedder_name() const override { return endpoint_.name; }

    const EmbeddingEndpoint& endpoint() const { return endpoint_; }

private:
    std::vector<Header> request_headers() const;

    const EmbeddingEndpoint endpoint_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_;
};

} // namespace kairos
