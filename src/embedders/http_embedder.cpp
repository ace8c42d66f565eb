#include "http_embedder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace kairos {

Embedding parse_embedding_reply(const std::string& body, const std::string& pointer) {
    nlohmann::json reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded()) return {};

    nlohmann::json::json_pointer ptr(pointer);
    if (!reply.contains(ptr)) return {};
    const auto& values = reply.at(ptr);
    if (!values.is_array()) return {};

    Embedding out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (!v.is_number()) return {};
        out.push_back(v.get<float>());
    }
    return out;
}

HttpEmbedder::HttpEmbedder(EmbeddingEndpoint endpoint, HttpClient& http)
    : endpoint_(std::move(endpoint))
    , http_(http)
    , dimensions_(endpoint_.default_dims)
{}

std::vector<Header> HttpEmbedder::request_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!endpoint_.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + endpoint_.api_key);
    }
    return headers;
}

Embedding HttpEmbedder::embed(const std::string& text) {
    nlohmann::json request = {{"model", endpoint_.model}, {"input", text}};
    auto reply = http_.post(endpoint_.url, request.dump(), request_headers(),
                            endpoint_.timeout_seconds);
    if (reply.status_code != 200) {
        std::cerr << "[embedder] " << endpoint_.name << " returned HTTP "
                  << reply.status_code << "\n";
        return {};
    }

    Embedding embedding = parse_embedding_reply(reply.body, endpoint_.vector_pointer);
    if (embedding.empty()) {
        std::cerr << "[embedder] Malformed " << endpoint_.name << " reply\n";
        return {};
    }
    dimensions_.store(static_cast<uint32_t>(embedding.size()));
    return embedding;
}

} // namespace kairos
