#include "embedding_ollama.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void set_timeout_ms(httplib::Client& cli, int connect_ms, int read_ms) {
    cli.set_connection_timeout(connect_ms / 1000, (connect_ms % 1000) * 1000);
    cli.set_read_timeout(read_ms / 1000, (read_ms % 1000) * 1000);
}

}

OllamaEmbeddingBackend::OllamaEmbeddingBackend(const std::string& url, const std::string& model,
                                               int connect_timeout_ms, int read_timeout_ms)
    : url_(url), model_(model),
      connect_timeout_ms_(connect_timeout_ms), read_timeout_ms_(read_timeout_ms) {}

size_t OllamaEmbeddingBackend::initialize() {
    // The dimension check runs under the connect timeout so an absent server fails fast
    auto vectors = post_embed({"dimension check"}, connect_timeout_ms_);
    if (vectors.size() != 1 || vectors[0].empty()) {
        throw EmbeddingError("Embedding check returned no vector from " + url_);
    }
    LOG_INFO("Embedding backend ready: model=" + model_ + ", dim=" + std::to_string(vectors[0].size()));
    return vectors[0].size();
}

std::vector<std::vector<float>> OllamaEmbeddingBackend::embed_batch(const std::vector<std::string>& texts) {
    return post_embed(texts, read_timeout_ms_);
}

std::vector<std::vector<float>> OllamaEmbeddingBackend::post_embed(const std::vector<std::string>& texts,
                                                                   int read_timeout_ms) {
    httplib::Client cli(url_);
    set_timeout_ms(cli, connect_timeout_ms_, read_timeout_ms);

    json request = {
        {"model", model_},
        {"input", texts}
    };

    auto res = cli.Post("/api/embed", request.dump(), "application/json");
    if (!res) {
        throw EmbeddingError("Embedding request to " + url_ + " failed: " +
                             httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw EmbeddingError("Embedding request failed: HTTP " + std::to_string(res->status) +
                             ": " + res->body);
    }

    std::vector<std::vector<float>> vectors;
    try {
        auto body = json::parse(res->body);
        if (!body.contains("embeddings") || !body["embeddings"].is_array()) {
            throw EmbeddingError("Embedding response has no 'embeddings' array");
        }
        vectors = body["embeddings"].get<std::vector<std::vector<float>>>();
    } catch (const json::exception& e) {
        throw EmbeddingError("Failed to parse embedding response: " + std::string(e.what()));
    }

    if (vectors.size() != texts.size()) {
        throw EmbeddingError("Embedding response count mismatch: sent " + std::to_string(texts.size()) +
                             ", got " + std::to_string(vectors.size()));
    }
    return vectors;
}

std::unique_ptr<EmbeddingBackend> create_embedding_backend(const EmbeddingConfig& config) {
    if (config.backend == "ollama") {
        return std::make_unique<OllamaEmbeddingBackend>(
            config.url, config.model, config.init_timeout_ms, config.request_timeout_ms);
    }
    if (config.backend != "none") {
        LOG_WARN("Unknown embedding backend '" + config.backend + "', using fallback embeddings");
    }
    return nullptr;
}
