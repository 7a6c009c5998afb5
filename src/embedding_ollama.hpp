#pragma once

#include "embedding_backend.hpp"
#include <string>

// Embedding model served by Ollama: POST /api/embed {"model", "input": [...]}
class OllamaEmbeddingBackend : public EmbeddingBackend {
public:
    OllamaEmbeddingBackend(const std::string& url, const std::string& model,
                           int connect_timeout_ms, int read_timeout_ms);

    size_t initialize() override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    std::string name() const override { return "ollama"; }

    const std::string& model() const { return model_; }

private:
    std::vector<std::vector<float>> post_embed(const std::vector<std::string>& texts, int read_timeout_ms);

    std::string url_;
    std::string model_;
    int connect_timeout_ms_;
    int read_timeout_ms_;
};
