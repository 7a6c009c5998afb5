#pragma once

#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

// A real text-to-vector model. Called only through EmbeddingProvider.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    // Loads or checks the model and returns its output dimension.
    // Throws EmbeddingError when the model is unavailable.
    virtual size_t initialize() = 0;

    // One vector per input, in order. Throws EmbeddingError.
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;

    virtual std::string name() const = 0;
};

// "ollama" builds the HTTP backend; "none" returns nullptr (fallback only).
// Unknown names log a warning and return nullptr.
std::unique_ptr<EmbeddingBackend> create_embedding_backend(const EmbeddingConfig& config);
