#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedding_backend.hpp"
#include "telemetry.hpp"

// Turns text into fixed-dimension vectors.
//
// The backend is initialized lazily on first use, exactly once even under
// concurrent first calls. If there is no backend, or initialize() throws, the
// provider switches to fallback mode for the rest of its life: each text maps
// to a deterministic pseudo-random unit vector derived from its hash. Fallback
// status is visible through is_fallback().
class EmbeddingProvider {
public:
    EmbeddingProvider(EmbeddingConfig config,
                      std::unique_ptr<EmbeddingBackend> backend,
                      std::shared_ptr<TelemetrySink> telemetry = nullptr);

    EmbeddingProvider(const EmbeddingProvider&) = delete;
    EmbeddingProvider& operator=(const EmbeddingProvider&) = delete;

    // Processes inputs in batch_size chunks and concatenates the results.
    // Throws EmbeddingError if an initialized backend fails.
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          const std::string& trace_id = "");

    std::vector<float> embed_one(const std::string& text, const std::string& trace_id = "");

    size_t dimension();
    bool is_fallback();

    // Backend name, or "fallback"
    std::string backend_name();
    const std::string& model_name() const { return config_.model; }

    // Never triggers initialization: "uninitialized", "ready" or "fallback"
    bool initialized() const { return initialized_.load(); }
    std::string status() const;

    static std::vector<float> fallback_vector(const std::string& text, size_t dim);

private:
    void ensure_initialized();

    EmbeddingConfig config_;
    std::unique_ptr<EmbeddingBackend> backend_;
    std::shared_ptr<TelemetrySink> telemetry_;

    std::once_flag init_flag_;
    std::atomic<bool> initialized_{false};
    bool fallback_ = false;
    size_t dimension_ = 0;
};
