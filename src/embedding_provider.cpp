#include "embedding_provider.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace {

uint64_t fnv1a_64(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

}

EmbeddingProvider::EmbeddingProvider(EmbeddingConfig config,
                                     std::unique_ptr<EmbeddingBackend> backend,
                                     std::shared_ptr<TelemetrySink> telemetry)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {
    if (config_.batch_size == 0) config_.batch_size = 1;
}

void EmbeddingProvider::ensure_initialized() {
    std::call_once(init_flag_, [this]() {
        if (!backend_) {
            fallback_ = true;
            dimension_ = config_.fallback_dimension;
            LOG_WARN("No embedding backend configured, using fallback embeddings (dim=" +
                     std::to_string(dimension_) + ")");
            initialized_ = true;
            return;
        }

        Timer timer;
        try {
            dimension_ = backend_->initialize();
            if (dimension_ == 0) {
                throw EmbeddingError("Embedding backend reported dimension 0");
            }
            fallback_ = false;
        } catch (const std::exception& e) {
            fallback_ = true;
            dimension_ = config_.fallback_dimension;
            LOG_WARN("Embedding backend '" + backend_->name() + "' unavailable (" + e.what() +
                     "), using fallback embeddings (dim=" + std::to_string(dimension_) + ")");
        }
        telemetry_->record("embedding_init", timer.elapsed_ms(), "",
                           {{"backend", fallback_ ? std::string("fallback") : backend_->name()},
                            {"dim", dimension_}});
        initialized_ = true;
    });
}

std::string EmbeddingProvider::status() const {
    if (!initialized_) {
        return "uninitialized";
    }
    return fallback_ ? "fallback" : "ready";
}

size_t EmbeddingProvider::dimension() {
    ensure_initialized();
    return dimension_;
}

bool EmbeddingProvider::is_fallback() {
    ensure_initialized();
    return fallback_;
}

std::string EmbeddingProvider::backend_name() {
    ensure_initialized();
    return fallback_ ? "fallback" : backend_->name();
}

std::vector<std::vector<float>> EmbeddingProvider::embed(const std::vector<std::string>& texts,
                                                         const std::string& trace_id) {
    ensure_initialized();

    std::vector<std::vector<float>> out;
    if (texts.empty()) return out;
    out.reserve(texts.size());

    Timer timer;
    for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
        size_t end = std::min(texts.size(), start + config_.batch_size);

        if (fallback_) {
            for (size_t i = start; i < end; i++) {
                out.push_back(fallback_vector(texts[i], dimension_));
            }
            continue;
        }

        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);
        auto vectors = backend_->embed_batch(batch);
        if (vectors.size() != batch.size()) {
            throw EmbeddingError("Embedding backend returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(batch.size()) + " inputs");
        }
        for (auto& v : vectors) {
            if (v.size() != dimension_) {
                throw EmbeddingError("Embedding backend changed dimension: expected " +
                                     std::to_string(dimension_) + ", got " + std::to_string(v.size()));
            }
            out.push_back(std::move(v));
        }
    }

    telemetry_->record("embedding", timer.elapsed_ms(), trace_id,
                       {{"count", texts.size()}, {"model", config_.model}, {"fallback", fallback_}});
    return out;
}

std::vector<float> EmbeddingProvider::embed_one(const std::string& text, const std::string& trace_id) {
    return embed(std::vector<std::string>{text}, trace_id).front();
}

std::vector<float> EmbeddingProvider::fallback_vector(const std::string& text, size_t dim) {
    std::mt19937_64 rng(fnv1a_64(text));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    std::vector<float> v(dim);
    double sum_squares = 0.0;
    for (size_t i = 0; i < dim; i++) {
        v[i] = dist(rng);
        sum_squares += static_cast<double>(v[i]) * v[i];
    }

    if (sum_squares == 0.0) {
        if (dim > 0) v[0] = 1.0f;
        return v;
    }
    float inv = static_cast<float>(1.0 / std::sqrt(sum_squares));
    for (auto& x : v) x *= inv;
    return v;
}
