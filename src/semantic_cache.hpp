#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "embedding_provider.hpp"
#include "telemetry.hpp"

// A previously answered query. Never mutated after creation.
struct CacheEntry {
    std::string query;
    std::string generated_query;
    nlohmann::json result_payload;
    std::string answer;
    std::vector<float> embedding;
    double created_at = 0.0;   // Unix seconds

    nlohmann::json to_json() const;
    static CacheEntry from_json(const nlohmann::json& j);
};

struct CacheHit {
    CacheEntry entry;
    float similarity;
};

enum class StoreOutcome {
    Stored,
    AlreadyCached,        // a near-duplicate was already present; nothing changed
    StoredNotPersisted,   // kept in memory, but the file write failed
};

const char* to_string(StoreOutcome outcome);

// Cache keyed by embedding similarity instead of exact text.
//
// lookup returns the most similar live entry when its cosine similarity is at
// least the threshold. store skips queries that would already hit, otherwise
// appends and rewrites the backing file. Capacity evicts the oldest entries;
// a ttl hides and prunes entries older than ttl_sec.
class SemanticCache {
public:
    SemanticCache(std::shared_ptr<EmbeddingProvider> embedder,
                  CacheConfig config = CacheConfig(),
                  std::shared_ptr<TelemetrySink> telemetry = nullptr);

    SemanticCache(const SemanticCache&) = delete;
    SemanticCache& operator=(const SemanticCache&) = delete;

    std::optional<CacheHit> lookup(const std::string& query, const std::string& trace_id = "") const;

    StoreOutcome store(const std::string& query,
                       const std::string& generated_query,
                       const nlohmann::json& result_payload,
                       const std::string& answer,
                       const std::string& trace_id = "");

    size_t size() const;

    // false when the emptied cache could not be written back
    bool clear();

    float threshold() const;
    void set_threshold(float threshold);

    const std::string& path() const { return config_.path; }

    // Replaces entries from the backing file; returns the number loaded.
    // A missing or unreadable file leaves the cache empty.
    size_t reload();

private:
    std::optional<CacheHit> best_match_locked(const std::vector<float>& query_vector, double now) const;
    bool expired(const CacheEntry& entry, double now) const;
    void evict_locked(double now);
    bool persist_locked() const;
    size_t load_locked();

    std::shared_ptr<EmbeddingProvider> embedder_;
    CacheConfig config_;
    std::shared_ptr<TelemetrySink> telemetry_;

    mutable std::shared_mutex mutex_;
    std::vector<CacheEntry> entries_;   // oldest first
    std::vector<float> norms_;          // L2 norm of each entry embedding
};
