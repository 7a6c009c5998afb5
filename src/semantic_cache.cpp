#include "semantic_cache.hpp"
#include "errors.hpp"
#include "snapshot_io.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;
using json = nlohmann::json;

json CacheEntry::to_json() const {
    return {
        {"query", query},
        {"generated_query", generated_query},
        {"result_payload", result_payload},
        {"answer", answer},
        {"embedding", embedding},
        {"created_at", created_at}
    };
}

CacheEntry CacheEntry::from_json(const json& j) {
    CacheEntry e;
    e.query = j.at("query").get<std::string>();
    e.generated_query = j.value("generated_query", std::string());
    e.result_payload = j.value("result_payload", json());
    e.answer = j.value("answer", std::string());
    e.embedding = j.at("embedding").get<std::vector<float>>();
    e.created_at = j.value("created_at", 0.0);
    return e;
}

const char* to_string(StoreOutcome outcome) {
    switch (outcome) {
        case StoreOutcome::Stored: return "stored";
        case StoreOutcome::AlreadyCached: return "already_cached";
        case StoreOutcome::StoredNotPersisted: return "stored_not_persisted";
    }
    return "unknown";
}

SemanticCache::SemanticCache(std::shared_ptr<EmbeddingProvider> embedder,
                             CacheConfig config,
                             std::shared_ptr<TelemetrySink> telemetry)
    : embedder_(std::move(embedder)),
      config_(std::move(config)),
      telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {
    if (!embedder_) {
        throw EmbeddingError("SemanticCache needs an embedding provider");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    load_locked();
}

bool SemanticCache::expired(const CacheEntry& entry, double now) const {
    return config_.ttl_sec > 0.0 && now - entry.created_at > config_.ttl_sec;
}

std::optional<CacheHit> SemanticCache::best_match_locked(const std::vector<float>& query_vector,
                                                         double now) const {
    float query_norm = compute_norm(query_vector.data(), static_cast<uint32_t>(query_vector.size()));
    if (query_norm == 0.0f) {
        return std::nullopt;
    }

    float best_score = -2.0f;
    size_t best = entries_.size();
    for (size_t i = 0; i < entries_.size(); i++) {
        const CacheEntry& entry = entries_[i];
        if (entry.embedding.size() != query_vector.size() || norms_[i] == 0.0f || expired(entry, now)) {
            continue;
        }
        float dot = 0.0f;
        for (size_t j = 0; j < query_vector.size(); j++) {
            dot += query_vector[j] * entry.embedding[j];
        }
        float score = dot / (query_norm * norms_[i]);
        if (score > best_score) {
            best_score = score;
            best = i;
        }
    }

    if (best == entries_.size() || best_score < config_.threshold) {
        return std::nullopt;
    }
    return CacheHit{entries_[best], best_score};
}

std::optional<CacheHit> SemanticCache::lookup(const std::string& query, const std::string& trace_id) const {
    Timer timer;
    if (size() == 0) {
        telemetry_->record("cache.lookup", timer.elapsed_ms(), trace_id, {{"hit", false}, {"similarity", 0.0}});
        return std::nullopt;
    }

    std::vector<float> query_vector = embedder_->embed_one(query, trace_id);

    std::optional<CacheHit> hit;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        hit = best_match_locked(query_vector, unix_time_now());
    }

    telemetry_->record("cache.lookup", timer.elapsed_ms(), trace_id,
                       {{"hit", hit.has_value()},
                        {"similarity", hit ? round_to(hit->similarity, 4) : 0.0}});
    if (hit) {
        LOG_INFO("Cache hit: '" + query + "' ~= '" + hit->entry.query + "' (score " +
                 std::to_string(hit->similarity) + ")");
    }
    return hit;
}

StoreOutcome SemanticCache::store(const std::string& query,
                                  const std::string& generated_query,
                                  const json& result_payload,
                                  const std::string& answer,
                                  const std::string& trace_id) {
    Timer timer;
    std::vector<float> query_vector = embedder_->embed_one(query, trace_id);

    StoreOutcome outcome;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        double now = unix_time_now();

        if (best_match_locked(query_vector, now)) {
            outcome = StoreOutcome::AlreadyCached;
        } else {
            CacheEntry entry;
            entry.query = query;
            entry.generated_query = generated_query;
            entry.result_payload = result_payload;
            entry.answer = answer;
            entry.embedding = query_vector;
            entry.created_at = now;

            norms_.push_back(compute_norm(entry.embedding.data(), static_cast<uint32_t>(entry.embedding.size())));
            entries_.push_back(std::move(entry));
            evict_locked(now);

            outcome = persist_locked() ? StoreOutcome::Stored : StoreOutcome::StoredNotPersisted;
        }
    }

    telemetry_->record("cache.store", timer.elapsed_ms(), trace_id, {{"outcome", to_string(outcome)}});
    if (outcome != StoreOutcome::AlreadyCached) {
        LOG_INFO("Cached new query: '" + query + "'");
    }
    return outcome;
}

void SemanticCache::evict_locked(double now) {
    size_t drop = 0;
    if (config_.ttl_sec > 0.0) {
        // Entries are appended in creation order, so expired ones form a prefix
        while (drop < entries_.size() && expired(entries_[drop], now)) drop++;
    }
    if (config_.capacity > 0 && entries_.size() - drop > config_.capacity) {
        drop = entries_.size() - config_.capacity;
    }
    if (drop > 0) {
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(drop));
        norms_.erase(norms_.begin(), norms_.begin() + static_cast<std::ptrdiff_t>(drop));
        LOG_DEBUG("Evicted " + std::to_string(drop) + " cache entries");
    }
}

bool SemanticCache::persist_locked() const {
    if (config_.path.empty()) {
        return true;
    }

    try {
        fs::path target(config_.path);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }

        json data = json::array();
        for (const auto& e : entries_) {
            data.push_back(e.to_json());
        }

        std::string tmp_path = config_.path + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                LOG_WARN("Failed to persist cache: cannot open " + tmp_path);
                return false;
            }
            out << data.dump();
            out.flush();
            if (out.fail()) {
                LOG_WARN("Failed to persist cache: write error on " + tmp_path);
                return false;
            }
        }
        fs::rename(tmp_path, target);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to persist cache to " + config_.path + ": " + e.what());
        return false;
    }
    return true;
}

size_t SemanticCache::load_locked() {
    entries_.clear();
    norms_.clear();

    if (config_.path.empty() || !fs::exists(config_.path)) {
        return 0;
    }

    try {
        std::ifstream f(config_.path);
        if (!f.is_open()) {
            LOG_WARN("Failed to open cache file: " + config_.path);
            return 0;
        }
        json data = json::parse(f);
        if (!data.is_array()) {
            LOG_WARN("Cache file is not an array, ignoring: " + config_.path);
            return 0;
        }
        for (const auto& item : data) {
            entries_.push_back(CacheEntry::from_json(item));
        }
    } catch (const std::exception& e) {
        entries_.clear();
        LOG_WARN("Failed to load cache from " + config_.path + ": " + e.what());
        return 0;
    }

    for (const auto& e : entries_) {
        norms_.push_back(compute_norm(e.embedding.data(), static_cast<uint32_t>(e.embedding.size())));
    }
    evict_locked(unix_time_now());

    LOG_INFO("Loaded " + std::to_string(entries_.size()) + " cached queries.");
    return entries_.size();
}

size_t SemanticCache::reload() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return load_locked();
}

size_t SemanticCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool SemanticCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    norms_.clear();
    return persist_locked();
}

float SemanticCache::threshold() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_.threshold;
}

void SemanticCache::set_threshold(float threshold) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_.threshold = threshold;
}
