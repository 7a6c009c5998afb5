#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "embedding_provider.hpp"
#include "knn_bruteforce.hpp"
#include "metadata.hpp"
#include "telemetry.hpp"

// Ingestion input. Content is embedded unless a vector is supplied.
struct DocumentInput {
    std::string id;
    std::string content;
    Metadata metadata;
    std::optional<std::vector<float>> embedding;
};

// An indexed document. Immutable once inserted.
struct Document {
    std::string id;
    std::string content;
    std::vector<float> embedding;
    Metadata metadata;
};

struct SearchResult {
    std::string document_id;
    std::string content;
    float score = 0.0f;
    Metadata metadata;

    // Score rounded to 4 decimals
    nlohmann::json to_json() const;
};

// Corpus of documents answering nearest-neighbor queries.
//
// All vectors share the dimension of the first insert. Ids are unique.
// Results are ordered by score, ties broken by insertion order. Writers
// (add, delete, load, clear) hold an exclusive lock across the mutation and
// the rebuild of the search structure; readers share the lock.
class VectorIndex {
public:
    VectorIndex(std::shared_ptr<EmbeddingProvider> embedder,
                IndexConfig config = IndexConfig(),
                std::shared_ptr<TelemetrySink> telemetry = nullptr);

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Inserts all inputs or none. Throws DuplicateIdError if any id is already
    // indexed or repeats within the batch, DimensionMismatchError for a
    // supplied vector of the wrong length. Returns the number inserted.
    size_t add_documents(const std::vector<DocumentInput>& docs, const std::string& trace_id = "");

    // At most top_k results. Empty corpus or no match is an empty list.
    std::vector<SearchResult> search(const std::string& query, size_t top_k,
                                     const std::optional<MetaFilter>& filter = std::nullopt,
                                     const std::string& trace_id = "");

    std::vector<SearchResult> search_by_vector(const std::vector<float>& query, size_t top_k,
                                               const std::optional<MetaFilter>& filter = std::nullopt,
                                               const std::string& trace_id = "");

    // false when id is absent
    bool delete_document(const std::string& id, const std::string& trace_id = "");

    // Throws SnapshotIoError
    void save(const std::string& path) const;

    // false when path is missing. Throws CorruptSnapshotError for an unreadable
    // file, leaving the current contents untouched.
    bool load(const std::string& path);

    size_t count() const;
    void clear();

    bool contains(const std::string& id) const;
    std::optional<Document> get_document(const std::string& id) const;

    // 0 until the first insert
    size_t dimension() const;
    std::string backend_name() const;
    const IndexConfig& config() const { return config_; }

    nlohmann::json stats() const;

private:
    void rebuild_locked();
    std::vector<SearchResult> search_locked(const std::vector<float>& query, size_t top_k,
                                            const MetaFilter* filter) const;
    SearchResult project(const Neighbor& neighbor) const;

    std::shared_ptr<EmbeddingProvider> embedder_;
    IndexConfig config_;
    std::shared_ptr<TelemetrySink> telemetry_;

    mutable std::shared_mutex mutex_;
    std::vector<Document> documents_;                    // index = position
    std::unordered_map<std::string, uint32_t> positions_;
    std::unique_ptr<IndexBackend> backend_;
    size_t dim_ = 0;
};
