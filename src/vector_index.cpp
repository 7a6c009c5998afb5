#include "vector_index.hpp"
#include "backend_factory.hpp"
#include "errors.hpp"
#include "snapshot_io.hpp"
#include "util.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_set>

nlohmann::json SearchResult::to_json() const {
    return {
        {"document_id", document_id},
        {"content", content},
        {"score", round_to(score, 4)},
        {"metadata", metadata.to_json()}
    };
}

VectorIndex::VectorIndex(std::shared_ptr<EmbeddingProvider> embedder,
                         IndexConfig config,
                         std::shared_ptr<TelemetrySink> telemetry)
    : embedder_(std::move(embedder)),
      config_(std::move(config)),
      telemetry_(telemetry ? std::move(telemetry) : null_telemetry()),
      backend_(create_backend(config_.backend)) {
    if (config_.filter_overfetch == 0) config_.filter_overfetch = 1;
}

size_t VectorIndex::add_documents(const std::vector<DocumentInput>& docs, const std::string& trace_id) {
    if (docs.empty()) {
        return 0;
    }

    Timer timer;

    std::unordered_set<std::string> batch_ids;
    for (const auto& doc : docs) {
        if (!batch_ids.insert(doc.id).second) {
            throw DuplicateIdError(doc.id);
        }
    }

    // Embedding can be slow; it runs before the write lock is taken
    std::vector<std::string> texts;
    std::vector<size_t> text_owner;
    for (size_t i = 0; i < docs.size(); i++) {
        if (!docs[i].embedding) {
            texts.push_back(docs[i].content);
            text_owner.push_back(i);
        }
    }

    std::vector<std::vector<float>> vectors(docs.size());
    if (!texts.empty()) {
        if (!embedder_) {
            throw EmbeddingError("Documents without vectors need an embedding provider");
        }
        auto embedded = embedder_->embed(texts, trace_id);
        for (size_t j = 0; j < embedded.size(); j++) {
            vectors[text_owner[j]] = std::move(embedded[j]);
        }
    }
    for (size_t i = 0; i < docs.size(); i++) {
        if (docs[i].embedding) vectors[i] = *docs[i].embedding;
    }

    size_t total = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        for (const auto& doc : docs) {
            if (positions_.count(doc.id)) {
                throw DuplicateIdError(doc.id);
            }
        }

        size_t dim = dim_ != 0 ? dim_ : vectors.front().size();
        if (dim == 0) {
            throw DimensionMismatchError("Empty embedding vector for document " + docs.front().id);
        }
        for (const auto& v : vectors) {
            if (v.size() != dim) {
                throw DimensionMismatchError(dim, v.size());
            }
        }

        dim_ = dim;
        documents_.reserve(documents_.size() + docs.size());
        for (size_t i = 0; i < docs.size(); i++) {
            uint32_t position = static_cast<uint32_t>(documents_.size());
            documents_.push_back(Document{docs[i].id, docs[i].content, std::move(vectors[i]), docs[i].metadata});
            positions_[docs[i].id] = position;
        }

        rebuild_locked();
        total = documents_.size();
    }

    double elapsed = timer.elapsed_ms();
    telemetry_->record("index.add", elapsed, trace_id, {{"count", docs.size()}, {"total", total}});
    LOG_DEBUG("Added " + std::to_string(docs.size()) + " documents (total " + std::to_string(total) + ")");
    return docs.size();
}

std::vector<SearchResult> VectorIndex::search(const std::string& query, size_t top_k,
                                              const std::optional<MetaFilter>& filter,
                                              const std::string& trace_id) {
    Timer timer;
    if (top_k == 0 || count() == 0) {
        telemetry_->record("index.search", timer.elapsed_ms(), trace_id,
                           {{"query_length", query.size()}, {"top_k", top_k},
                            {"filtered", filter.has_value()}, {"results", 0}});
        return {};
    }
    if (!embedder_) {
        throw EmbeddingError("Text search needs an embedding provider");
    }

    std::vector<float> query_vector = embedder_->embed_one(query, trace_id);

    std::vector<SearchResult> results;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        results = search_locked(query_vector, top_k, filter ? &*filter : nullptr);
    }

    telemetry_->record("index.search", timer.elapsed_ms(), trace_id,
                       {{"query_length", query.size()}, {"top_k", top_k},
                        {"filtered", filter.has_value()}, {"results", results.size()}});
    return results;
}

std::vector<SearchResult> VectorIndex::search_by_vector(const std::vector<float>& query, size_t top_k,
                                                        const std::optional<MetaFilter>& filter,
                                                        const std::string& trace_id) {
    Timer timer;

    std::vector<SearchResult> results;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        results = search_locked(query, top_k, filter ? &*filter : nullptr);
    }

    telemetry_->record("index.search", timer.elapsed_ms(), trace_id,
                       {{"top_k", top_k}, {"filtered", filter.has_value()}, {"results", results.size()}});
    return results;
}

std::vector<SearchResult> VectorIndex::search_locked(const std::vector<float>& query, size_t top_k,
                                                     const MetaFilter* filter) const {
    std::vector<SearchResult> results;
    if (top_k == 0 || documents_.empty()) {
        return results;
    }
    if (query.size() != dim_) {
        throw DimensionMismatchError(dim_, query.size());
    }

    const size_t total = documents_.size();

    if (!filter || filter->empty()) {
        for (const auto& n : backend_->search_knn(query, top_k)) {
            results.push_back(project(n));
        }
        return results;
    }

    if (backend_->supports_prefilter()) {
        std::vector<bool> allowed(total, false);
        for (size_t i = 0; i < total; i++) {
            allowed[i] = documents_[i].metadata.matches(*filter);
        }
        for (const auto& n : backend_->search_knn(query, top_k, &allowed)) {
            results.push_back(project(n));
        }
        return results;
    }

    // Over-fetch, filter, and widen until top_k matches or the corpus is exhausted
    size_t fetch = std::min(total, top_k * config_.filter_overfetch);
    while (true) {
        results.clear();
        for (const auto& n : backend_->search_knn(query, fetch)) {
            if (!documents_[n.position].metadata.matches(*filter)) {
                continue;
            }
            results.push_back(project(n));
            if (results.size() >= top_k) break;
        }
        if (results.size() >= top_k || fetch >= total) {
            break;
        }
        fetch = std::min(total, fetch * 2);
    }
    return results;
}

SearchResult VectorIndex::project(const Neighbor& neighbor) const {
    const Document& doc = documents_[neighbor.position];
    SearchResult r;
    r.document_id = doc.id;
    r.content = doc.content;
    r.score = neighbor.score;
    r.metadata = doc.metadata;
    return r;
}

bool VectorIndex::delete_document(const std::string& id, const std::string& trace_id) {
    Timer timer;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) {
            return false;
        }

        documents_.erase(documents_.begin() + it->second);

        positions_.clear();
        for (uint32_t i = 0; i < documents_.size(); i++) {
            positions_[documents_[i].id] = i;
        }

        rebuild_locked();
    }

    telemetry_->record("index.delete", timer.elapsed_ms(), trace_id, {{"id", id}});
    return true;
}

void VectorIndex::rebuild_locked() {
    const uint32_t count = static_cast<uint32_t>(documents_.size());
    const uint32_t dim = static_cast<uint32_t>(dim_);

    std::vector<float> data;
    data.reserve(static_cast<size_t>(count) * dim);
    for (const auto& doc : documents_) {
        data.insert(data.end(), doc.embedding.begin(), doc.embedding.end());
    }

    backend_->build(data, dim, count);
}

void VectorIndex::save(const std::string& path) const {
    Timer timer;
    SnapshotData snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.dim = static_cast<uint32_t>(dim_);
        snapshot.count = static_cast<uint32_t>(documents_.size());
        snapshot.data.reserve(static_cast<size_t>(snapshot.count) * snapshot.dim);
        snapshot.documents.reserve(documents_.size());
        for (const auto& doc : documents_) {
            snapshot.data.insert(snapshot.data.end(), doc.embedding.begin(), doc.embedding.end());
            snapshot.documents.push_back(SnapshotDocument{doc.id, doc.content, doc.metadata});
        }
        save_snapshot(path, snapshot);
    }
    telemetry_->record("index.save", timer.elapsed_ms(), "", {{"count", snapshot.count}, {"path", path}});
}

bool VectorIndex::load(const std::string& path) {
    Timer timer;

    auto snapshot = load_snapshot(path);
    if (!snapshot) {
        return false;
    }

    // Decode and build off to the side, then swap under the write lock
    std::vector<Document> documents;
    std::unordered_map<std::string, uint32_t> positions;
    documents.reserve(snapshot->count);
    const size_t dim = snapshot->dim;

    for (uint32_t i = 0; i < snapshot->count; i++) {
        auto& src = snapshot->documents[i];
        if (!positions.emplace(src.id, i).second) {
            throw CorruptSnapshotError(path, "duplicate document id " + src.id);
        }
        auto begin = snapshot->data.begin() + static_cast<std::ptrdiff_t>(i * dim);
        documents.push_back(Document{std::move(src.id), std::move(src.content),
                                     std::vector<float>(begin, begin + static_cast<std::ptrdiff_t>(dim)),
                                     std::move(src.metadata)});
    }

    auto backend = create_backend(config_.backend);
    backend->build(snapshot->data, snapshot->dim, snapshot->count);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        documents_ = std::move(documents);
        positions_ = std::move(positions);
        backend_ = std::move(backend);
        dim_ = snapshot->count > 0 ? dim : 0;
    }

    telemetry_->record("index.load", timer.elapsed_ms(), "", {{"count", snapshot->count}, {"path", path}});
    return true;
}

size_t VectorIndex::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return documents_.size();
}

void VectorIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    documents_.clear();
    positions_.clear();
    dim_ = 0;
    rebuild_locked();
}

bool VectorIndex::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return positions_.count(id) > 0;
}

std::optional<Document> VectorIndex::get_document(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return documents_[it->second];
}

size_t VectorIndex::dimension() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dim_;
}

std::string VectorIndex::backend_name() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return backend_->get_backend_name();
}

nlohmann::json VectorIndex::stats() const {
    nlohmann::json out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out["count"] = documents_.size();
        out["dim"] = dim_;
        out["backend"] = backend_->get_backend_name();
    }
    out["metric"] = "cosine";
    if (embedder_) {
        // Reports the model without bringing it up
        out["embedding"] = {
            {"model", embedder_->model_name()},
            {"status", embedder_->status()}
        };
        if (embedder_->initialized()) {
            out["embedding"]["backend"] = embedder_->backend_name();
            out["embedding"]["fallback"] = embedder_->is_fallback();
            out["embedding"]["dim"] = embedder_->dimension();
        }
    }
    return out;
}
