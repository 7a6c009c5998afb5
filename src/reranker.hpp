#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "telemetry.hpp"
#include "vector_index.hpp"

using BoostMap = std::map<std::string, float>;

// Second scoring pass over search results. Never touches the index.
//
// final_score = score * type_boost(chunk_type) * lexical_boost(query, content)
//
// Reranking is read-only and safe to share between threads; set_boost_factor
// is not and belongs to startup.
class Reranker {
public:
    explicit Reranker(RerankConfig config = RerankConfig(),
                      std::shared_ptr<TelemetrySink> telemetry = nullptr);

    // Stable sort by final score. Each output carries original_score and
    // original_rank in its metadata. boosts, when given, replaces the
    // configured map for this call; top_k truncates the output.
    std::vector<SearchResult> rerank(const std::vector<SearchResult>& results,
                                     const std::optional<std::string>& query = std::nullopt,
                                     std::optional<size_t> top_k = std::nullopt,
                                     const std::optional<BoostMap>& boosts = std::nullopt) const;

    // Round-robin across groups of diversity_key (missing key groups as
    // "other"), groups in order of first appearance, until top_k are taken.
    std::vector<SearchResult> diversity_rerank(const std::vector<SearchResult>& results,
                                               const std::string& diversity_key = "chunk_type",
                                               size_t top_k = 5) const;

    float lexical_boost(const std::string& query, const std::string& content) const;

    void set_boost_factor(const std::string& chunk_type, float factor);
    const BoostMap& boosts() const { return config_.boosts; }

private:
    RerankConfig config_;
    std::shared_ptr<TelemetrySink> telemetry_;
};
