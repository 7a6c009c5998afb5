#include "reranker.hpp"
#include "util.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace {

std::unordered_set<std::string> word_set(const std::string& text) {
    std::unordered_set<std::string> words;
    std::istringstream ss(text);
    std::string word;
    while (ss >> word) {
        words.insert(word);
    }
    return words;
}

struct Scored {
    const SearchResult* result;
    int64_t original_rank;
    float final_score;
};

}

Reranker::Reranker(RerankConfig config, std::shared_ptr<TelemetrySink> telemetry)
    : config_(std::move(config)),
      telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {}

void Reranker::set_boost_factor(const std::string& chunk_type, float factor) {
    config_.boosts[chunk_type] = factor;
}

float Reranker::lexical_boost(const std::string& query, const std::string& content) const {
    std::string q = to_lower_ascii(query);
    std::string c = to_lower_ascii(content);

    if (!q.empty() && c.find(q) != std::string::npos) {
        return config_.substring_boost;
    }

    auto query_words = word_set(q);
    auto content_words = word_set(c);
    size_t overlap = 0;
    for (const auto& w : query_words) {
        if (content_words.count(w)) overlap++;
    }

    if (overlap >= 3) return config_.overlap3_boost;
    if (overlap >= 2) return config_.overlap2_boost;
    if (overlap >= 1) return config_.overlap1_boost;
    return 1.0f;
}

std::vector<SearchResult> Reranker::rerank(const std::vector<SearchResult>& results,
                                           const std::optional<std::string>& query,
                                           std::optional<size_t> top_k,
                                           const std::optional<BoostMap>& boosts) const {
    if (results.empty()) {
        return {};
    }

    Timer timer;
    const BoostMap& factors = boosts ? *boosts : config_.boosts;
    const bool use_query = query && !query->empty();

    std::vector<Scored> scored;
    scored.reserve(results.size());
    for (size_t i = 0; i < results.size(); i++) {
        const SearchResult& r = results[i];

        float type_boost = 1.0f;
        if (r.metadata.chunk_type) {
            auto it = factors.find(*r.metadata.chunk_type);
            if (it != factors.end()) type_boost = it->second;
        }
        float query_boost = use_query ? lexical_boost(*query, r.content) : 1.0f;

        scored.push_back({&r, static_cast<int64_t>(i), r.score * type_boost * query_boost});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        return a.final_score > b.final_score;
    });

    size_t limit = top_k ? std::min(*top_k, scored.size()) : scored.size();
    std::vector<SearchResult> out;
    out.reserve(limit);
    for (size_t i = 0; i < limit; i++) {
        SearchResult r = *scored[i].result;
        r.metadata.set("original_score", static_cast<double>(r.score));
        r.metadata.set("original_rank", scored[i].original_rank);
        r.score = scored[i].final_score;
        out.push_back(std::move(r));
    }

    telemetry_->record("reranking", timer.elapsed_ms(), "",
                       {{"input", results.size()}, {"output", out.size()}});
    return out;
}

std::vector<SearchResult> Reranker::diversity_rerank(const std::vector<SearchResult>& results,
                                                     const std::string& diversity_key,
                                                     size_t top_k) const {
    std::vector<SearchResult> diversified;
    if (results.empty() || top_k == 0) {
        return diversified;
    }

    std::vector<std::string> group_order;
    std::map<std::string, std::vector<const SearchResult*>> groups;
    for (const auto& r : results) {
        auto value = r.metadata.get(diversity_key);
        std::string key = value ? meta_to_string(*value) : "other";
        auto& members = groups[key];
        if (members.empty()) group_order.push_back(key);
        members.push_back(&r);
    }

    std::map<std::string, size_t> next;
    while (diversified.size() < top_k) {
        bool added = false;
        for (const auto& key : group_order) {
            auto& cursor = next[key];
            const auto& members = groups[key];
            if (cursor < members.size()) {
                diversified.push_back(*members[cursor]);
                cursor++;
                added = true;
                if (diversified.size() >= top_k) break;
            }
        }
        if (!added) break;
    }

    return diversified;
}
