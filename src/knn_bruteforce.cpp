#include "knn_bruteforce.hpp"
#include "errors.hpp"
#include "snapshot_io.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

std::vector<Neighbor> rank_scores(const float* scores, uint32_t count, size_t k,
                                  const std::vector<bool>* allowed) {
    std::vector<Neighbor> ranked;
    if (k == 0) {
        return ranked;
    }
    ranked.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        if (allowed && !(*allowed)[i]) continue;
        ranked.emplace_back(i, scores[i]);
    }

    if (k < ranked.size()) {
        // Keep the k best plus anything that may tie with the k-th
        std::nth_element(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(k - 1), ranked.end(),
                         ranks_before);
        float cutoff = ranked[k - 1].score - kScoreTolerance;
        ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                    [cutoff](const Neighbor& n) { return n.score < cutoff; }),
                     ranked.end());
    }
    std::sort(ranked.begin(), ranked.end(), ranks_before);

    for (size_t start = 0; start < ranked.size();) {
        const float best = ranked[start].score;
        size_t end = start + 1;
        while (end < ranked.size() && best - ranked[end].score <= kScoreTolerance) end++;

        std::sort(ranked.begin() + static_cast<std::ptrdiff_t>(start),
                  ranked.begin() + static_cast<std::ptrdiff_t>(end),
                  [](const Neighbor& a, const Neighbor& b) { return a.position < b.position; });
        for (size_t i = start; i < end; i++) ranked[i].score = best;
        start = end;
    }

    if (ranked.size() > k) ranked.erase(ranked.begin() + static_cast<std::ptrdiff_t>(k), ranked.end());
    return ranked;
}

void BruteforceIndex::build(const std::vector<float>& data, uint32_t dim, uint32_t count) {
    data_ = data;
    dim_ = dim;
    count_ = count;

    norms_.assign(count, 0.0f);
    for (uint32_t i = 0; i < count; i++) {
        norms_[i] = compute_norm(&data_[static_cast<size_t>(i) * dim], dim);
    }
}

std::vector<Neighbor> BruteforceIndex::search_knn(const std::vector<float>& query_vector, size_t k,
                                                  const std::vector<bool>* allowed) const {
    if (count_ == 0 || k == 0) {
        return {};
    }
    if (query_vector.size() != dim_) {
        throw DimensionMismatchError(dim_, query_vector.size());
    }

    float query_norm = compute_norm(query_vector.data(), dim_);

    std::vector<float> scores(count_, 0.0f);
    for (uint32_t i = 0; i < count_; i++) {
        if (allowed && !(*allowed)[i]) {
            continue;
        }

        // Zero vectors have no direction; they score 0 against everything
        float norm = norms_[i];
        if (norm == 0.0f || query_norm == 0.0f) {
            continue;
        }

        const float* vector = &data_[static_cast<size_t>(i) * dim_];
        double dot_product = 0.0;
        for (uint32_t j = 0; j < dim_; j++) {
            dot_product += static_cast<double>(query_vector[j]) * vector[j];
        }
        scores[i] = static_cast<float>(dot_product / (static_cast<double>(query_norm) * norm));
    }

    return rank_scores(scores.data(), count_, k, allowed);
}
