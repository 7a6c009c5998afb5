#include "knn_flat_ip.hpp"
#include "errors.hpp"

void FlatIpIndex::build(const std::vector<float>& data, uint32_t dim, uint32_t count) {
    dim_ = dim;
    count_ = count;
    normalized_.resize(count, dim);
    if (count == 0 || dim == 0) {
        return;
    }

    normalized_ = Eigen::Map<const RowMatrix>(data.data(), count, dim);
    for (Eigen::Index i = 0; i < normalized_.rows(); i++) {
        float norm = normalized_.row(i).norm();
        if (norm > 0.0f) {
            normalized_.row(i) /= norm;
        }
    }
}

std::vector<Neighbor> FlatIpIndex::search_knn(const std::vector<float>& query_vector, size_t k,
                                              const std::vector<bool>*) const {
    if (count_ == 0 || k == 0) {
        return {};
    }
    if (query_vector.size() != dim_) {
        throw DimensionMismatchError(dim_, query_vector.size());
    }

    Eigen::VectorXf query = Eigen::Map<const Eigen::VectorXf>(query_vector.data(), dim_);
    float query_norm = query.norm();
    if (query_norm > 0.0f) {
        query /= query_norm;
    }

    Eigen::VectorXf scores = normalized_ * query;
    return rank_scores(scores.data(), count_, k);
}
