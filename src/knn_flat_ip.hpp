#pragma once

#include "knn_bruteforce.hpp"
#include <Eigen/Core>

// Inner-product index over vectors normalized once at build time.
// Equivalent to cosine similarity; scoring is one matrix-vector product.
// It cannot filter while scoring, so callers over-fetch and filter afterwards.
class FlatIpIndex : public IndexBackend {
public:
    FlatIpIndex() = default;

    void build(const std::vector<float>& data, uint32_t dim, uint32_t count) override;
    std::vector<Neighbor> search_knn(const std::vector<float>& query_vector, size_t k,
                                     const std::vector<bool>* allowed = nullptr) const override;

    bool supports_prefilter() const override { return false; }
    size_t get_count() const override { return count_; }
    uint32_t get_dim() const override { return dim_; }
    std::string get_backend_name() const override { return "flat_ip"; }

private:
    using RowMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    RowMatrix normalized_;
    uint32_t dim_ = 0;
    uint32_t count_ = 0;
};
