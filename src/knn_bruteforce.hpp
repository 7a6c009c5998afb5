#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// A scored corpus position
struct Neighbor {
    uint32_t position;
    float score;

    Neighbor(uint32_t position, float score) : position(position), score(score) {}
};

// Scores closer than this are the same similarity seen through float rounding
// (e.g. one direction stored at different scales, or a different summation order)
constexpr float kScoreTolerance = 1e-5f;

// Exact order: higher score first, then lower (earlier inserted) position
inline bool ranks_before(const Neighbor& a, const Neighbor& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.position < b.position;
}

// Up to k best positions from one score per row, skipping rows not in allowed.
// Runs of scores within kScoreTolerance of the run's best are ties: they are
// ordered by position and all report the best score of the run. Every backend
// ranks through here so they agree on order.
std::vector<Neighbor> rank_scores(const float* scores, uint32_t count, size_t k,
                                  const std::vector<bool>* allowed = nullptr);

// Abstract backend interface. Positions are the corpus insertion order.
class IndexBackend {
public:
    virtual ~IndexBackend() = default;

    // Replaces the contents with count raw vectors laid out row-major in data
    virtual void build(const std::vector<float>& data, uint32_t dim, uint32_t count) = 0;

    // Up to k neighbors by cosine similarity, ordered by ranks_before.
    // allowed, when given, has one flag per position; only supported when
    // supports_prefilter() is true, other backends ignore it.
    virtual std::vector<Neighbor> search_knn(const std::vector<float>& query_vector, size_t k,
                                             const std::vector<bool>* allowed = nullptr) const = 0;

    virtual bool supports_prefilter() const = 0;
    virtual size_t get_count() const = 0;
    virtual uint32_t get_dim() const = 0;
    virtual std::string get_backend_name() const = 0;
};

// Exact cosine similarity over raw vectors, normalizing per comparison
class BruteforceIndex : public IndexBackend {
public:
    BruteforceIndex() = default;

    void build(const std::vector<float>& data, uint32_t dim, uint32_t count) override;
    std::vector<Neighbor> search_knn(const std::vector<float>& query_vector, size_t k,
                                     const std::vector<bool>* allowed = nullptr) const override;

    bool supports_prefilter() const override { return true; }
    size_t get_count() const override { return count_; }
    uint32_t get_dim() const override { return dim_; }
    std::string get_backend_name() const override { return "bruteforce"; }

private:
    std::vector<float> data_;       // Contiguous float array: [v0[0..dim-1], v1[0..dim-1], ...]
    std::vector<float> norms_;      // Precomputed L2 norm of each row
    uint32_t dim_ = 0;
    uint32_t count_ = 0;
};
