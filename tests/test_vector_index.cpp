#include <gtest/gtest.h>
#include "errors.hpp"
#include "test_helpers.hpp"
#include "vector_index.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <random>
#include <thread>

namespace {

DocumentInput text_doc(const std::string& id, const std::string& content, const std::string& chunk_type) {
    DocumentInput doc;
    doc.id = id;
    doc.content = content;
    doc.metadata.set("chunk_type", chunk_type);
    return doc;
}

DocumentInput vector_doc(const std::string& id, std::vector<float> embedding) {
    DocumentInput doc;
    doc.id = id;
    doc.content = "document " + id;
    doc.embedding = std::move(embedding);
    return doc;
}

std::vector<DocumentInput> schema_corpus() {
    return {
        text_doc("t_orders", "Table orders with one row per customer order", "table"),
        text_doc("t_customers", "Table customers with name, region and signup date", "table"),
        text_doc("c_region", "Column customers.region holds the sales region", "column"),
        text_doc("m_revenue", "Metric revenue is the sum of order totals", "metric"),
        text_doc("m_churn", "Metric churn is the share of customers lost per month", "metric"),
        text_doc("e_rev_region", "Example: total revenue by region", "example"),
        text_doc("r_orders_customers", "orders.customer_id references customers.id", "relationship"),
    };
}

// Fixed 3-d vectors; counts how often the model is brought up
class CountingBackend : public EmbeddingBackend {
public:
    explicit CountingBackend(std::shared_ptr<std::atomic<int>> init_calls) : init_calls_(std::move(init_calls)) {}

    size_t initialize() override {
        (*init_calls_)++;
        return 3;
    }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
        return std::vector<std::vector<float>>(texts.size(), std::vector<float>{1.0f, 0.0f, 0.0f});
    }

    std::string name() const override { return "counting"; }

private:
    std::shared_ptr<std::atomic<int>> init_calls_;
};

IndexConfig config_for(const std::string& backend) {
    IndexConfig config;
    config.backend = backend;
    return config;
}

}

class VectorIndexTest : public ::testing::TestWithParam<std::string> {
protected:
    VectorIndexTest() : index_(make_fallback_provider(32), config_for(GetParam())) {}

    VectorIndex index_;
};

TEST_P(VectorIndexTest, OrthogonalVectorsScenario) {
    index_.add_documents({
        vector_doc("doc1", {1, 0, 0, 0}),
        vector_doc("doc2", {0, 1, 0, 0}),
        vector_doc("doc3", {0, 0, 1, 0}),
        vector_doc("doc4", {0, 0, 0, 1}),
    });

    auto results = index_.search_by_vector({0, 1, 0, 0}, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].document_id, "doc2");
    EXPECT_NEAR(results[0].score, 1.0f, 1e-6f);
}

TEST_P(VectorIndexTest, TopKBoundAndNonIncreasingScores) {
    index_.add_documents(schema_corpus());
    const size_t n = index_.count();

    for (size_t k : {1u, 3u, 7u, 20u}) {
        auto results = index_.search("revenue by region", k);
        EXPECT_EQ(results.size(), std::min(k, n));
        for (size_t i = 1; i < results.size(); i++) {
            EXPECT_GE(results[i - 1].score, results[i].score);
        }
    }
}

TEST_P(VectorIndexTest, EmptyCorpusAndZeroTopK) {
    EXPECT_TRUE(index_.search("anything", 5).empty());
    index_.add_documents(schema_corpus());
    EXPECT_TRUE(index_.search("anything", 0).empty());
}

TEST_P(VectorIndexTest, ExactTextIsTopHit) {
    index_.add_documents(schema_corpus());
    auto results = index_.search("Metric revenue is the sum of order totals", 3);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].document_id, "m_revenue");
    EXPECT_NEAR(results[0].score, 1.0f, 1e-5f);
    EXPECT_EQ(*results[0].metadata.chunk_type, "metric");
}

TEST_P(VectorIndexTest, MetadataFilter) {
    index_.add_documents(schema_corpus());

    MetaFilter filter{{"chunk_type", std::string("metric")}};
    auto results = index_.search("customers", 5, filter);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_EQ(*r.metadata.chunk_type, "metric");
    }

    MetaFilter none{{"chunk_type", std::string("dashboard")}};
    EXPECT_TRUE(index_.search("customers", 5, none).empty());
}

TEST_P(VectorIndexTest, RareFilterMatchesStillFillTopK) {
    std::mt19937 rng(17);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    std::vector<DocumentInput> docs;
    for (int i = 0; i < 500; i++) {
        std::vector<float> v(8);
        for (auto& x : v) x = dist(rng);
        auto doc = vector_doc("d" + std::to_string(i), v);
        doc.metadata.set("chunk_type", std::string(i % 100 == 0 ? "metric" : "table"));
        docs.push_back(doc);
    }
    index_.add_documents(docs);

    std::vector<float> query(8);
    for (auto& x : query) x = dist(rng);

    MetaFilter filter{{"chunk_type", std::string("metric")}};
    auto results = index_.search_by_vector(query, 5, filter);
    ASSERT_EQ(results.size(), 5u);
    for (size_t i = 0; i < results.size(); i++) {
        EXPECT_EQ(*results[i].metadata.chunk_type, "metric");
        if (i > 0) EXPECT_GE(results[i - 1].score, results[i].score);
    }
}

TEST_P(VectorIndexTest, DuplicateIdRejectsWholeBatch) {
    index_.add_documents({text_doc("a", "first", "table")});

    EXPECT_THROW(index_.add_documents({text_doc("b", "second", "table"), text_doc("a", "again", "table")}),
                 DuplicateIdError);
    EXPECT_EQ(index_.count(), 1u);
    EXPECT_FALSE(index_.contains("b"));

    EXPECT_THROW(index_.add_documents({text_doc("c", "x", "table"), text_doc("c", "y", "table")}),
                 DuplicateIdError);
    EXPECT_EQ(index_.count(), 1u);
}

TEST_P(VectorIndexTest, DimensionMismatch) {
    index_.add_documents({vector_doc("a", {1, 0, 0})});
    EXPECT_EQ(index_.dimension(), 3u);
    EXPECT_THROW(index_.add_documents({vector_doc("b", {1, 0})}), DimensionMismatchError);
    EXPECT_THROW(index_.search_by_vector({1, 0}, 1), DimensionMismatchError);
    EXPECT_EQ(index_.count(), 1u);
}

TEST_P(VectorIndexTest, EmptyFirstEmbeddingIsRejected) {
    try {
        index_.add_documents({vector_doc("blank", {})});
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(std::string(e.what()), "Empty embedding vector for document blank");
        EXPECT_EQ(e.code(), "DIMENSION_MISMATCH");
    }
    EXPECT_EQ(index_.count(), 0u);
    EXPECT_EQ(index_.dimension(), 0u);
}

TEST_P(VectorIndexTest, DeleteDocument) {
    index_.add_documents(schema_corpus());
    const size_t before = index_.count();

    EXPECT_TRUE(index_.delete_document("m_revenue"));
    EXPECT_FALSE(index_.delete_document("m_revenue"));
    EXPECT_EQ(index_.count(), before - 1);
    EXPECT_FALSE(index_.get_document("m_revenue").has_value());

    auto results = index_.search("Metric revenue is the sum of order totals", 10);
    for (const auto& r : results) {
        EXPECT_NE(r.document_id, "m_revenue");
    }
    auto churn = index_.search("Metric churn is the share of customers lost per month", 1);
    ASSERT_EQ(churn.size(), 1u);
    EXPECT_EQ(churn[0].document_id, "m_churn");
}

TEST_P(VectorIndexTest, SaveLoadRoundTrip) {
    TempDir dir;
    std::string path = dir.file("index.snap");
    index_.add_documents(schema_corpus());
    index_.save(path);

    VectorIndex restored(make_fallback_provider(32), config_for(GetParam()));
    ASSERT_TRUE(restored.load(path));
    EXPECT_EQ(restored.count(), index_.count());
    EXPECT_EQ(restored.dimension(), index_.dimension());

    for (const std::string query : {"revenue by region", "customer table", "churn"}) {
        auto a = index_.search(query, 5);
        auto b = restored.search(query, 5);
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); i++) {
            EXPECT_EQ(a[i].document_id, b[i].document_id);
            EXPECT_NEAR(a[i].score, b[i].score, 1e-6f);
        }
    }

    auto doc = restored.get_document("c_region");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(*doc->metadata.chunk_type, "column");
}

TEST_P(VectorIndexTest, LoadMissingKeepsContents) {
    TempDir dir;
    index_.add_documents(schema_corpus());
    EXPECT_FALSE(index_.load(dir.file("absent.snap")));
    EXPECT_EQ(index_.count(), schema_corpus().size());
}

TEST_P(VectorIndexTest, LoadCorruptKeepsContents) {
    TempDir dir;
    std::string path = dir.file("bad.snap");
    {
        std::ofstream out(path, std::ios::binary);
        out << "SDXSNAP1 but then garbage";
    }
    index_.add_documents(schema_corpus());
    EXPECT_THROW(index_.load(path), CorruptSnapshotError);
    EXPECT_EQ(index_.count(), schema_corpus().size());
}

TEST_P(VectorIndexTest, ClearResetsDimension) {
    index_.add_documents({vector_doc("a", {1, 0, 0})});
    index_.clear();
    EXPECT_EQ(index_.count(), 0u);
    EXPECT_EQ(index_.dimension(), 0u);
    index_.add_documents({vector_doc("b", {1, 0})});
    EXPECT_EQ(index_.dimension(), 2u);
}

TEST_P(VectorIndexTest, StatsAndBackend) {
    index_.add_documents(schema_corpus());
    auto stats = index_.stats();
    EXPECT_EQ(stats["count"], schema_corpus().size());
    EXPECT_EQ(stats["dim"], 32);
    EXPECT_EQ(stats["backend"], GetParam());
    EXPECT_EQ(stats["embedding"]["fallback"], true);
    EXPECT_EQ(index_.backend_name(), GetParam());
}

TEST_P(VectorIndexTest, StatsDoNotStartTheEmbeddingModel) {
    auto init_calls = std::make_shared<std::atomic<int>>(0);
    EmbeddingConfig config;
    auto provider = std::make_shared<EmbeddingProvider>(config, std::make_unique<CountingBackend>(init_calls));
    VectorIndex index(provider, config_for(GetParam()));

    auto stats = index.stats();
    EXPECT_EQ(stats["embedding"]["status"], "uninitialized");
    EXPECT_FALSE(stats["embedding"].contains("dim"));
    EXPECT_EQ(init_calls->load(), 0);

    index.add_documents({text_doc("a", "orders", "table")});
    stats = index.stats();
    EXPECT_EQ(stats["embedding"]["status"], "ready");
    EXPECT_EQ(stats["embedding"]["backend"], "counting");
    EXPECT_EQ(stats["embedding"]["dim"], 3);
    EXPECT_EQ(init_calls->load(), 1);
}

TEST_P(VectorIndexTest, ConcurrentSavesToOnePath) {
    index_.add_documents(schema_corpus());
    TempDir dir;
    const std::string path = dir.file("index.snap");

    std::atomic<int> failures{0};
    std::vector<std::thread> savers;
    for (int t = 0; t < 6; t++) {
        savers.emplace_back([this, &path, &failures]() {
            for (int i = 0; i < 5; i++) {
                try {
                    index_.save(path);
                } catch (const SnapshotIoError&) {
                    failures++;
                }
            }
        });
    }
    for (auto& t : savers) t.join();
    EXPECT_EQ(failures.load(), 0);

    VectorIndex restored(make_fallback_provider(32), config_for(GetParam()));
    ASSERT_TRUE(restored.load(path));
    EXPECT_EQ(restored.count(), schema_corpus().size());
}

TEST_P(VectorIndexTest, ResultJsonRoundsScore) {
    index_.add_documents({vector_doc("a", {1, 2, 3})});
    auto results = index_.search_by_vector({3, 2, 1}, 1);
    ASSERT_EQ(results.size(), 1u);
    double rounded = results[0].to_json()["score"].get<double>();
    EXPECT_DOUBLE_EQ(rounded, round_to(results[0].score, 4));
    EXPECT_EQ(results[0].to_json()["document_id"], "a");
}

TEST_P(VectorIndexTest, ConcurrentReadersAndWriters) {
    index_.add_documents(schema_corpus());

    std::atomic<bool> failed{false};
    std::vector<std::thread> threads;
    for (int w = 0; w < 2; w++) {
        threads.emplace_back([this, w, &failed]() {
            try {
                for (int i = 0; i < 25; i++) {
                    std::string id = "w" + std::to_string(w) + "_" + std::to_string(i);
                    index_.add_documents({text_doc(id, "generated content " + id, "example")});
                    if (i % 5 == 0) index_.delete_document(id);
                }
            } catch (const std::exception&) {
                failed = true;
            }
        });
    }
    for (int r = 0; r < 4; r++) {
        threads.emplace_back([this, &failed]() {
            try {
                for (int i = 0; i < 50; i++) {
                    auto results = index_.search("revenue by region", 5);
                    if (results.size() > 5) failed = true;
                    for (size_t j = 1; j < results.size(); j++) {
                        if (results[j - 1].score < results[j].score) failed = true;
                    }
                }
            } catch (const std::exception&) {
                failed = true;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_FALSE(failed.load());
    EXPECT_EQ(index_.count(), schema_corpus().size() + 2 * 20);
}

INSTANTIATE_TEST_SUITE_P(Backends, VectorIndexTest, ::testing::Values("bruteforce", "flat_ip"));

TEST(VectorIndexTelemetryTest, ReportsOperations) {
    auto recorder = std::make_shared<LatencyRecorder>(100, false);
    VectorIndex index(make_fallback_provider(16), IndexConfig(), recorder);

    index.add_documents({text_doc("a", "orders table", "table")}, "trace-1");
    index.search("orders", 1, std::nullopt, "trace-2");
    index.delete_document("a");

    EXPECT_EQ(recorder->count("index.add"), 1u);
    EXPECT_EQ(recorder->count("index.search"), 1u);
    EXPECT_EQ(recorder->count("index.delete"), 1u);
}

TEST(VectorIndexTelemetryTest, SearchesThatReturnEarlyAreStillReported) {
    auto recorder = std::make_shared<LatencyRecorder>(100, false);
    VectorIndex index(make_fallback_provider(16), IndexConfig(), recorder);

    EXPECT_TRUE(index.search("orders", 5).empty());
    EXPECT_EQ(recorder->count("index.search"), 1u);

    index.add_documents({text_doc("a", "orders table", "table")});
    EXPECT_TRUE(index.search("orders", 0).empty());
    EXPECT_EQ(recorder->count("index.search"), 2u);
}
