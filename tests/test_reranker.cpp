#include <gtest/gtest.h>
#include "reranker.hpp"
#include <set>

namespace {

SearchResult result(const std::string& id, float score, const std::string& chunk_type,
                    const std::string& content = "") {
    SearchResult r;
    r.document_id = id;
    r.content = content.empty() ? "content of " + id : content;
    r.score = score;
    if (!chunk_type.empty()) {
        r.metadata.set("chunk_type", chunk_type);
    }
    return r;
}

}

TEST(RerankerTest, EmptyInput) {
    Reranker reranker;
    EXPECT_TRUE(reranker.rerank({}).empty());
    EXPECT_TRUE(reranker.diversity_rerank({}).empty());
}

TEST(RerankerTest, LargerBoostRanksFirstOnEqualScore) {
    Reranker reranker;
    auto out = reranker.rerank({result("col", 0.8f, "column"), result("met", 0.8f, "metric")});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].document_id, "met");
    EXPECT_NEAR(out[0].score, 0.8f * 1.3f, 1e-6f);
    EXPECT_NEAR(out[1].score, 0.8f, 1e-6f);
}

TEST(RerankerTest, MonotonicAcrossAllTypePairs) {
    Reranker reranker;
    const auto& boosts = reranker.boosts();
    for (const auto& [a, fa] : boosts) {
        for (const auto& [b, fb] : boosts) {
            if (fa <= fb) continue;
            auto out = reranker.rerank({result("b", 0.5f, b), result("a", 0.5f, a)});
            EXPECT_EQ(out[0].document_id, "a") << a << " vs " << b;
        }
    }
}

TEST(RerankerTest, AnnotatesOriginalScoreAndRank) {
    Reranker reranker;
    auto out = reranker.rerank({result("r1", 0.9f, "relationship"), result("t1", 0.8f, "table")});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].document_id, "t1");
    EXPECT_EQ(std::get<int64_t>(*out[0].metadata.get("original_rank")), 1);
    EXPECT_NEAR(std::get<double>(*out[0].metadata.get("original_score")), 0.8, 1e-6);
    EXPECT_EQ(std::get<int64_t>(*out[1].metadata.get("original_rank")), 0);
}

TEST(RerankerTest, UnknownOrMissingTypeIsNeutral) {
    Reranker reranker;
    auto out = reranker.rerank({result("x", 0.7f, "dashboard"), result("y", 0.6f, "")});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0].score, 0.7f);
    EXPECT_FLOAT_EQ(out[1].score, 0.6f);
}

TEST(RerankerTest, StableForEqualFinalScores) {
    Reranker reranker;
    auto out = reranker.rerank({result("first", 0.5f, "table"), result("second", 0.5f, "table"),
                                result("third", 0.5f, "table")});
    EXPECT_EQ(out[0].document_id, "first");
    EXPECT_EQ(out[1].document_id, "second");
    EXPECT_EQ(out[2].document_id, "third");
}

TEST(RerankerTest, TopKTruncates) {
    Reranker reranker;
    std::vector<SearchResult> in{result("a", 0.9f, "table"), result("b", 0.8f, "table"),
                                 result("c", 0.7f, "table")};
    EXPECT_EQ(reranker.rerank(in, std::nullopt, 2).size(), 2u);
    EXPECT_EQ(reranker.rerank(in, std::nullopt, 10).size(), 3u);
    EXPECT_TRUE(reranker.rerank(in, std::nullopt, 0).empty());
}

TEST(RerankerTest, PerCallBoostsReplaceDefaults) {
    Reranker reranker;
    BoostMap boosts{{"column", 2.0f}};
    auto out = reranker.rerank({result("met", 0.8f, "metric"), result("col", 0.8f, "column")},
                               std::nullopt, std::nullopt, boosts);
    EXPECT_EQ(out[0].document_id, "col");
    EXPECT_FLOAT_EQ(out[1].score, 0.8f);
}

TEST(RerankerTest, SetBoostFactor) {
    Reranker reranker;
    reranker.set_boost_factor("faq", 3.0f);
    EXPECT_FLOAT_EQ(reranker.boosts().at("faq"), 3.0f);
    auto out = reranker.rerank({result("m", 0.5f, "metric"), result("f", 0.5f, "faq")});
    EXPECT_EQ(out[0].document_id, "f");
}

TEST(RerankerTest, LexicalBoostTiers) {
    Reranker reranker;
    EXPECT_FLOAT_EQ(reranker.lexical_boost("Revenue By Region", "total revenue by region per month"), 1.3f);
    EXPECT_FLOAT_EQ(reranker.lexical_boost("region revenue month", "revenue per region per month"), 1.2f);
    EXPECT_FLOAT_EQ(reranker.lexical_boost("region revenue", "revenue for each region"), 1.1f);
    EXPECT_FLOAT_EQ(reranker.lexical_boost("churn revenue", "revenue table"), 1.05f);
    EXPECT_FLOAT_EQ(reranker.lexical_boost("churn", "revenue table"), 1.0f);
}

TEST(RerankerTest, QueryBoostChangesOrder) {
    Reranker reranker;
    auto out = reranker.rerank({result("a", 0.80f, "table", "orders table"),
                                result("b", 0.75f, "table", "customer region table")},
                               std::string("customer region"));
    EXPECT_EQ(out[0].document_id, "b");
}

TEST(DiversityRerankTest, CoversEveryGroup) {
    Reranker reranker;
    std::vector<SearchResult> in{
        result("t1", 0.9f, "table"), result("t2", 0.85f, "table"), result("t3", 0.8f, "table"),
        result("m1", 0.7f, "metric"), result("c1", 0.6f, "column"), result("x1", 0.5f, ""),
    };

    auto out = reranker.diversity_rerank(in, "chunk_type", 4);
    ASSERT_EQ(out.size(), 4u);
    std::set<std::string> ids;
    for (const auto& r : out) ids.insert(r.document_id);
    EXPECT_EQ(ids, (std::set<std::string>{"t1", "m1", "c1", "x1"}));

    // Groups in order of first appearance; missing key groups as "other"
    EXPECT_EQ(out[0].document_id, "t1");
    EXPECT_EQ(out[1].document_id, "m1");
    EXPECT_EQ(out[2].document_id, "c1");
    EXPECT_EQ(out[3].document_id, "x1");
}

TEST(DiversityRerankTest, RoundRobinFillsRemainingSlots) {
    Reranker reranker;
    std::vector<SearchResult> in{
        result("t1", 0.9f, "table"), result("t2", 0.85f, "table"), result("m1", 0.7f, "metric"),
    };
    auto out = reranker.diversity_rerank(in, "chunk_type", 10);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].document_id, "t1");
    EXPECT_EQ(out[1].document_id, "m1");
    EXPECT_EQ(out[2].document_id, "t2");
}

TEST(DiversityRerankTest, GroupsOnArbitraryKey) {
    Reranker reranker;
    auto a = result("a", 0.9f, "table");
    a.metadata.set("table_name", std::string("orders"));
    auto b = result("b", 0.8f, "column");
    b.metadata.set("table_name", std::string("orders"));
    auto c = result("c", 0.7f, "column");
    c.metadata.set("table_name", std::string("customers"));

    auto out = reranker.diversity_rerank({a, b, c}, "table_name", 2);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].document_id, "a");
    EXPECT_EQ(out[1].document_id, "c");
}
