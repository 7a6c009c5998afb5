#include <gtest/gtest.h>
#include "errors.hpp"
#include "server.hpp"
#include "test_helpers.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Comes up fine, then fails every embedding call
class BrokenModelBackend : public EmbeddingBackend {
public:
    size_t initialize() override { return 3; }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>&) override {
        throw EmbeddingError("model server went away");
    }

    std::string name() const override { return "broken"; }
};

Engine make_engine(std::shared_ptr<EmbeddingProvider> embedder, const TempDir& dir) {
    Engine engine;
    engine.telemetry = std::make_shared<LatencyRecorder>(100, false);
    engine.embedder = std::move(embedder);
    engine.index = std::make_shared<VectorIndex>(engine.embedder, IndexConfig(), engine.telemetry);
    engine.reranker = std::make_shared<Reranker>(RerankConfig(), engine.telemetry);
    CacheConfig cache_config;
    cache_config.path = dir.file("cache.json");
    engine.cache = std::make_shared<SemanticCache>(engine.embedder, cache_config, engine.telemetry);
    return engine;
}

DocumentInput typed_doc(const std::string& id, std::vector<float> embedding, const std::string& chunk_type) {
    DocumentInput doc;
    doc.id = id;
    doc.content = "document " + id;
    doc.embedding = std::move(embedding);
    doc.metadata.set("chunk_type", chunk_type);
    return doc;
}

httplib::Request post(const json& body) {
    httplib::Request req;
    req.method = "POST";
    req.body = body.dump();
    return req;
}

}

TEST(ServerTest, DiversitySearchLooksPastTheTopK) {
    TempDir dir;
    const size_t dim = 32;
    const std::string query = "revenue by region";
    auto near = EmbeddingProvider::fallback_vector(query, dim);
    auto far = EmbeddingProvider::fallback_vector("unrelated words", dim);

    Engine engine = make_engine(make_fallback_provider(dim), dir);
    engine.index->add_documents({
        typed_doc("t1", near, "table"),
        typed_doc("t2", near, "table"),
        typed_doc("t3", near, "table"),
        typed_doc("m1", far, "metric"),
        typed_doc("m2", far, "metric"),
    });
    Server server(engine, Settings());

    httplib::Response res;
    server.handle_search(post({{"query", query}, {"top_k", 3}, {"diversity_key", "chunk_type"}}), res);

    json body = json::parse(res.body);
    ASSERT_EQ(body["results"].size(), 3u);
    EXPECT_EQ(body["results"][0]["metadata"]["chunk_type"], "table");
    EXPECT_EQ(body["results"][1]["metadata"]["chunk_type"], "metric");
    EXPECT_EQ(body["results"][2]["metadata"]["chunk_type"], "table");
}

TEST(ServerTest, EmbeddingFailureIsBadGateway) {
    TempDir dir;
    EmbeddingConfig config;
    auto provider = std::make_shared<EmbeddingProvider>(config, std::make_unique<BrokenModelBackend>());
    Engine engine = make_engine(provider, dir);
    engine.index->add_documents({typed_doc("a", {1, 0, 0}, "table")});
    Server server(engine, Settings());

    httplib::Response res;
    server.handle_search(post({{"query", "orders"}}), res);

    EXPECT_EQ(res.status, 502);
    EXPECT_EQ(json::parse(res.body)["error"]["code"], "EMBEDDING_FAILED");
}

TEST(ServerTest, DuplicateDocumentIsConflict) {
    TempDir dir;
    Server server(make_engine(make_fallback_provider(3), dir), Settings());
    json body = {{"documents", {{{"id", "a"}, {"content", "orders"}, {"embedding", {1, 0, 0}}}}}};

    httplib::Response first;
    server.handle_add_documents(post(body), first);
    EXPECT_EQ(json::parse(first.body)["added"], 1);

    httplib::Response second;
    server.handle_add_documents(post(body), second);
    EXPECT_EQ(second.status, 409);
    EXPECT_EQ(json::parse(second.body)["error"]["code"], "DUPLICATE_ID");
}

TEST(ServerTest, StatsLeaveTheModelAlone) {
    TempDir dir;
    EmbeddingConfig config;
    auto provider = std::make_shared<EmbeddingProvider>(config, std::make_unique<BrokenModelBackend>());
    Server server(make_engine(provider, dir), Settings());

    httplib::Response res;
    server.handle_stats(httplib::Request(), res);

    json body = json::parse(res.body);
    EXPECT_EQ(body["index"]["embedding"]["status"], "uninitialized");
    EXPECT_EQ(body["status"], "empty");
    EXPECT_FALSE(provider->initialized());
}
