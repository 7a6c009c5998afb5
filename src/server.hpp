#pragma once

#include <memory>
#include <string>
#include "config.hpp"
#include "errors.hpp"
#include "reranker.hpp"
#include "semantic_cache.hpp"
#include "telemetry.hpp"
#include "util.hpp"
#include "vector_index.hpp"

namespace httplib {
struct Request;
struct Response;
class Server;
}

// Components the service answers from; built once in main
struct Engine {
    std::shared_ptr<EmbeddingProvider> embedder;
    std::shared_ptr<VectorIndex> index;
    std::shared_ptr<Reranker> reranker;
    std::shared_ptr<SemanticCache> cache;
    std::shared_ptr<LatencyRecorder> telemetry;
};

class Server {
public:
    Server(Engine engine, Settings settings);
    void run();

    // Route handlers
    void handle_healthz(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_add_documents(const httplib::Request& req, httplib::Response& res);
    void handle_delete_document(const httplib::Request& req, httplib::Response& res);
    void handle_search(const httplib::Request& req, httplib::Response& res);
    void handle_cache_lookup(const httplib::Request& req, httplib::Response& res);
    void handle_cache_store(const httplib::Request& req, httplib::Response& res);
    void handle_snapshot_save(const httplib::Request& req, httplib::Response& res);
    void handle_snapshot_load(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);

private:
    void send_error(httplib::Response& res, int status, const std::string& code,
                    const std::string& message) const;
    void send_engine_error(httplib::Response& res, const SemdexError& e) const;

    Engine engine_;
    Settings settings_;
    LatencyTracker latency_tracker_;
    RateTracker qps_tracker_;
    Timer uptime_;
};
