#include "server.hpp"
#include "errors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace {

// Accepts {"documents": [...]} or a bare array
std::vector<DocumentInput> parse_documents(const json& body) {
    const json& list = body.is_array() ? body : body.at("documents");
    if (!list.is_array()) {
        throw std::invalid_argument("documents must be an array");
    }

    std::vector<DocumentInput> docs;
    docs.reserve(list.size());
    for (const auto& item : list) {
        DocumentInput doc;
        doc.id = item.at("id").get<std::string>();
        doc.content = item.at("content").get<std::string>();
        doc.metadata = Metadata::from_json(item.value("metadata", json::object()));
        if (item.contains("embedding") && !item["embedding"].is_null()) {
            doc.embedding = item["embedding"].get<std::vector<float>>();
        }
        docs.push_back(std::move(doc));
    }
    return docs;
}

int status_for(const std::string& code) {
    if (code == "DUPLICATE_ID") return 409;
    if (code == "DIMENSION_MISMATCH" || code == "INVALID_CONFIG") return 400;
    if (code == "EMBEDDING_FAILED") return 502;
    return 500;
}

}

Server::Server(Engine engine, Settings settings)
    : engine_(std::move(engine)), settings_(std::move(settings)),
      latency_tracker_(), qps_tracker_(), uptime_() {}

void Server::send_error(httplib::Response& res, int status, const std::string& code,
                        const std::string& message) const {
    res.status = status;
    json error_response;
    error_response["error"]["code"] = code;
    error_response["error"]["message"] = message;
    res.set_content(error_response.dump(), "application/json");
}

void Server::send_engine_error(httplib::Response& res, const SemdexError& e) const {
    LOG_WARN("Request failed [" + e.code() + "]: " + e.what());
    send_error(res, status_for(e.code()), e.code(), e.what());
}

void Server::handle_healthz(const httplib::Request&, httplib::Response& res) {
    res.set_content("ok", "text/plain");
}

void Server::handle_stats(const httplib::Request&, httplib::Response& res) {
    json response;
    response["index"] = engine_.index->stats();
    response["status"] = response["index"]["count"].get<size_t>() > 0 ? "ready" : "empty";
    response["cache"]["entries"] = engine_.cache->size();
    response["cache"]["threshold"] = engine_.cache->threshold();
    response["uptime_sec"] = static_cast<int>(uptime_.elapsed_sec());
    response["qps_1m"] = qps_tracker_.per_second();
    response["latency_ms"]["p50"] = latency_tracker_.percentile(50.0);
    response["latency_ms"]["p95"] = latency_tracker_.percentile(95.0);
    response["latency_ms"]["p99"] = latency_tracker_.percentile(99.0);
    response["operations"] = engine_.telemetry->summary();

    res.set_content(response.dump(), "application/json");
}

void Server::handle_add_documents(const httplib::Request& req, httplib::Response& res) {
    try {
        json json_req;
        try {
            json_req = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, "INVALID_JSON", "Failed to parse JSON: " + std::string(e.what()));
            return;
        }

        std::vector<DocumentInput> docs;
        try {
            docs = parse_documents(json_req);
        } catch (const std::exception& e) {
            send_error(res, 400, "INVALID_FIELD", "Invalid documents: " + std::string(e.what()));
            return;
        }

        std::string trace_id = json_req.is_object() ? json_req.value("trace_id", "") : "";
        size_t added = engine_.index->add_documents(docs, trace_id);

        bool persist = json_req.is_object() && json_req.value("persist", false);
        if (persist) {
            engine_.index->save(settings_.index.snapshot_path);
        }

        json response;
        response["ok"] = true;
        response["added"] = added;
        response["count"] = engine_.index->count();
        response["persisted"] = persist;
        res.set_content(response.dump(), "application/json");
        LOG_INFO("Ingested " + std::to_string(added) + " documents");

    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Ingest request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_delete_document(const httplib::Request& req, httplib::Response& res) {
    try {
        std::string id = req.matches[1];
        if (!engine_.index->delete_document(id)) {
            send_error(res, 404, "NOT_FOUND", "No document with id: " + id);
            return;
        }
        json response;
        response["ok"] = true;
        response["deleted"] = id;
        response["count"] = engine_.index->count();
        res.set_content(response.dump(), "application/json");
    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Delete request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_search(const httplib::Request& req, httplib::Response& res) {
    try {
        json json_req;
        try {
            json_req = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, "INVALID_JSON", "Failed to parse JSON: " + std::string(e.what()));
            return;
        }

        if (!json_req.contains("query") || !json_req["query"].is_string()) {
            send_error(res, 400, "MISSING_FIELD", "Missing required field: query");
            return;
        }
        std::string query = json_req["query"];

        int k = json_req.value("top_k", settings_.server.default_top_k);
        if (k <= 0) {
            send_error(res, 400, "INVALID_VALUE", "top_k must be greater than 0, got: " + std::to_string(k));
            return;
        }
        k = std::min(k, settings_.server.max_top_k);

        std::optional<MetaFilter> filter;
        std::optional<BoostMap> boosts;
        try {
            if (json_req.contains("filter") && !json_req["filter"].is_null()) {
                filter = filter_from_json(json_req["filter"]);
            }
            if (json_req.contains("boosts") && !json_req["boosts"].is_null()) {
                boosts = json_req["boosts"].get<BoostMap>();
            }
        } catch (const std::exception& e) {
            send_error(res, 400, "INVALID_FIELD", "Invalid filter or boosts: " + std::string(e.what()));
            return;
        }

        bool rerank = json_req.value("rerank", true);
        std::string diversity_key = json_req.value("diversity_key", "");
        std::string trace_id = json_req.value("trace_id", "");

        Timer timer;

        // Diversity selects from a wider candidate pool
        size_t fetch = static_cast<size_t>(k);
        if (!diversity_key.empty()) {
            fetch *= std::max<size_t>(1, settings_.index.filter_overfetch);
        }

        auto results = engine_.index->search(query, fetch, filter, trace_id);
        if (!diversity_key.empty()) {
            results = engine_.reranker->diversity_rerank(results, diversity_key, static_cast<size_t>(k));
        } else if (rerank) {
            results = engine_.reranker->rerank(results, query, static_cast<size_t>(k), boosts);
        }

        double latency = timer.elapsed_ms();
        latency_tracker_.record(latency);
        qps_tracker_.record();

        json results_json = json::array();
        for (const auto& r : results) {
            results_json.push_back(r.to_json());
        }

        json response;
        response["results"] = results_json;
        response["latency_ms"] = latency;
        response["backend"] = engine_.index->backend_name();

        res.set_content(response.dump(), "application/json");

        log_event("search", latency, {{"k", k}, {"results", results.size()},
                                      {"backend", response["backend"]}, {"trace_id", trace_id}});

    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Search request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_cache_lookup(const httplib::Request& req, httplib::Response& res) {
    try {
        json json_req;
        try {
            json_req = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, "INVALID_JSON", "Failed to parse JSON: " + std::string(e.what()));
            return;
        }
        if (!json_req.contains("query") || !json_req["query"].is_string()) {
            send_error(res, 400, "MISSING_FIELD", "Missing required field: query");
            return;
        }

        std::string query = json_req["query"];
        auto hit = engine_.cache->lookup(query, json_req.value("trace_id", ""));

        json response;
        response["hit"] = hit.has_value();
        if (hit) {
            response["query"] = query;
            response["cached_query"] = hit->entry.query;
            response["generated_query"] = hit->entry.generated_query;
            response["result_payload"] = hit->entry.result_payload;
            response["answer"] = hit->entry.answer;
            response["similarity_score"] = round_to(hit->similarity, 4);
            response["created_at"] = hit->entry.created_at;
        }
        res.set_content(response.dump(), "application/json");

    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Cache lookup failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_cache_store(const httplib::Request& req, httplib::Response& res) {
    try {
        json json_req;
        try {
            json_req = json::parse(req.body);
        } catch (const json::parse_error& e) {
            send_error(res, 400, "INVALID_JSON", "Failed to parse JSON: " + std::string(e.what()));
            return;
        }
        for (const char* field : {"query", "generated_query", "answer"}) {
            if (!json_req.contains(field) || !json_req[field].is_string()) {
                send_error(res, 400, "MISSING_FIELD", std::string("Missing required field: ") + field);
                return;
            }
        }

        StoreOutcome outcome = engine_.cache->store(
            json_req["query"].get<std::string>(),
            json_req["generated_query"].get<std::string>(),
            json_req.value("result_payload", json()),
            json_req["answer"].get<std::string>(),
            json_req.value("trace_id", ""));

        json response;
        response["ok"] = true;
        response["outcome"] = to_string(outcome);
        if (outcome == StoreOutcome::StoredNotPersisted) {
            response["warning"] = "entry cached in memory but could not be written to " + engine_.cache->path();
        }
        res.set_content(response.dump(), "application/json");

    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Cache store failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_snapshot_save(const httplib::Request& req, httplib::Response& res) {
    try {
        std::string path = settings_.index.snapshot_path;
        if (!req.body.empty()) {
            path = json::parse(req.body).value("path", path);
        }
        engine_.index->save(path);

        json response;
        response["ok"] = true;
        response["path"] = path;
        response["count"] = engine_.index->count();
        res.set_content(response.dump(), "application/json");

    } catch (const json::exception& e) {
        send_error(res, 400, "INVALID_JSON", "Invalid request body: " + std::string(e.what()));
    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Snapshot save failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_snapshot_load(const httplib::Request& req, httplib::Response& res) {
    try {
        std::string path = settings_.index.snapshot_path;
        if (!req.body.empty()) {
            path = json::parse(req.body).value("path", path);
        }

        LOG_INFO("Loading snapshot from: " + path);
        bool loaded = engine_.index->load(path);

        json response;
        response["ok"] = true;
        response["loaded"] = loaded;
        response["path"] = path;
        response["count"] = engine_.index->count();
        response["dim"] = engine_.index->dimension();
        res.set_content(response.dump(), "application/json");

    } catch (const json::exception& e) {
        send_error(res, 400, "INVALID_JSON", "Invalid request body: " + std::string(e.what()));
    } catch (const SemdexError& e) {
        send_engine_error(res, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Snapshot load failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_root(const httplib::Request&, httplib::Response& res) {
    std::string html = "<html><body><h2>semdex</h2>"
                       "<p>Endpoints: <code>/healthz</code>, <code>/stats</code>, <code>/documents</code>, "
                       "<code>/search</code>, <code>/cache/lookup</code>, <code>/cache/store</code>, "
                       "<code>/snapshot/save</code>, <code>/snapshot/load</code></p>"
                       "</body></html>";
    res.set_content(html, "text/html");
}

void Server::run() {
    httplib::Server svr;

    svr.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        handle_healthz(req, res);
    });

    svr.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    svr.Post("/documents", [this](const httplib::Request& req, httplib::Response& res) {
        handle_add_documents(req, res);
    });

    svr.Delete(R"(/documents/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete_document(req, res);
    });

    svr.Post("/search", [this](const httplib::Request& req, httplib::Response& res) {
        handle_search(req, res);
    });

    svr.Post("/cache/lookup", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cache_lookup(req, res);
    });

    svr.Post("/cache/store", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cache_store(req, res);
    });

    svr.Post("/snapshot/save", [this](const httplib::Request& req, httplib::Response& res) {
        handle_snapshot_save(req, res);
    });

    svr.Post("/snapshot/load", [this](const httplib::Request& req, httplib::Response& res) {
        handle_snapshot_load(req, res);
    });

    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });

    LOG_INFO("starting server on " + settings_.server.host + ":" + std::to_string(settings_.server.port));
    if (!svr.listen(settings_.server.host, settings_.server.port)) {
        LOG_ERROR("Failed to listen on " + settings_.server.host + ":" + std::to_string(settings_.server.port));
    }
}
