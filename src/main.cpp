// semdex: semantic retrieval and caching service
#include "config.hpp"
#include "embedding_backend.hpp"
#include "errors.hpp"
#include "server.hpp"
#include <cstring>
#include <iostream>

namespace {

void print_usage(const char* prog) {
    std::cerr << "usage: " << prog << " [--config <settings.json>] [--port <port>]" << std::endl;
}

}

int main(int argc, char** argv) {
    std::string config_path = getenv_or("SEMDEX_CONFIG", "");
    std::string port_arg;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    Settings settings;
    try {
        settings = load_settings(config_path);
        if (!port_arg.empty()) {
            settings.server.port = std::stoi(port_arg);
        }
    } catch (const ConfigError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid startup options: " + std::string(e.what()));
        return 1;
    }
    set_log_level(settings.log_level);
    LOG_DEBUG("Effective settings: " + settings.to_json().dump());

    Engine engine;
    try {
        engine.telemetry = std::make_shared<LatencyRecorder>();
        engine.embedder = std::make_shared<EmbeddingProvider>(
            settings.embedding, create_embedding_backend(settings.embedding), engine.telemetry);
        engine.index = std::make_shared<VectorIndex>(engine.embedder, settings.index, engine.telemetry);
        engine.reranker = std::make_shared<Reranker>(settings.rerank, engine.telemetry);
        engine.cache = std::make_shared<SemanticCache>(engine.embedder, settings.cache, engine.telemetry);
    } catch (const SemdexError& e) {
        LOG_ERROR("Failed to start engine [" + e.code() + "]: " + e.what());
        return 1;
    }

    try {
        if (engine.index->load(settings.index.snapshot_path)) {
            LOG_INFO("Restored " + std::to_string(engine.index->count()) + " documents from " +
                     settings.index.snapshot_path);
        } else {
            LOG_INFO("No snapshot at " + settings.index.snapshot_path + ", starting empty");
        }
    } catch (const CorruptSnapshotError& e) {
        // The file is left in place for inspection
        LOG_ERROR(std::string(e.what()) + " (starting with an empty index)");
    }

    Server server(std::move(engine), settings);
    server.run();

    return 0;
}
