#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct EmbeddingConfig {
    std::string backend{"ollama"};            // "ollama" or "none"
    std::string url{"http://localhost:11434"};
    std::string model{"all-minilm"};
    size_t batch_size{32};
    size_t fallback_dimension{384};
    int init_timeout_ms{5000};
    int request_timeout_ms{60000};
};

struct IndexConfig {
    std::string backend{"flat_ip"};           // "flat_ip" or "bruteforce"
    std::string snapshot_path{"./data/vector_store.snap"};
    size_t filter_overfetch{3};
};

struct RerankConfig {
    std::map<std::string, float> boosts{
        {"table", 1.2f},
        {"metric", 1.3f},
        {"column", 1.0f},
        {"relationship", 0.9f},
        {"query", 1.1f},
        {"example", 1.25f},
    };
    float substring_boost{1.3f};
    float overlap3_boost{1.2f};
    float overlap2_boost{1.1f};
    float overlap1_boost{1.05f};
};

struct CacheConfig {
    std::string path{"./data/semantic_cache.json"};
    float threshold{0.95f};
    size_t capacity{1000};                    // 0 = unbounded
    double ttl_sec{0.0};                      // 0 = never expires
};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int default_top_k{5};
    int max_top_k{100};
};

struct Settings {
    EmbeddingConfig embedding;
    IndexConfig index;
    RerankConfig rerank;
    CacheConfig cache;
    ServerConfig server;
    std::string log_level{"INFO"};

    nlohmann::json to_json() const;
};

// Overlays keys present in j onto settings; absent keys keep their value.
// Throws ConfigError on a wrongly typed key.
void apply_settings_json(Settings& settings, const nlohmann::json& j);

// Overlays SEMDEX_* environment variables
void apply_settings_env(Settings& settings);

// Defaults, then the JSON file at path (skipped when empty or missing), then env.
// Throws ConfigError when the file exists but cannot be parsed.
Settings load_settings(const std::string& path);

std::string getenv_or(const char* key, const std::string& def);
