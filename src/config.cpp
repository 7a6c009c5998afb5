#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <type_traits>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out, const std::string& section) {
    if (!obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for " + section + "." + key + ": " + e.what());
    }
}

const json& section_of(const json& j, const char* name) {
    static const json empty = json::object();
    if (!j.contains(name)) return empty;
    const json& s = j.at(name);
    if (!s.is_object()) {
        throw ConfigError(std::string("Section '") + name + "' must be an object");
    }
    return s;
}

template <typename T>
void env_number(const char* key, T& out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return;
    try {
        if constexpr (std::is_floating_point<T>::value) {
            out = static_cast<T>(std::stod(v));
        } else {
            out = static_cast<T>(std::stol(v));
        }
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid numeric value for ") + key + ": " + v);
    }
}

}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

json Settings::to_json() const {
    json j;
    j["log_level"] = log_level;
    j["embedding"] = {
        {"backend", embedding.backend},
        {"url", embedding.url},
        {"model", embedding.model},
        {"batch_size", embedding.batch_size},
        {"fallback_dimension", embedding.fallback_dimension},
        {"init_timeout_ms", embedding.init_timeout_ms},
        {"request_timeout_ms", embedding.request_timeout_ms},
    };
    j["index"] = {
        {"backend", index.backend},
        {"snapshot_path", index.snapshot_path},
        {"filter_overfetch", index.filter_overfetch},
    };
    j["rerank"] = {
        {"boosts", rerank.boosts},
        {"substring_boost", rerank.substring_boost},
        {"overlap3_boost", rerank.overlap3_boost},
        {"overlap2_boost", rerank.overlap2_boost},
        {"overlap1_boost", rerank.overlap1_boost},
    };
    j["cache"] = {
        {"path", cache.path},
        {"threshold", cache.threshold},
        {"capacity", cache.capacity},
        {"ttl_sec", cache.ttl_sec},
    };
    j["server"] = {
        {"host", server.host},
        {"port", server.port},
        {"default_top_k", server.default_top_k},
        {"max_top_k", server.max_top_k},
    };
    return j;
}

void apply_settings_json(Settings& settings, const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Settings root must be an object");
    }
    read_key(j, "log_level", settings.log_level, "root");

    const json& e = section_of(j, "embedding");
    read_key(e, "backend", settings.embedding.backend, "embedding");
    read_key(e, "url", settings.embedding.url, "embedding");
    read_key(e, "model", settings.embedding.model, "embedding");
    read_key(e, "batch_size", settings.embedding.batch_size, "embedding");
    read_key(e, "fallback_dimension", settings.embedding.fallback_dimension, "embedding");
    read_key(e, "init_timeout_ms", settings.embedding.init_timeout_ms, "embedding");
    read_key(e, "request_timeout_ms", settings.embedding.request_timeout_ms, "embedding");

    const json& i = section_of(j, "index");
    read_key(i, "backend", settings.index.backend, "index");
    read_key(i, "snapshot_path", settings.index.snapshot_path, "index");
    read_key(i, "filter_overfetch", settings.index.filter_overfetch, "index");

    const json& r = section_of(j, "rerank");
    if (r.contains("boosts")) {
        // Merged over the defaults
        std::map<std::string, float> boosts;
        read_key(r, "boosts", boosts, "rerank");
        for (const auto& [type, factor] : boosts) {
            settings.rerank.boosts[type] = factor;
        }
    }
    read_key(r, "substring_boost", settings.rerank.substring_boost, "rerank");
    read_key(r, "overlap3_boost", settings.rerank.overlap3_boost, "rerank");
    read_key(r, "overlap2_boost", settings.rerank.overlap2_boost, "rerank");
    read_key(r, "overlap1_boost", settings.rerank.overlap1_boost, "rerank");

    const json& c = section_of(j, "cache");
    read_key(c, "path", settings.cache.path, "cache");
    read_key(c, "threshold", settings.cache.threshold, "cache");
    read_key(c, "capacity", settings.cache.capacity, "cache");
    read_key(c, "ttl_sec", settings.cache.ttl_sec, "cache");

    const json& s = section_of(j, "server");
    read_key(s, "host", settings.server.host, "server");
    read_key(s, "port", settings.server.port, "server");
    read_key(s, "default_top_k", settings.server.default_top_k, "server");
    read_key(s, "max_top_k", settings.server.max_top_k, "server");

    if (settings.embedding.batch_size == 0) {
        throw ConfigError("embedding.batch_size must be greater than 0");
    }
    if (settings.embedding.fallback_dimension == 0) {
        throw ConfigError("embedding.fallback_dimension must be greater than 0");
    }
    if (settings.cache.threshold < -1.0f || settings.cache.threshold > 1.0f) {
        throw ConfigError("cache.threshold must be within [-1, 1]");
    }
}

void apply_settings_env(Settings& settings) {
    settings.log_level = getenv_or("SEMDEX_LOG_LEVEL", settings.log_level);
    settings.embedding.url = getenv_or("SEMDEX_EMBED_URL", settings.embedding.url);
    settings.embedding.model = getenv_or("SEMDEX_EMBED_MODEL", settings.embedding.model);
    settings.embedding.backend = getenv_or("SEMDEX_EMBED_BACKEND", settings.embedding.backend);
    settings.index.backend = getenv_or("SEMDEX_INDEX_BACKEND", settings.index.backend);
    settings.index.snapshot_path = getenv_or("SEMDEX_SNAPSHOT_PATH", settings.index.snapshot_path);
    settings.cache.path = getenv_or("SEMDEX_CACHE_PATH", settings.cache.path);
    env_number("SEMDEX_CACHE_THRESHOLD", settings.cache.threshold);
    env_number("SEMDEX_PORT", settings.server.port);
}

Settings load_settings(const std::string& path) {
    Settings settings;

    if (!path.empty()) {
        if (!std::filesystem::exists(path)) {
            LOG_WARN("Settings file not found, using defaults: " + path);
        } else {
            std::ifstream f(path);
            if (!f.is_open()) {
                throw ConfigError("Failed to open settings file: " + path);
            }
            json j;
            try {
                f >> j;
            } catch (const json::parse_error& e) {
                throw ConfigError("Failed to parse settings file " + path + ": " + e.what());
            }
            apply_settings_json(settings, j);
            LOG_INFO("Loaded settings from: " + path);
        }
    }

    apply_settings_env(settings);
    return settings;
}
