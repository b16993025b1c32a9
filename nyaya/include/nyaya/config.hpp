#pragma once
// Configuration: storage, engine and validator settings
//
// A config file is JSON; every key is optional:
//   {
//     "storage":   {"backend": "sqlite", "path": "/var/lib/nyaya/store"},
//     "engine":    {"max_iterations": 64, "max_depth": 32},
//     "validator": {"functional": ["age"], "exclusive": [["alive", "dead"]],
//                   "temporal": "before"},
//     "verbose": false
//   }

#include "inference.hpp"
#include "log_backend.hpp"
#include "sqlite_backend.hpp"
#include "validator.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace nyaya {

enum class BackendKind : uint8_t {
    Memory = 0,
    Sqlite = 1,
    Log = 2,
};

inline const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Memory: return "memory";
        case BackendKind::Sqlite: return "sqlite";
        case BackendKind::Log: return "log";
    }
    return "unknown";
}

inline std::optional<BackendKind> parse_backend_kind(const std::string& s) {
    if (s == "memory") return BackendKind::Memory;
    if (s == "sqlite") return BackendKind::Sqlite;
    if (s == "log") return BackendKind::Log;
    return std::nullopt;
}

inline std::string default_store_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.nyaya/store";
}

struct StorageConfig {
    BackendKind kind = BackendKind::Sqlite;
    std::string path = default_store_path();
};

struct Config {
    StorageConfig storage;
    EngineConfig engine;
    ValidatorConfig validator;
    bool verbose = false;

    static Config defaults() { return Config{}; }
};

namespace detail {

// Non-negative integer setting; absent keys keep the fallback
inline size_t count_value(const nlohmann::json& j, const char* key, size_t fallback,
                          const std::string& path) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        throw GraphError(GraphErrorKind::Config, path + ": " + key + " must be an integer");
    }
    int64_t n = v.get<int64_t>();
    if (n < 0) {
        throw GraphError(GraphErrorKind::Config, path + ": " + key + " must not be negative");
    }
    return static_cast<size_t>(n);
}

} // namespace detail

// Throws GraphError{Config} on unreadable or malformed files
inline Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw GraphError(GraphErrorKind::Config, "cannot open " + path);

    Config config = Config::defaults();
    try {
        auto j = nlohmann::json::parse(in);
        if (!j.is_object()) throw GraphError(GraphErrorKind::Config, path + ": expected an object");

        if (j.contains("storage")) {
            const auto& s = j["storage"];
            std::string backend = s.value("backend", std::string(to_string(config.storage.kind)));
            auto kind = parse_backend_kind(backend);
            if (!kind) throw GraphError(GraphErrorKind::Config, path + ": unknown backend '" + backend + "'");
            config.storage.kind = *kind;
            config.storage.path = s.value("path", config.storage.path);
        }

        if (j.contains("engine")) {
            const auto& e = j["engine"];
            config.engine.max_iterations = detail::count_value(e, "max_iterations", config.engine.max_iterations, path);
            config.engine.max_depth = detail::count_value(e, "max_depth", config.engine.max_depth, path);
        }

        if (j.contains("validator")) {
            const auto& v = j["validator"];
            if (v.contains("functional")) {
                for (const auto& p : v["functional"]) {
                    config.validator.functional_predicates.insert(p.get<std::string>());
                }
            }
            if (v.contains("exclusive")) {
                for (const auto& pair : v["exclusive"]) {
                    if (!pair.is_array() || pair.size() != 2) {
                        throw GraphError(GraphErrorKind::Config, path + ": exclusive entries are [p, q] pairs");
                    }
                    config.validator.exclusive_pairs.emplace_back(pair[0].get<std::string>(),
                                                                  pair[1].get<std::string>());
                }
            }
            config.validator.temporal_predicate = v.value("temporal", config.validator.temporal_predicate);
        }

        config.verbose = j.value("verbose", config.verbose);
    } catch (const nlohmann::json::exception& e) {
        throw GraphError(GraphErrorKind::Config, path + ": " + e.what());
    }
    return config;
}

// Parent directories of file-backed stores are created on demand
inline std::unique_ptr<StorageBackend> open_backend(const StorageConfig& config) {
    if (config.kind != BackendKind::Memory && config.path != ":memory:") {
        auto slash = config.path.find_last_of('/');
        if (slash != std::string::npos && slash > 0) {
            std::string dir = config.path.substr(0, slash);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw GraphError::unavailable("cannot create " + dir + ": " + ec.message());
            }
        }
    }

    switch (config.kind) {
        case BackendKind::Memory:
            return std::make_unique<MemoryBackend>();
        case BackendKind::Sqlite:
            return std::make_unique<SqliteBackend>(config.path);
        case BackendKind::Log:
            return std::make_unique<LogBackend>(config.path);
    }
    throw GraphError(GraphErrorKind::Config, "unknown backend kind");
}

} // namespace nyaya
