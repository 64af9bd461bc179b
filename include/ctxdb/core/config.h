#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "ctxdb/core/result.h"

namespace ctxdb {
namespace core {

/**
 * @brief Configuration for per-model vector indexes
 */
struct IndexConfig {
    size_t initial_capacity;    // Records reserved when an index is created

    IndexConfig() : initial_capacity(0) {}

    static IndexConfig Default() {
        IndexConfig config;
        config.initial_capacity = 1024;
        return config;
    }
};

/**
 * @brief Configuration for the model registry
 */
struct RegistryConfig {
    size_t num_shards;          // Lock shards, must be >= 1

    RegistryConfig() : num_shards(16) {}

    static RegistryConfig Default() {
        return RegistryConfig();
    }
};

/**
 * @brief Configuration for the namespace/workspace/repository catalog
 */
struct CatalogConfig {
    std::string snapshot_path;  // Empty keeps the catalog in memory only
    bool bootstrap_default = true;  // Create root/default/main when opening an empty catalog

    static CatalogConfig Default() {
        return CatalogConfig();
    }
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Configuration for the HTTP API server
 */
struct ServerConfig {
    std::string listen_address = "0.0.0.0";  // Listen address
    uint16_t port = 8001;                    // Listen port
    size_t num_threads = 8;                  // Number of worker threads
    int timeout_seconds = 30;                // Read/write timeout
    size_t max_connections = 1000;           // Maximum concurrent connections
};

/**
 * @brief Top-level process configuration
 *
 * JSON layout:
 * ```
 * {
 *   "index":    {"initial_capacity": 1024},
 *   "registry": {"num_shards": 16},
 *   "catalog":  {"snapshot_path": "/var/lib/ctxdb/catalog.json", "bootstrap_default": true},
 *   "logging":  {"level": "info"},
 *   "server":   {"listen_address": "0.0.0.0", "port": 8001, "num_threads": 8,
 *                "timeout_seconds": 30, "max_connections": 1000}
 * }
 * ```
 * Missing sections and keys keep their defaults.
 */
struct Config {
    IndexConfig index = IndexConfig::Default();
    RegistryConfig registry = RegistryConfig::Default();
    CatalogConfig catalog = CatalogConfig::Default();
    LoggingConfig logging;
    ServerConfig server;

    static Config Default() { return Config(); }

    static Result<Config> FromJson(const std::string& text);
    static Result<Config> FromFile(const std::string& path);
};

} // namespace core
} // namespace ctxdb
