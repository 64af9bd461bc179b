#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <rapidjson/document.h>

#include "ctxdb/core/config.h"
#include "ctxdb/server/request.h"

namespace ctxdb {
namespace server {

/**
 * @brief Handler function type for HTTP endpoints
 */
using RequestHandler = std::function<Response(const Request& request)>;

/**
 * @brief Adds entries to the /metrics document
 */
using MetricsProvider = std::function<void(rapidjson::Document& doc)>;

/**
 * @brief HTTP server for the context database API
 *
 * Serves /health and /metrics itself; everything else is delegated to
 * registered handlers.
 */
class HttpServer {
public:
    explicit HttpServer(const core::ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Binds the listen address and starts serving on a background thread
     * @throws ServerError if the address cannot be bound
     */
    void Start();

    /**
     * @brief Stop the HTTP server
     */
    void Stop();

    /**
     * @brief Check if server is running
     */
    bool IsRunning() const;

    /**
     * @brief Port actually bound; differs from the configured one when that is 0
     */
    int BoundPort() const;

    /**
     * @brief Register a handler for GET, POST, PUT and DELETE requests
     * @param pattern Path regular expression (e.g., "/namespaces(/.*)?")
     * @param handler The handler function
     */
    void RegisterHandler(const std::string& pattern, RequestHandler handler);

    void SetMetricsProvider(MetricsProvider provider);

    /**
     * @brief Get server metrics
     * @return JSON string with server metrics
     */
    std::string GetMetrics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace server
} // namespace ctxdb
