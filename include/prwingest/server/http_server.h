#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "prwingest/core/context.h"
#include "prwingest/core/types.h"
#include "prwingest/server/request.h"

namespace prwingest {
namespace server {

/**
 * @brief Configuration for the remote-write HTTP server
 */
struct ServerConfig {
    std::string listen_address = "127.0.0.1";  // Listen address
    uint16_t port = 1234;                      // Listen port, 0 picks a free one
    std::string listen_path = "/write";        // Remote-write endpoint
    size_t num_threads = 8;                    // Worker threads
    int timeout_seconds = 30;                  // Request timeout
    size_t max_connections = 1000;             // Concurrent POST handler calls before 503; only binds below num_threads
};

/**
 * @brief Handler function type for HTTP endpoints
 *
 * The context expires after the configured request timeout.
 */
using RequestHandler = std::function<Response(const core::Context& ctx, const Request& request)>;

/**
 * @brief Source of the datapoints served on /metrics
 */
using MetricsProvider = std::function<std::vector<core::Datapoint>()>;

/**
 * @brief HTTP server for the remote-write receiver
 *
 * Serves registered POST handlers, GET /health and GET /metrics on a pool of
 * worker threads.
 */
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @throws ServerError if already running or the address cannot be bound
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
     * @brief Register a POST handler; the body is streamed to the handler on demand
     * @param path The endpoint path (e.g., "/write")
     * @param handler The handler function
     */
    void RegisterHandler(const std::string& path, RequestHandler handler);

    void SetMetricsProvider(MetricsProvider provider);

    /**
     * @brief Bound port, valid after Start()
     */
    int port() const;

    uint64_t request_count() const;

    const ServerConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

// Exception classes
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace server
} // namespace prwingest
