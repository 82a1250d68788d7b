#pragma once
#ifndef API_H
#define API_H

#include "cache.h"
#include "httplib.h"
#include <memory>
#include <string>

using StringCache = Cache<std::string, std::string>;

/**
 * REST API wrapper around a string cache.
 *
 *   GET    /cache/<key>             value, resolving misses through the cache's resolvers
 *   PUT    /cache/<key>             body {"value": "..."}
 *   DELETE /cache/<key>
 *   POST   /cache/<key>/revalidate  409 when no revalidator is configured
 *   GET    /metrics                 Prometheus text
 *   GET    /healthz
 */
class CacheAPI {
public:
    /**
     * Constructor
     * @param cache Shared pointer to Cache instance
     */
    explicit CacheAPI(std::shared_ptr<StringCache> cache);

    /**
     * Register routes and serve until stop() is called. Blocks.
     * @param host Host to bind (e.g. "0.0.0.0")
     * @param port Port to bind
     * @throws std::runtime_error if the port cannot be bound
     */
    void start(const std::string& host, int port);

    /**
     * Stop serving; start() returns afterwards.
     */
    void stop();

private:
    /**
     * Log an incoming request with method, path, and status code
     */
    void logRequest(const std::string& method, const std::string& path, int status);
    void registerRoutes();

    std::shared_ptr<StringCache> cache_;
    httplib::Server server_;
};

/**
 * Prometheus exposition of the cache's counters and configuration.
 */
std::string make_prometheus_metrics(const StringCache& cache);

#endif // API_H
