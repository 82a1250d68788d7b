#pragma once
#ifndef ORIGIN_CLIENT_H
#define ORIGIN_CLIENT_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * HTTP client for the authoritative (slow) source behind a cache node.
 *
 * fetch("foo") issues GET <base>/foo and expects {"value": "..."}:
 *   200 -> value
 *   404 -> no value
 *   anything else, unreachable origin, malformed body -> std::runtime_error
 *
 * Copyable and stateless between calls, so one instance can serve as both
 * resolver and revalidator across threads.
 */
class OriginClient {
public:
    using Filler = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @param base_url   e.g. "http://127.0.0.1:8080" or "http://origin:8080/items"
     * @param timeout_ms Connect/read/write timeout per request
     * @throws CacheConfigError if base_url has no http:// or https:// scheme
     */
    explicit OriginClient(const std::string& base_url, uint64_t timeout_ms = 2000);

    std::optional<std::string> fetch(const std::string& key) const;

    /// Adapter for CacheOptions::resolvers / revalidators.
    Filler as_filler() const;

    const std::string& host() const { return host_; }
    const std::string& path_prefix() const { return path_prefix_; }

private:
    std::string host_;          ///< scheme://host[:port]
    std::string path_prefix_;   ///< "" or "/items" (no trailing slash)
    uint64_t timeout_ms_;
};

#endif // ORIGIN_CLIENT_H
