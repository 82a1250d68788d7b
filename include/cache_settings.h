#pragma once
#ifndef CACHE_SETTINGS_H
#define CACHE_SETTINGS_H

#include "cache.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * File-level configuration of a cache node, e.g.
 *
 *   {
 *     "ttl_ms": 30000,
 *     "max_size": 1000,
 *     "reset_ttl_on_get": false,
 *     "revalidate_on_get": true,
 *     "origin": "http://127.0.0.1:8080/items",
 *     "log_level": "info"
 *   }
 *
 * Unknown keys are ignored. Missing keys keep their defaults.
 */
struct CacheSettings {
    uint64_t ttl_ms = 60000;
    std::optional<size_t> max_size;     ///< null or absent = unbounded
    bool reset_ttl_on_get = false;
    bool revalidate_on_get = false;
    std::string origin;                 ///< Base URL of the authoritative source, empty = none
    LogLevel log_level = LogLevel::Info;
};

/**
 * @throws CacheConfigError on wrong types or out-of-range values
 */
CacheSettings parse_settings(const nlohmann::json& j);

/**
 * Read and parse a JSON settings file.
 * @throws CacheConfigError if the file is unreadable or not valid JSON
 */
CacheSettings load_settings(const std::string& path);

/**
 * Cache options carrying the settings' TTL, bound and flags.
 * Filling functions and the keep-alive hook are left for the caller.
 */
template <typename K, typename V>
CacheOptions<K, V> make_cache_options(const CacheSettings& settings) {
    CacheOptions<K, V> options;
    options.ttl = std::chrono::milliseconds(settings.ttl_ms);
    options.max_size = settings.max_size;
    options.reset_ttl_on_get = settings.reset_ttl_on_get;
    options.revalidate_on_get = settings.revalidate_on_get;
    return options;
}

#endif // CACHE_SETTINGS_H
