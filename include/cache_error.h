#pragma once
#ifndef CACHE_ERROR_H
#define CACHE_ERROR_H

#include <stdexcept>
#include <string>

/**
 * Raised for configuration mistakes: invalid cache options, malformed
 * settings, or revalidate() called while no revalidator is available.
 *
 * Resolver and revalidator failures are never reported with this type;
 * the cache absorbs those.
 */
class CacheConfigError : public std::logic_error {
public:
    explicit CacheConfigError(const std::string& what) : std::logic_error(what) {}
};

#endif // CACHE_ERROR_H
