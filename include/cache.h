#pragma once
#ifndef CACHE_H
#define CACHE_H

#include "cache_error.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * One stored value plus the moment it was last written.
 * An entry is expired iff now >= written_at + ttl.
 */
template <typename V>
struct Entry {
    using clock = std::chrono::steady_clock;

    clock::time_point written_at;   ///< Last insert/refresh, never a plain read
    clock::duration ttl;            ///< Copied from the cache at write time
    V value;                        ///< Stored value

    clock::time_point expires_at() const { return written_at + ttl; }
    bool expired(clock::time_point now) const { return now >= expires_at(); }
};

/**
 * Snapshot of cache counters.
 */
struct CacheStats {
    size_t hits = 0;            ///< get() calls answered from a live entry
    size_t misses = 0;          ///< get() calls that found nothing live
    size_t resolutions = 0;     ///< misses filled by a resolver
    size_t revalidations = 0;   ///< completed revalidation runs
    size_t evictions = 0;       ///< least-recently-written entries dropped for capacity
    size_t expirations = 0;     ///< expired entries dropped on read or during a sweep
};

/**
 * Construction options. Immutable once handed to the cache.
 *
 * Resolvers and revalidators are tried in order; the first one returning a
 * value wins. Returning std::nullopt or throwing (any type) means "this source
 * had nothing". They run without any cache lock held and may be called
 * concurrently from several threads.
 */
template <typename K, typename V>
struct CacheOptions {
    using Resolver = std::function<std::optional<V>(const K&)>;
    using Revalidator = Resolver;
    using KeepAlive = std::function<void(std::future<void>)>;

    std::chrono::milliseconds ttl{0};      ///< Required, must be positive
    std::optional<size_t> max_size;        ///< Unset = unbounded
    bool reset_ttl_on_get = false;         ///< Re-stamp written_at on every hit
    /// Background revalidate() on every non-resolved hit. Each launch is its
    /// own detached thread with no pooling or rate limit, so a hot key starts
    /// one thread per read.
    bool revalidate_on_get = false;
    std::vector<Resolver> resolvers;       ///< Miss-filling pipeline
    std::vector<Revalidator> revalidators; ///< Staleness-check pipeline
    KeepAlive keep_alive;                  ///< Receives every detached task's completion future
};

namespace cache_detail {

/// Log an absorbed resolver/revalidator failure.
void log_filler_failure(const char* kind, size_t index, const std::string& what);

/// Log the outcome of a capacity sweep.
void log_sweep(size_t expired_removed, bool candidate_evicted, size_t size_after);

/// Log a background revalidation that could not run or failed.
void log_background_failure(const std::string& what);

/// Message used when revalidate() finds no revalidator.
const char* missing_revalidator_message();

} // namespace cache_detail

/**
 * In-process key/value cache with:
 * - TTL expiry, checked lazily on get() and opportunistically during sweeps
 *   (no background timer; size() includes expired entries not yet observed)
 * - Optional max_size bound enforced in set() by evicting the
 *   least-recently-WRITTEN entry. Reads do not count as writes unless
 *   reset_ttl_on_get is enabled, so this is only true LRU in that mode.
 * - Layered resolvers filling misses on get()
 * - Revalidators refreshing (or dropping) present entries, either on demand
 *   via revalidate() or detached after each hit with revalidate_on_get
 *
 * Synchronous sections run under an exclusive lock; the lock is released
 * while resolvers/revalidators run. Concurrent misses for one key are not
 * coalesced: each caller runs the resolvers itself.
 */
template <typename K, typename V>
class Cache {
public:
    using clock = std::chrono::steady_clock;
    using Options = CacheOptions<K, V>;
    using Resolver = typename Options::Resolver;
    using Revalidator = typename Options::Revalidator;

    /**
     * @param options Configuration, see CacheOptions
     * @throws CacheConfigError if ttl is not positive or too large for the
     *         steady clock, or max_size is 0
     */
    explicit Cache(Options options)
        : state_(std::make_shared<State>(validated(std::move(options)))) {}

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // ---------------- Public API ----------------

    /**
     * Insert or replace the entry for @p key with written_at = now.
     * At capacity, first sweeps the whole map: drops every expired entry and
     * the least-recently-written one.
     * @return The stored entry
     */
    Entry<V> set(const K& key, V value) {
        return store(*state_, key, std::move(value));
    }

    /**
     * Look up @p key, resolving it on a miss.
     * @param key       Key to fetch
     * @param resolvers Replaces the configured resolvers for this call when non-empty
     * @return The live or freshly resolved value, empty if none could be obtained
     */
    std::optional<V> get(const K& key, const std::vector<Resolver>& resolvers = {}) {
        State& s = *state_;
        std::optional<V> value = lookup(s, key, s.options.reset_ttl_on_get);

        bool resolved = false;
        if(value.has_value()){
            s.hits++;
        }
        else{
            s.misses++;
            const auto& pipeline = resolvers.empty() ? s.options.resolvers : resolvers;
            if(pipeline.empty()){
                return std::nullopt;
            }
            value = run_fillers(pipeline, key, "resolver");
            if(!value.has_value()){
                return std::nullopt;
            }
            // Already stamped now, which is all reset_ttl_on_get would do
            store(s, key, *value);
            s.resolutions++;
            resolved = true;
        }

        // Freshly resolved values are not revalidated
        if(s.options.revalidate_on_get && !resolved){
            launch_revalidation(key);
        }
        return value;
    }

    /**
     * Remove a key from cache.
     * @return true if an entry (live or expired) was removed
     */
    bool erase(const K& key) {
        return remove(*state_, key);
    }

    /**
     * Ask the revalidators for a current value of @p key and store it; drop
     * the key when none of them produces one.
     * @param revalidators Replaces the configured revalidators for this call when non-empty
     * @throws CacheConfigError if no revalidator is available, before any is invoked
     */
    void revalidate(const K& key, const std::vector<Revalidator>& revalidators = {}) {
        const auto& pipeline = revalidators.empty() ? state_->options.revalidators : revalidators;
        if(pipeline.empty()){
            throw CacheConfigError(cache_detail::missing_revalidator_message());
        }
        revalidate_with(*state_, key, pipeline);
    }

    /**
     * @return Number of stored entries, including expired ones not yet observed
     */
    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(state_->mutex);
        return state_->map.size();
    }

    /**
     * Raw check: returns true if key exists in map (ignores TTL).
     */
    bool contains(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(state_->mutex);
        return state_->map.find(key) != state_->map.end();
    }

    /**
     * Drop every entry. Counters are kept.
     */
    void clear() {
        std::unique_lock<std::shared_mutex> lock(state_->mutex);
        state_->map.clear();
    }

    std::chrono::milliseconds ttl() const { return state_->options.ttl; }
    std::optional<size_t> max_size() const { return state_->options.max_size; }
    bool reset_ttl_on_get() const { return state_->options.reset_ttl_on_get; }
    bool revalidate_on_get() const { return state_->options.revalidate_on_get; }

    CacheStats stats() const {
        const State& s = *state_;
        CacheStats out;
        out.hits = s.hits.load();
        out.misses = s.misses.load();
        out.resolutions = s.resolutions.load();
        out.revalidations = s.revalidations.load();
        out.evictions = s.evictions.load();
        out.expirations = s.expirations.load();
        return out;
    }

private:
    // ---------------- Internal types ----------------

    /// Shared with detached revalidation tasks so they may outlive the Cache handle.
    struct State {
        explicit State(Options opts) : options(std::move(opts)) {}

        const Options options;
        mutable std::shared_mutex mutex;          ///< Protects map
        std::unordered_map<K, Entry<V>> map;      ///< key -> Entry

        std::atomic<size_t> hits{0};
        std::atomic<size_t> misses{0};
        std::atomic<size_t> resolutions{0};
        std::atomic<size_t> revalidations{0};
        std::atomic<size_t> evictions{0};
        std::atomic<size_t> expirations{0};
    };

    // ---------------- Internal helpers ----------------

    static Options validated(Options options) {
        if(options.ttl <= std::chrono::milliseconds::zero()){
            throw CacheConfigError("ttl must be positive");
        }
        // written_at + ttl must stay representable on the steady clock
        if(options.ttl > max_ttl()){
            throw CacheConfigError("ttl must not exceed " + std::to_string(max_ttl().count()) + " ms");
        }
        if(options.max_size.has_value() && *options.max_size == 0){
            throw CacheConfigError("max_size must be at least 1 when set");
        }
        return options;
    }

    static std::chrono::milliseconds max_ttl() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::duration::max()) / 2;
    }

    /// Live value for key; an expired entry is erased and reported as a miss.
    /// With @p refresh a hit is re-written under the same lock.
    static std::optional<V> lookup(State& s, const K& key, bool refresh) {
        std::unique_lock<std::shared_mutex> lock(s.mutex);
        auto it = s.map.find(key);
        if(it == s.map.end()){
            return std::nullopt;
        }
        if(it->second.expired(clock::now())){
            s.map.erase(it);
            s.expirations++;
            return std::nullopt;
        }
        V value = it->second.value;
        if(refresh){
            insert(s, key, value);
        }
        return value;
    }

    static Entry<V> store(State& s, const K& key, V value) {
        std::unique_lock<std::shared_mutex> lock(s.mutex);
        return insert(s, key, std::move(value));
    }

    // PRECONDITION: caller holds s.mutex with a unique_lock
    static Entry<V> insert(State& s, const K& key, V value) {
        auto now = clock::now();

        if(s.options.max_size.has_value() && s.map.size() >= *s.options.max_size){
            sweep(s, now);
        }

        Entry<V> entry{now, s.options.ttl, std::move(value)};
        auto it = s.map.insert_or_assign(key, std::move(entry)).first;
        return it->second;
    }

    // PRECONDITION: caller holds s.mutex with a unique_lock
    static void sweep(State& s, clock::time_point now) {
        std::optional<K> oldest_key;
        clock::time_point oldest_written{};
        size_t expired_removed = 0;

        for(auto it = s.map.begin(); it != s.map.end();){
            if(!oldest_key.has_value() || it->second.written_at < oldest_written){
                oldest_key = it->first;
                oldest_written = it->second.written_at;
            }
            if(it->second.expired(now)){
                it = s.map.erase(it);
                ++expired_removed;
            }
            else{
                ++it;
            }
        }
        s.expirations += expired_removed;

        // The candidate may already be gone if it had expired
        bool evicted = false;
        if(oldest_key.has_value()){
            auto it = s.map.find(*oldest_key);
            if(it != s.map.end()){
                s.map.erase(it);
                s.evictions++;
                evicted = true;
            }
        }
        cache_detail::log_sweep(expired_removed, evicted, s.map.size());
    }

    static bool remove(State& s, const K& key) {
        std::unique_lock<std::shared_mutex> lock(s.mutex);
        return s.map.erase(key) > 0;
    }

    /// Call fillers in order until one yields a value. Never holds the lock.
    static std::optional<V> run_fillers(const std::vector<Resolver>& fillers, const K& key,
                                        const char* kind) {
        for(size_t i = 0; i < fillers.size(); ++i){
            if(!fillers[i]){
                continue;
            }
            try {
                std::optional<V> value = fillers[i](key);
                if(value.has_value()){
                    return value;
                }
            } catch (const std::exception& e) {
                cache_detail::log_filler_failure(kind, i, e.what());
            } catch (...) {
                cache_detail::log_filler_failure(kind, i, "unknown exception");
            }
        }
        return std::nullopt;
    }

    static void revalidate_with(State& s, const K& key, const std::vector<Revalidator>& revalidators) {
        std::optional<V> value = run_fillers(revalidators, key, "revalidator");
        if(value.has_value()){
            store(s, key, std::move(*value));
        }
        else{
            remove(s, key);
        }
        s.revalidations++;
    }

    /// Fire-and-forget revalidate(key) on its own thread.
    void launch_revalidation(const K& key) {
        std::shared_ptr<State> state = state_;
        std::packaged_task<void()> task([state, key]() {
            try {
                if(state->options.revalidators.empty()){
                    throw CacheConfigError(cache_detail::missing_revalidator_message());
                }
                revalidate_with(*state, key, state->options.revalidators);
            } catch (const std::exception& e) {
                cache_detail::log_background_failure(e.what());
            } catch (...) {
                cache_detail::log_background_failure("unknown exception");
            }
        });
        std::future<void> done = task.get_future();

        try {
            std::thread(std::move(task)).detach();
        } catch (const std::system_error& e) {
            cache_detail::log_background_failure(std::string("could not start thread: ") + e.what());
            return;
        }

        if(state_->options.keep_alive){
            state_->options.keep_alive(std::move(done));
        }
    }

    // ---------------- Data members ----------------
    std::shared_ptr<State> state_;
};

#endif // CACHE_H
