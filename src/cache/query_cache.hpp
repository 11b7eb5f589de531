// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_QUERY_CACHE_HPP
#define QCACHE_CACHE_QUERY_CACHE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "atom/type/json.hpp"

#include "cache_key.hpp"
#include "eviction_policy.hpp"

namespace qcache::cache {

using json = nlohmann::json;

/// Formatted query result stored in the cache
using CacheValue = json;

using Clock = std::chrono::steady_clock;

/// Source of "now" for TTL bookkeeping; tests substitute a manual clock
using TimeSource = std::function<Clock::time_point()>;

/**
 * @brief Single cached result
 */
struct CacheEntry {
    CacheValue value;
    Clock::time_point insertedAt;  ///< Last set(); TTL runs from here
};

/**
 * @brief Bounded query result cache with TTL expiry
 *
 * Stores formatted results keyed by CacheKey. Which entry makes room for a
 * new key is decided by the configured eviction policy (LRU, LFU, FIFO);
 * storage, expiry and locking are shared by all policies.
 *
 * - size() never exceeds maxSize() once set() returns.
 * - An entry inserted at T is visible in [T, T + ttl) and gone from T + ttl
 *   on. Expired entries are dropped when get() finds them; there is no
 *   background sweep.
 * - get() hands out copies; stored values are never aliased.
 *
 * Thread-safe: one mutex guards the map and the policy metadata.
 */
class QueryCache {
public:
    /**
     * @brief Create an empty cache
     * @param maxSize Maximum number of entries (> 0)
     * @param ttl Entry lifetime (> 0)
     * @param policy Replacement strategy
     * @param now Time source, defaults to steady_clock::now
     * @throws atom::error::InvalidArgument if maxSize or ttl is not positive
     */
    QueryCache(size_t maxSize, std::chrono::seconds ttl,
               EvictionPolicyKind policy, TimeSource now = {});
    ~QueryCache();

    // Non-copyable, movable
    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;
    QueryCache(QueryCache&&) noexcept;
    QueryCache& operator=(QueryCache&&) noexcept;

    /**
     * @brief Look up a value
     *
     * Returns nullopt for unknown or expired keys; an expired entry is
     * removed as part of the lookup. A hit updates the policy state (LRU
     * recency, LFU counter) before the copy is returned.
     */
    [[nodiscard]] auto get(const CacheKey& key) -> std::optional<CacheValue>;

    /**
     * @brief Insert or replace a value, timestamped now
     *
     * A new key arriving at capacity evicts exactly one entry chosen by the
     * policy. Replacing an existing key never evicts.
     */
    void set(const CacheKey& key, CacheValue value);

    /**
     * @brief Remove a key
     * @return true if an entry was removed
     */
    auto invalidate(const CacheKey& key) -> bool;

    /**
     * @brief Remove every entry
     */
    void clear();

    /**
     * @brief Check presence of a live entry without touching policy state
     *
     * Expired entries report false but are left for the next get().
     */
    [[nodiscard]] auto contains(const CacheKey& key) const -> bool;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto maxSize() const noexcept -> size_t;
    [[nodiscard]] auto ttl() const noexcept -> std::chrono::seconds;
    [[nodiscard]] auto policy() const noexcept -> EvictionPolicyKind;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_QUERY_CACHE_HPP
