// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_EVICTION_POLICY_HPP
#define QCACHE_CACHE_EVICTION_POLICY_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cache_key.hpp"

namespace qcache::cache {

/**
 * @brief Replacement strategies supported by QueryCache
 */
enum class EvictionPolicyKind {
    LRU,   ///< Least recently used
    LFU,   ///< Least frequently used, oldest insertion on ties
    FIFO   ///< First in, first out
};

/**
 * @brief Lowercase name of a policy ("lru", "lfu", "fifo")
 */
[[nodiscard]] auto policyToString(EvictionPolicyKind kind) -> std::string;

/**
 * @brief Parse a policy name, case-insensitive
 * @return std::nullopt for unknown names
 */
[[nodiscard]] auto policyFromString(std::string_view name)
    -> std::optional<EvictionPolicyKind>;

/**
 * @brief Ordering/frequency bookkeeping behind QueryCache
 *
 * A policy only tracks keys; values and timestamps live in the cache. The
 * cache calls the hooks while holding its own lock, so implementations are
 * not required to be thread-safe.
 *
 * Hook contract:
 * - onInsert: key was set. Called for new keys and for overwrites; the
 *   policy decides what an overwrite means for its ordering.
 * - onAccess: key was returned by a valid get.
 * - onRemove: key left the cache (invalidate, expiry). Unknown keys are
 *   ignored.
 * - pickVictim: key to evict next, or nullopt when nothing is tracked. Does
 *   not remove the key; the cache follows up with onRemove.
 */
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;

    virtual void onInsert(const CacheKey& key) = 0;
    virtual void onAccess(const CacheKey& key) = 0;
    virtual void onRemove(const CacheKey& key) = 0;
    [[nodiscard]] virtual auto pickVictim() const
        -> std::optional<CacheKey> = 0;
    virtual void clear() = 0;

    [[nodiscard]] virtual auto size() const noexcept -> size_t = 0;
    [[nodiscard]] virtual auto kind() const noexcept
        -> EvictionPolicyKind = 0;
};

using EvictionPolicyPtr = std::unique_ptr<IEvictionPolicy>;

/**
 * @brief Create an empty policy of the given kind
 */
[[nodiscard]] auto makeEvictionPolicy(EvictionPolicyKind kind)
    -> EvictionPolicyPtr;

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_EVICTION_POLICY_HPP
