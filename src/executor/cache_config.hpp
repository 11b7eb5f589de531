// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_EXECUTOR_CACHE_CONFIG_HPP
#define QCACHE_EXECUTOR_CACHE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "atom/type/json.hpp"

#include "../cache/eviction_policy.hpp"

namespace qcache::executor {

using json = nlohmann::json;

/**
 * @brief Caching options of a CachingExecutor
 *
 * @example
 * ```json
 * {
 *   "cacheEnabled": true,
 *   "ttlSeconds": 300,
 *   "maxSize": 100,
 *   "policy": "lru",
 *   "defaultFormat": "json"
 * }
 * ```
 */
struct CacheConfig {
    static constexpr int64_t MAX_TTL_SECONDS = 86400;
    static constexpr int64_t MAX_ENTRIES = 10000;

    bool cacheEnabled{true};        ///< Serve and store results in the cache
    int64_t ttlSeconds{300};        ///< Entry lifetime, 1..86400
    int64_t maxSize{100};           ///< Maximum entries, 1..10000
    cache::EvictionPolicyKind policy{cache::EvictionPolicyKind::LRU};
    std::string defaultFormat{"json"};  ///< Format used when none is given

    [[nodiscard]] auto ttl() const -> std::chrono::seconds {
        return std::chrono::seconds(ttlSeconds);
    }

    /**
     * @brief Check value ranges
     * @throws ConfigurationError on the first invalid field
     */
    void validate() const;

    /**
     * @brief True if ttl, maxSize or policy differ, i.e. the cache built
     *        for one config cannot serve the other
     */
    [[nodiscard]] auto cacheShapeDiffers(const CacheConfig& other) const
        -> bool {
        return ttlSeconds != other.ttlSeconds || maxSize != other.maxSize ||
               policy != other.policy;
    }

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Build from JSON, missing keys keep their defaults
     * @throws ConfigurationError for wrong types, unknown policy names or
     *         out-of-range values
     */
    [[nodiscard]] static auto fromJson(const json& j) -> CacheConfig;

    /**
     * @brief Build from QCACHE_CACHE_ENABLED, QCACHE_CACHE_TTL,
     *        QCACHE_CACHE_MAX_SIZE, QCACHE_CACHE_STRATEGY and QCACHE_FORMAT
     *
     * Unset variables keep their defaults.
     * @throws ConfigurationError for unparsable or out-of-range values
     */
    [[nodiscard]] static auto fromEnvironment() -> CacheConfig;

    auto operator==(const CacheConfig& other) const -> bool = default;
};

/**
 * @brief Snapshot of the cache state reported by CachingExecutor
 */
struct CacheStats {
    bool enabled{false};
    size_t size{0};
    size_t maxSize{0};
    std::chrono::seconds ttl{0};
    cache::EvictionPolicyKind policy{cache::EvictionPolicyKind::LRU};

    /**
     * @brief JSON view; a disabled cache reports only {"enabled": false}
     */
    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace qcache::executor

#endif  // QCACHE_EXECUTOR_CACHE_CONFIG_HPP
