// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_EXECUTOR_CACHING_EXECUTOR_HPP
#define QCACHE_EXECUTOR_CACHING_EXECUTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "atom/type/expected.hpp"

#include "../cache/query_cache.hpp"
#include "cache_config.hpp"
#include "errors.hpp"
#include "remote_executor.hpp"
#include "result_formatter.hpp"

namespace qcache::executor {

/**
 * @brief Memoizing front end for an IRemoteExecutor
 *
 * For each call the executor derives a cache key from (query, endpoint,
 * format), answers from the cache when it can, and otherwise runs the
 * query remotely, formats the raw result and stores the formatted value.
 *
 * Collaborators are injected at construction and shared, never owned
 * exclusively. The cache itself is owned by the executor and rebuilt when
 * its shape (ttl, maxSize, policy) changes.
 *
 * @thread_safe All public methods are thread-safe. The remote call runs
 *              without any lock held; concurrent misses on the same key
 *              each call the remote executor.
 *
 * @example
 * ```cpp
 * CachingExecutor executor(remote, {jsonFormatter, tableFormatter});
 * auto result = executor.execute(query, "https://example.org/sparql",
 *                                "json");
 * if (result) {
 *     render(*result);
 * }
 * ```
 */
class CachingExecutor {
public:
    /**
     * @brief Construct an executor
     * @param remote Remote executor, must not be null
     * @param formatters Formatters, one per format name
     * @param config Initial configuration
     * @param now Time source handed to the cache (tests only)
     * @throws atom::error::InvalidArgument on a null remote or formatter, or
     *         a duplicate formatter name
     * @throws ConfigurationError if config is invalid
     */
    CachingExecutor(RemoteExecutorPtr remote,
                    std::vector<ResultFormatterPtr> formatters,
                    const CacheConfig& config = {},
                    cache::TimeSource now = {});
    ~CachingExecutor();

    // Non-copyable, movable
    CachingExecutor(const CachingExecutor&) = delete;
    CachingExecutor& operator=(const CachingExecutor&) = delete;
    CachingExecutor(CachingExecutor&&) noexcept;
    CachingExecutor& operator=(CachingExecutor&&) noexcept;

    /**
     * @brief Run a query, serving it from the cache when possible
     *
     * @param queryText Query text, must contain a non-space character
     * @param endpointId Endpoint identifier passed to the remote executor
     * @param format Name of a registered formatter
     * @return Formatted value, or the error that prevented it. Remote
     *         errors are returned exactly as the remote executor reported
     *         them.
     */
    [[nodiscard]] auto execute(const std::string& queryText,
                               const std::string& endpointId,
                               const std::string& format)
        -> atom::type::Expected<FormattedValue, ExecutionError>;

    /**
     * @brief Run a query in the configured default format
     */
    [[nodiscard]] auto execute(const std::string& queryText,
                               const std::string& endpointId)
        -> atom::type::Expected<FormattedValue, ExecutionError>;

    /**
     * @brief Apply a new configuration
     *
     * Validation happens first; a rejected config leaves everything as it
     * was. A change of ttl, maxSize or policy discards the cache and builds
     * an empty one. Disabling releases the cache, enabling builds a fresh
     * one; either takes effect on the next execute().
     *
     * @throws ConfigurationError if newConfig is invalid or names an
     *         unregistered default format
     */
    void updateConfig(const CacheConfig& newConfig);

    /**
     * @brief Drop every cached result (no-op while caching is disabled)
     */
    void clearCache();

    [[nodiscard]] auto getCacheStats() const -> CacheStats;

    [[nodiscard]] auto getConfig() const -> CacheConfig;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace qcache::executor

#endif  // QCACHE_EXECUTOR_CACHING_EXECUTOR_HPP
