// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_EXECUTOR_RESULT_FORMATTER_HPP
#define QCACHE_EXECUTOR_RESULT_FORMATTER_HPP

#include <memory>
#include <string>
#include <string_view>

#include "../cache/query_cache.hpp"
#include "remote_executor.hpp"

namespace qcache::executor {

/// Presentation-ready result, the value type held by the cache
using FormattedValue = cache::CacheValue;

/**
 * @brief Well-known format identifiers
 */
namespace formats {
inline constexpr std::string_view JSON = "json";
inline constexpr std::string_view SIMPLIFIED = "simplified";
inline constexpr std::string_view TABULAR = "tabular";
}  // namespace formats

/**
 * @brief Shapes a raw result into one named presentation format
 *
 * Formatters are expected to be pure: the same raw result and query text
 * always give the same output. They are shared across threads without
 * locking.
 */
class IResultFormatter {
public:
    virtual ~IResultFormatter() = default;

    /**
     * @brief Format identifier this formatter is registered under
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Format a raw result
     * @param raw Result returned by the remote executor
     * @param queryText Query that produced the result
     */
    [[nodiscard]] virtual auto format(const RawResult& raw,
                                      const std::string& queryText) const
        -> FormattedValue = 0;
};

using ResultFormatterPtr = std::shared_ptr<IResultFormatter>;

}  // namespace qcache::executor

#endif  // QCACHE_EXECUTOR_RESULT_FORMATTER_HPP
