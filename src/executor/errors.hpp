// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_EXECUTOR_ERRORS_HPP
#define QCACHE_EXECUTOR_ERRORS_HPP

#include <optional>
#include <string>

#include "atom/error/exception.hpp"

namespace qcache::executor {

/**
 * @brief Error returned by a query execution
 *
 * Remote failures are produced by the IRemoteExecutor and passed through
 * unchanged; the remaining codes are raised locally before or after the
 * remote call. An execution that fails is never cached.
 */
struct ExecutionError {
    /**
     * @brief Enumeration of possible error codes
     */
    enum class Code {
        EndpointUnreachable,  ///< Endpoint not found or connection refused
        MalformedQuery,       ///< Remote side rejected the query syntax
        RemoteQueryError,     ///< Remote side reported a query failure
        Timeout,              ///< Remote call timed out
        InvalidQuery,         ///< Empty query, rejected locally
        UnsupportedFormat,    ///< No formatter registered for the format
        FormattingFailed,     ///< Formatter threw while shaping the result
        Unknown               ///< Unknown error
    };

    Code code = Code::Unknown;
    std::string message;
    std::string endpoint;
    std::optional<std::string> query;

    /**
     * @brief True for errors reported by the remote executor
     */
    [[nodiscard]] auto isRemote() const noexcept -> bool {
        return code == Code::EndpointUnreachable ||
               code == Code::MalformedQuery ||
               code == Code::RemoteQueryError || code == Code::Timeout;
    }
};

/**
 * @brief Stable name of an error code, e.g. "endpoint_unreachable"
 */
[[nodiscard]] inline auto errorCodeToString(ExecutionError::Code code)
    -> std::string {
    switch (code) {
        case ExecutionError::Code::EndpointUnreachable:
            return "endpoint_unreachable";
        case ExecutionError::Code::MalformedQuery:
            return "malformed_query";
        case ExecutionError::Code::RemoteQueryError:
            return "remote_query_error";
        case ExecutionError::Code::Timeout:
            return "timeout";
        case ExecutionError::Code::InvalidQuery:
            return "invalid_query";
        case ExecutionError::Code::UnsupportedFormat:
            return "unsupported_format";
        case ExecutionError::Code::FormattingFailed:
            return "formatting_failed";
        case ExecutionError::Code::Unknown:
            return "unknown";
    }
    return "unknown";
}

/**
 * @brief Exception thrown when a cache configuration is rejected
 *
 * Raised before any state is touched; the previous configuration stays in
 * effect.
 */
class ConfigurationError : public atom::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_CONFIGURATION_ERROR(...)                                   \
    throw qcache::executor::ConfigurationError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace qcache::executor

#endif  // QCACHE_EXECUTOR_ERRORS_HPP
