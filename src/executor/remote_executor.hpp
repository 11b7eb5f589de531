// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_EXECUTOR_REMOTE_EXECUTOR_HPP
#define QCACHE_EXECUTOR_REMOTE_EXECUTOR_HPP

#include <memory>
#include <string>

#include "atom/type/expected.hpp"
#include "atom/type/json.hpp"

#include "errors.hpp"

namespace qcache::executor {

using json = nlohmann::json;

/// Unformatted result document returned by the remote endpoint
using RawResult = json;

/**
 * @brief Transport that runs a query against a remote endpoint
 *
 * Supplied by the hosting service (HTTP client, SPARQL wrapper, ...). The
 * call may block for the duration of the request. Implementations must be
 * safe to call from several threads at once; CachingExecutor does not
 * serialize calls.
 */
class IRemoteExecutor {
public:
    virtual ~IRemoteExecutor() = default;

    /**
     * @brief Execute a query
     *
     * @param queryText Query text
     * @param endpointId Endpoint identifier (usually its URL)
     * @return Raw result on success or a remote ExecutionError
     *
     * @note Retrying is the implementation's business; CachingExecutor
     *       calls this exactly once per miss.
     */
    [[nodiscard]] virtual auto execute(const std::string& queryText,
                                       const std::string& endpointId)
        -> atom::type::Expected<RawResult, ExecutionError> = 0;
};

using RemoteExecutorPtr = std::shared_ptr<IRemoteExecutor>;

}  // namespace qcache::executor

#endif  // QCACHE_EXECUTOR_REMOTE_EXECUTOR_HPP
