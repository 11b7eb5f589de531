// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "caching_executor.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include "atom/error/exception.hpp"

#include "../cache/cache_key.hpp"

namespace qcache::executor {

namespace {

constexpr size_t LOG_QUERY_PREFIX = 50;

auto isBlank(const std::string& text) -> bool {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

auto queryPreview(const std::string& queryText) -> std::string {
    return queryText.substr(0, LOG_QUERY_PREFIX);
}

}  // namespace

/**
 * @brief Implementation of CachingExecutor (PIMPL pattern)
 *
 * state_mutex_ guards config_ and cache_. execute() copies both out under
 * a shared lock and works on the copies, so a cache swapped out by
 * updateConfig() stays alive until in-flight calls drop their reference.
 */
class CachingExecutor::Impl {
public:
    Impl(RemoteExecutorPtr remote, std::vector<ResultFormatterPtr> formatters,
         const CacheConfig& config, cache::TimeSource now)
        : remote_(std::move(remote)), now_(std::move(now)) {
        if (!remote_) {
            THROW_INVALID_ARGUMENT("Remote executor cannot be null");
        }
        for (auto& formatter : formatters) {
            if (!formatter) {
                THROW_INVALID_ARGUMENT("Result formatter cannot be null");
            }
            auto name = formatter->name();
            if (!formatters_.emplace(name, std::move(formatter)).second) {
                THROW_INVALID_ARGUMENT("Duplicate formatter for format '",
                                       name, "'");
            }
        }

        validate(config);
        config_ = config;
        if (config_.cacheEnabled) {
            cache_ = buildCache(config_);
        }
        spdlog::info(
            "CachingExecutor initialized: cache {}, policy {}, ttl {}s, "
            "max size {}, {} formatter(s)",
            config_.cacheEnabled ? "enabled" : "disabled",
            cache::policyToString(config_.policy), config_.ttlSeconds,
            config_.maxSize, formatters_.size());
    }

    ~Impl() = default;

    // Non-copyable
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    auto execute(const std::string& queryText, const std::string& endpointId,
                 const std::string& format)
        -> atom::type::Expected<FormattedValue, ExecutionError> {
        if (isBlank(queryText)) {
            return atom::type::unexpected(
                ExecutionError{.code = ExecutionError::Code::InvalidQuery,
                               .message = "Query string cannot be empty",
                               .endpoint = endpointId,
                               .query = queryText});
        }

        auto formatterIt = formatters_.find(format);
        if (formatterIt == formatters_.end()) {
            return atom::type::unexpected(ExecutionError{
                .code = ExecutionError::Code::UnsupportedFormat,
                .message = "No formatter registered for format '" + format +
                           "'",
                .endpoint = endpointId,
                .query = queryText});
        }
        const auto& formatter = formatterIt->second;

        std::shared_ptr<cache::QueryCache> cache;
        {
            std::shared_lock lock(state_mutex_);
            if (config_.cacheEnabled) {
                cache = cache_;
            }
        }

        std::optional<cache::CacheKey> key;
        if (cache) {
            key = cache::deriveKey(queryText, endpointId, format);
            if (auto cached = cache->get(*key)) {
                SPDLOG_DEBUG("Cache hit [{}] for query: {}", key->shortHex(),
                             queryPreview(queryText));
                return *cached;
            }
            SPDLOG_DEBUG("Cache miss [{}] for query: {}", key->shortHex(),
                         queryPreview(queryText));
        }

        auto raw = remote_->execute(queryText, endpointId);
        if (!raw) {
            SPDLOG_WARN("Remote execution against {} failed ({}): {}",
                        endpointId, errorCodeToString(raw.error().code),
                        raw.error().message);
            return atom::type::unexpected(raw.error());
        }

        FormattedValue formatted;
        try {
            formatted = formatter->format(*raw, queryText);
        } catch (const std::exception& e) {
            SPDLOG_WARN("Formatter '{}' failed for query {}: {}", format,
                        queryPreview(queryText), e.what());
            return atom::type::unexpected(ExecutionError{
                .code = ExecutionError::Code::FormattingFailed,
                .message = e.what(),
                .endpoint = endpointId,
                .query = queryText});
        }

        if (cache) {
            cache->set(*key, formatted);
        }
        return formatted;
    }

    auto defaultFormat() const -> std::string {
        std::shared_lock lock(state_mutex_);
        return config_.defaultFormat;
    }

    void updateConfig(const CacheConfig& newConfig) {
        validate(newConfig);

        std::unique_lock lock(state_mutex_);
        const bool shapeChanged = config_.cacheShapeDiffers(newConfig);

        if (!newConfig.cacheEnabled) {
            if (cache_) {
                spdlog::info("Query cache disabled, releasing {} entries",
                             cache_->size());
            }
            cache_.reset();
        } else if (!cache_ || shapeChanged) {
            cache_ = buildCache(newConfig);
            spdlog::info("Query cache rebuilt: policy {}, ttl {}s, max size {}",
                         cache::policyToString(newConfig.policy),
                         newConfig.ttlSeconds, newConfig.maxSize);
        }

        config_ = newConfig;
    }

    void clearCache() {
        std::shared_lock lock(state_mutex_);
        if (config_.cacheEnabled && cache_) {
            cache_->clear();
            spdlog::info("Query cache cleared");
        }
    }

    auto getCacheStats() const -> CacheStats {
        std::shared_lock lock(state_mutex_);
        CacheStats stats{.enabled = config_.cacheEnabled && cache_ != nullptr,
                         .size = 0,
                         .maxSize = static_cast<size_t>(config_.maxSize),
                         .ttl = config_.ttl(),
                         .policy = config_.policy};
        if (stats.enabled) {
            stats.size = cache_->size();
        }
        return stats;
    }

    auto getConfig() const -> CacheConfig {
        std::shared_lock lock(state_mutex_);
        return config_;
    }

private:
    void validate(const CacheConfig& config) const {
        config.validate();
        if (formatters_.find(config.defaultFormat) == formatters_.end()) {
            THROW_CONFIGURATION_ERROR("Default format '", config.defaultFormat,
                                      "' has no registered formatter");
        }
    }

    auto buildCache(const CacheConfig& config) const
        -> std::shared_ptr<cache::QueryCache> {
        return std::make_shared<cache::QueryCache>(
            static_cast<size_t>(config.maxSize), config.ttl(), config.policy,
            now_);
    }

    const RemoteExecutorPtr remote_;
    std::unordered_map<std::string, ResultFormatterPtr> formatters_;
    const cache::TimeSource now_;

    mutable std::shared_mutex state_mutex_;
    CacheConfig config_;
    std::shared_ptr<cache::QueryCache> cache_;
};

// ============================================================================
// CachingExecutor Implementation
// ============================================================================

CachingExecutor::CachingExecutor(RemoteExecutorPtr remote,
                                 std::vector<ResultFormatterPtr> formatters,
                                 const CacheConfig& config,
                                 cache::TimeSource now)
    : pImpl_(std::make_unique<Impl>(std::move(remote), std::move(formatters),
                                    config, std::move(now))) {}

CachingExecutor::~CachingExecutor() = default;

CachingExecutor::CachingExecutor(CachingExecutor&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

CachingExecutor& CachingExecutor::operator=(CachingExecutor&& other) noexcept {
    if (this != &other) {
        pImpl_ = std::move(other.pImpl_);
    }
    return *this;
}

auto CachingExecutor::execute(const std::string& queryText,
                              const std::string& endpointId,
                              const std::string& format)
    -> atom::type::Expected<FormattedValue, ExecutionError> {
    return pImpl_->execute(queryText, endpointId, format);
}

auto CachingExecutor::execute(const std::string& queryText,
                              const std::string& endpointId)
    -> atom::type::Expected<FormattedValue, ExecutionError> {
    return pImpl_->execute(queryText, endpointId, pImpl_->defaultFormat());
}

void CachingExecutor::updateConfig(const CacheConfig& newConfig) {
    pImpl_->updateConfig(newConfig);
}

void CachingExecutor::clearCache() { pImpl_->clearCache(); }

auto CachingExecutor::getCacheStats() const -> CacheStats {
    return pImpl_->getCacheStats();
}

auto CachingExecutor::getConfig() const -> CacheConfig {
    return pImpl_->getConfig();
}

}  // namespace qcache::executor
