// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "query_cache.hpp"

#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include "atom/error/exception.hpp"

namespace qcache::cache {

/**
 * @brief Implementation class for QueryCache
 */
class QueryCache::Impl {
public:
    Impl(size_t maxSize, std::chrono::seconds ttl, EvictionPolicyKind policy,
         TimeSource now)
        : maxSize_(maxSize),
          ttl_(ttl),
          now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })),
          policy_(makeEvictionPolicy(policy)) {
        if (maxSize_ == 0) {
            THROW_INVALID_ARGUMENT("QueryCache maxSize must be positive");
        }
        if (ttl_.count() <= 0) {
            THROW_INVALID_ARGUMENT("QueryCache ttl must be positive, got ",
                                   ttl_.count(), "s");
        }
    }

    auto get(const CacheKey& key) -> std::optional<CacheValue> {
        std::lock_guard lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }

        const auto now = now_();
        if (isExpired(it->second, now)) {
            SPDLOG_DEBUG("Cache entry {} expired after {}s", key.shortHex(),
                         ttl_.count());
            policy_->onRemove(key);
            entries_.erase(it);
            return std::nullopt;
        }

        policy_->onAccess(key);
        return it->second.value;
    }

    void set(const CacheKey& key, CacheValue value) {
        std::lock_guard lock(mutex_);

        const auto now = now_();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            // Wholesale replacement; the policy decides what an overwrite
            // does to the ordering.
            it->second.value = std::move(value);
            it->second.insertedAt = now;
            policy_->onInsert(key);
            return;
        }

        if (entries_.size() >= maxSize_) {
            evictOne();
        }

        entries_.emplace(
            key, CacheEntry{.value = std::move(value), .insertedAt = now});
        policy_->onInsert(key);
    }

    auto invalidate(const CacheKey& key) -> bool {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        policy_->onRemove(key);
        entries_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        policy_->clear();
    }

    auto contains(const CacheKey& key) const -> bool {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && !isExpired(it->second, now_());
    }

    auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    auto maxSize() const noexcept -> size_t { return maxSize_; }
    auto ttl() const noexcept -> std::chrono::seconds { return ttl_; }
    auto policy() const noexcept -> EvictionPolicyKind {
        return policyKind_;
    }

private:
    auto isExpired(const CacheEntry& entry, Clock::time_point now) const
        -> bool {
        return now - entry.insertedAt >= ttl_;
    }

    // Caller holds mutex_.
    void evictOne() {
        auto victim = policy_->pickVictim();
        if (!victim) {
            return;
        }
        SPDLOG_DEBUG("Evicting cache entry {} ({} policy, capacity {})",
                     victim->shortHex(), policyToString(policyKind_),
                     maxSize_);
        policy_->onRemove(*victim);
        entries_.erase(*victim);
    }

    const size_t maxSize_;
    const std::chrono::seconds ttl_;
    const TimeSource now_;
    EvictionPolicyPtr policy_;
    const EvictionPolicyKind policyKind_ = policy_->kind();

    mutable std::mutex mutex_;
    std::unordered_map<CacheKey, CacheEntry> entries_;
};

// ============================================================================
// QueryCache Implementation
// ============================================================================

QueryCache::QueryCache(size_t maxSize, std::chrono::seconds ttl,
                       EvictionPolicyKind policy, TimeSource now)
    : pImpl_(std::make_unique<Impl>(maxSize, ttl, policy, std::move(now))) {}

QueryCache::~QueryCache() = default;

QueryCache::QueryCache(QueryCache&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

QueryCache& QueryCache::operator=(QueryCache&& other) noexcept {
    if (this != &other) {
        pImpl_ = std::move(other.pImpl_);
    }
    return *this;
}

auto QueryCache::get(const CacheKey& key) -> std::optional<CacheValue> {
    return pImpl_->get(key);
}

void QueryCache::set(const CacheKey& key, CacheValue value) {
    pImpl_->set(key, std::move(value));
}

auto QueryCache::invalidate(const CacheKey& key) -> bool {
    return pImpl_->invalidate(key);
}

void QueryCache::clear() { pImpl_->clear(); }

auto QueryCache::contains(const CacheKey& key) const -> bool {
    return pImpl_->contains(key);
}

auto QueryCache::size() const -> size_t { return pImpl_->size(); }

auto QueryCache::maxSize() const noexcept -> size_t {
    return pImpl_->maxSize();
}

auto QueryCache::ttl() const noexcept -> std::chrono::seconds {
    return pImpl_->ttl();
}

auto QueryCache::policy() const noexcept -> EvictionPolicyKind {
    return pImpl_->policy();
}

}  // namespace qcache::cache
