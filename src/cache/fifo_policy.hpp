// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_FIFO_POLICY_HPP
#define QCACHE_CACHE_FIFO_POLICY_HPP

#include <vector>

#include "eviction_policy.hpp"
#include "key_order_list.hpp"

namespace qcache::cache {

/**
 * @brief Insertion ordering
 *
 * Only writes move a key: a new key or an overwrite becomes the newest
 * entry. Reads leave the order untouched, so a frequently read key is
 * evicted just like any other once it is the oldest insertion.
 */
class FifoPolicy final : public IEvictionPolicy {
public:
    void onInsert(const CacheKey& key) override;
    void onAccess(const CacheKey& key) override;
    void onRemove(const CacheKey& key) override;
    [[nodiscard]] auto pickVictim() const -> std::optional<CacheKey> override;
    void clear() override;

    [[nodiscard]] auto size() const noexcept -> size_t override {
        return order_.size();
    }
    [[nodiscard]] auto kind() const noexcept -> EvictionPolicyKind override {
        return EvictionPolicyKind::FIFO;
    }

    /**
     * @brief Keys from oldest to newest insertion
     */
    [[nodiscard]] auto order() const -> std::vector<CacheKey> {
        return order_.keys();
    }

private:
    KeyOrderList order_;
};

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_FIFO_POLICY_HPP
