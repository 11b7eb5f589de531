// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_LRU_POLICY_HPP
#define QCACHE_CACHE_LRU_POLICY_HPP

#include <vector>

#include "eviction_policy.hpp"
#include "key_order_list.hpp"

namespace qcache::cache {

/**
 * @brief Least-recently-used ordering
 *
 * Reads and writes both move a key to the most-recently-used end; the victim
 * is the key at the least-recently-used end.
 */
class LruPolicy final : public IEvictionPolicy {
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
        return EvictionPolicyKind::LRU;
    }

    /**
     * @brief Keys from least to most recently used
     */
    [[nodiscard]] auto order() const -> std::vector<CacheKey> {
        return order_.keys();
    }

private:
    KeyOrderList order_;
};

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_LRU_POLICY_HPP
