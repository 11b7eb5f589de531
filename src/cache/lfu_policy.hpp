// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_LFU_POLICY_HPP
#define QCACHE_CACHE_LFU_POLICY_HPP

#include <cstdint>
#include <set>
#include <tuple>
#include <unordered_map>

#include "eviction_policy.hpp"

namespace qcache::cache {

/**
 * @brief Least-frequently-used ordering
 *
 * Every key carries an access counter and an insertion sequence number.
 * - A new key starts with counter 1.
 * - A valid read increments the counter.
 * - An overwrite keeps the counter but takes a fresh sequence number, i.e.
 *   it counts as the newest insertion.
 *
 * The victim is the key with the lowest counter; among keys tied at that
 * counter the one with the oldest insertion (or last overwrite) goes first.
 * Candidates are kept in one ordered set of (counter, sequence, key), so
 * the victim is always the first element.
 */
class LfuPolicy final : public IEvictionPolicy {
public:
    void onInsert(const CacheKey& key) override;
    void onAccess(const CacheKey& key) override;
    void onRemove(const CacheKey& key) override;
    [[nodiscard]] auto pickVictim() const -> std::optional<CacheKey> override;
    void clear() override;

    [[nodiscard]] auto size() const noexcept -> size_t override {
        return entries_.size();
    }
    [[nodiscard]] auto kind() const noexcept -> EvictionPolicyKind override {
        return EvictionPolicyKind::LFU;
    }

    /**
     * @brief Current access counter of a key, nullopt if untracked
     */
    [[nodiscard]] auto frequency(const CacheKey& key) const
        -> std::optional<uint64_t>;

private:
    struct Meta {
        uint64_t frequency = 1;
        uint64_t sequence = 0;
    };

    using Rank = std::tuple<uint64_t, uint64_t, CacheKey>;

    static auto rankOf(const CacheKey& key, const Meta& meta) -> Rank {
        return {meta.frequency, meta.sequence, key};
    }

    std::unordered_map<CacheKey, Meta> entries_;
    std::set<Rank> ranking_;
    uint64_t nextSequence_ = 0;
};

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_LFU_POLICY_HPP
