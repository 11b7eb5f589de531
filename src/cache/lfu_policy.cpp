// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "lfu_policy.hpp"

namespace qcache::cache {

void LfuPolicy::onInsert(const CacheKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        Meta meta{.frequency = 1, .sequence = nextSequence_++};
        entries_.emplace(key, meta);
        ranking_.insert(rankOf(key, meta));
        return;
    }

    // Overwrite: frequency history survives, insertion time is refreshed.
    ranking_.erase(rankOf(key, it->second));
    it->second.sequence = nextSequence_++;
    ranking_.insert(rankOf(key, it->second));
}

void LfuPolicy::onAccess(const CacheKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    ranking_.erase(rankOf(key, it->second));
    ++it->second.frequency;
    ranking_.insert(rankOf(key, it->second));
}

void LfuPolicy::onRemove(const CacheKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    ranking_.erase(rankOf(key, it->second));
    entries_.erase(it);
}

auto LfuPolicy::pickVictim() const -> std::optional<CacheKey> {
    if (ranking_.empty()) {
        return std::nullopt;
    }
    return std::get<2>(*ranking_.begin());
}

void LfuPolicy::clear() {
    entries_.clear();
    ranking_.clear();
    nextSequence_ = 0;
}

auto LfuPolicy::frequency(const CacheKey& key) const
    -> std::optional<uint64_t> {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.frequency;
}

}  // namespace qcache::cache
