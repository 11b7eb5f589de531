// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "lru_policy.hpp"

namespace qcache::cache {

void LruPolicy::onInsert(const CacheKey& key) { order_.pushBack(key); }

void LruPolicy::onAccess(const CacheKey& key) {
    order_.moveToBack(key);
}

void LruPolicy::onRemove(const CacheKey& key) { order_.erase(key); }

auto LruPolicy::pickVictim() const -> std::optional<CacheKey> {
    return order_.front();
}

void LruPolicy::clear() { order_.clear(); }

}  // namespace qcache::cache
