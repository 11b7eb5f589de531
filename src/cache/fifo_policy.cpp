// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "fifo_policy.hpp"

namespace qcache::cache {

void FifoPolicy::onInsert(const CacheKey& key) { order_.pushBack(key); }

// Reads never protect an entry.
void FifoPolicy::onAccess([[maybe_unused]] const CacheKey& key) {}

void FifoPolicy::onRemove(const CacheKey& key) { order_.erase(key); }

auto FifoPolicy::pickVictim() const -> std::optional<CacheKey> {
    return order_.front();
}

void FifoPolicy::clear() { order_.clear(); }

}  // namespace qcache::cache
