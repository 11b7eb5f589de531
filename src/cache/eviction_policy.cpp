// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "eviction_policy.hpp"

#include <algorithm>
#include <cctype>

#include "fifo_policy.hpp"
#include "lfu_policy.hpp"
#include "lru_policy.hpp"

namespace qcache::cache {

auto policyToString(EvictionPolicyKind kind) -> std::string {
    switch (kind) {
        case EvictionPolicyKind::LRU:
            return "lru";
        case EvictionPolicyKind::LFU:
            return "lfu";
        case EvictionPolicyKind::FIFO:
            return "fifo";
    }
    return "lru";
}

auto policyFromString(std::string_view name)
    -> std::optional<EvictionPolicyKind> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "lru") {
        return EvictionPolicyKind::LRU;
    }
    if (lower == "lfu") {
        return EvictionPolicyKind::LFU;
    }
    if (lower == "fifo") {
        return EvictionPolicyKind::FIFO;
    }
    return std::nullopt;
}

auto makeEvictionPolicy(EvictionPolicyKind kind) -> EvictionPolicyPtr {
    switch (kind) {
        case EvictionPolicyKind::LRU:
            return std::make_unique<LruPolicy>();
        case EvictionPolicyKind::LFU:
            return std::make_unique<LfuPolicy>();
        case EvictionPolicyKind::FIFO:
            return std::make_unique<FifoPolicy>();
    }
    return std::make_unique<LruPolicy>();
}

}  // namespace qcache::cache
