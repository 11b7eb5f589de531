// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_KEY_ORDER_LIST_HPP
#define QCACHE_CACHE_KEY_ORDER_LIST_HPP

#include <cstddef>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

#include "cache_key.hpp"

namespace qcache::cache {

/**
 * @brief Ordered set of keys with O(1) push, move and erase
 *
 * Doubly-linked list stored in a slot arena: nodes refer to each other by
 * index into a vector, and a hash map resolves a key to its slot. Released
 * slots are recycled through a free list, so no node ever owns another.
 *
 * Front is the oldest position, back the newest.
 */
class KeyOrderList {
public:
    KeyOrderList() = default;

    /**
     * @brief Append key at the back; an existing key is moved there
     */
    void pushBack(const CacheKey& key);

    /**
     * @brief Move an existing key to the back
     * @return false if the key is not tracked
     */
    auto moveToBack(const CacheKey& key) -> bool;

    /**
     * @brief Remove a key
     * @return false if the key is not tracked
     */
    auto erase(const CacheKey& key) -> bool;

    [[nodiscard]] auto front() const -> std::optional<CacheKey>;
    [[nodiscard]] auto contains(const CacheKey& key) const -> bool;
    [[nodiscard]] auto size() const noexcept -> size_t { return index_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return index_.empty(); }

    /**
     * @brief Keys from front (oldest) to back (newest)
     */
    [[nodiscard]] auto keys() const -> std::vector<CacheKey>;

    void clear();

private:
    static constexpr size_t NPOS = std::numeric_limits<size_t>::max();

    struct Slot {
        CacheKey key;
        size_t prev = NPOS;
        size_t next = NPOS;
    };

    auto allocate(const CacheKey& key) -> size_t;
    void linkBack(size_t slot);
    void unlink(size_t slot);

    std::vector<Slot> slots_;
    std::vector<size_t> freeSlots_;
    std::unordered_map<CacheKey, size_t> index_;
    size_t head_ = NPOS;
    size_t tail_ = NPOS;
};

}  // namespace qcache::cache

#endif  // QCACHE_CACHE_KEY_ORDER_LIST_HPP
