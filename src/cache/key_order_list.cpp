// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "key_order_list.hpp"

namespace qcache::cache {

void KeyOrderList::pushBack(const CacheKey& key) {
    if (moveToBack(key)) {
        return;
    }
    const size_t slot = allocate(key);
    linkBack(slot);
    index_.emplace(key, slot);
}

auto KeyOrderList::moveToBack(const CacheKey& key) -> bool {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    if (it->second != tail_) {
        unlink(it->second);
        linkBack(it->second);
    }
    return true;
}

auto KeyOrderList::erase(const CacheKey& key) -> bool {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    const size_t slot = it->second;
    unlink(slot);
    freeSlots_.push_back(slot);
    index_.erase(it);
    return true;
}

auto KeyOrderList::front() const -> std::optional<CacheKey> {
    if (head_ == NPOS) {
        return std::nullopt;
    }
    return slots_[head_].key;
}

auto KeyOrderList::contains(const CacheKey& key) const -> bool {
    return index_.find(key) != index_.end();
}

auto KeyOrderList::keys() const -> std::vector<CacheKey> {
    std::vector<CacheKey> result;
    result.reserve(index_.size());
    for (size_t slot = head_; slot != NPOS; slot = slots_[slot].next) {
        result.push_back(slots_[slot].key);
    }
    return result;
}

void KeyOrderList::clear() {
    slots_.clear();
    freeSlots_.clear();
    index_.clear();
    head_ = NPOS;
    tail_ = NPOS;
}

auto KeyOrderList::allocate(const CacheKey& key) -> size_t {
    if (!freeSlots_.empty()) {
        const size_t slot = freeSlots_.back();
        freeSlots_.pop_back();
        slots_[slot] = Slot{.key = key, .prev = NPOS, .next = NPOS};
        return slot;
    }
    slots_.push_back(Slot{.key = key, .prev = NPOS, .next = NPOS});
    return slots_.size() - 1;
}

void KeyOrderList::linkBack(size_t slot) {
    slots_[slot].prev = tail_;
    slots_[slot].next = NPOS;
    if (tail_ != NPOS) {
        slots_[tail_].next = slot;
    } else {
        head_ = slot;
    }
    tail_ = slot;
}

void KeyOrderList::unlink(size_t slot) {
    Slot& node = slots_[slot];
    if (node.prev != NPOS) {
        slots_[node.prev].next = node.next;
    } else {
        head_ = node.next;
    }
    if (node.next != NPOS) {
        slots_[node.next].prev = node.prev;
    } else {
        tail_ = node.prev;
    }
    node.prev = NPOS;
    node.next = NPOS;
}

}  // namespace qcache::cache
