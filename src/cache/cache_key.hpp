// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#ifndef QCACHE_CACHE_CACHE_KEY_HPP
#define QCACHE_CACHE_CACHE_KEY_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace qcache::cache {

/**
 * @brief Fixed-size opaque identifier of a cached query result
 *
 * Holds a SHA-256 digest computed over (query text, endpoint id, format id).
 * Keys are value types: cheap to copy, comparable and hashable.
 */
class CacheKey {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    CacheKey() = default;
    explicit CacheKey(const Digest& digest) noexcept : digest_(digest) {}

    [[nodiscard]] auto digest() const noexcept -> const Digest& {
        return digest_;
    }

    /**
     * @brief Lowercase hex rendering (64 characters)
     */
    [[nodiscard]] auto toHex() const -> std::string;

    /**
     * @brief First 8 hex characters, used in log lines
     */
    [[nodiscard]] auto shortHex() const -> std::string;

    auto operator==(const CacheKey& other) const noexcept -> bool = default;
    auto operator<=>(const CacheKey& other) const noexcept = default;

private:
    Digest digest_{};
};

/**
 * @brief Derive the cache key for a query
 *
 * Pure and deterministic. Each input is length-prefixed before hashing so
 * that moving characters between fields always yields a different key.
 *
 * @param queryText Query text sent to the remote endpoint
 * @param endpointId Identifier (usually URL) of the remote endpoint
 * @param formatId Name of the result format the value was rendered with
 * @return 256-bit cache key
 */
[[nodiscard]] auto deriveKey(std::string_view queryText,
                             std::string_view endpointId,
                             std::string_view formatId) -> CacheKey;

}  // namespace qcache::cache

template <>
struct std::hash<qcache::cache::CacheKey> {
    auto operator()(const qcache::cache::CacheKey& key) const noexcept
        -> size_t {
        // The digest is already uniformly distributed; fold the first word.
        size_t value = 0;
        const auto& digest = key.digest();
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            value = (value << 8) | digest[i];
        }
        return value;
    }
};

#endif  // QCACHE_CACHE_CACHE_KEY_HPP
