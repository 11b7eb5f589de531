// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "cache_key.hpp"

#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "atom/error/exception.hpp"

namespace qcache::cache {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

auto opensslErrors() -> std::string {
    std::string result;
    while (unsigned long code = ERR_get_error()) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!result.empty()) {
            result += "; ";
        }
        result += buffer;
    }
    return result;
}

/**
 * @brief Feed one field into the digest as <u64 big-endian length><bytes>
 */
void digestField(EVP_MD_CTX* ctx, std::string_view field) {
    uint64_t length = field.size();
    unsigned char prefix[8];
    for (int i = 7; i >= 0; --i) {
        prefix[i] = static_cast<unsigned char>(length & 0xFF);
        length >>= 8;
    }

    if (EVP_DigestUpdate(ctx, prefix, sizeof(prefix)) != 1 ||
        EVP_DigestUpdate(ctx, field.data(), field.size()) != 1) {
        THROW_RUNTIME_ERROR("EVP_DigestUpdate failed: ", opensslErrors());
    }
}

auto toHexString(const uint8_t* data, size_t size) -> std::string {
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace

auto CacheKey::toHex() const -> std::string {
    return toHexString(digest_.data(), digest_.size());
}

auto CacheKey::shortHex() const -> std::string {
    return toHexString(digest_.data(), 4);
}

auto deriveKey(std::string_view queryText, std::string_view endpointId,
               std::string_view formatId) -> CacheKey {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        THROW_RUNTIME_ERROR("EVP_MD_CTX_new failed: ", opensslErrors());
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        THROW_RUNTIME_ERROR("EVP_DigestInit_ex failed: ", opensslErrors());
    }

    digestField(ctx.get(), queryText);
    digestField(ctx.get(), endpointId);
    digestField(ctx.get(), formatId);

    CacheKey::Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
        length != CacheKey::DIGEST_SIZE) {
        THROW_RUNTIME_ERROR("EVP_DigestFinal_ex failed: ", opensslErrors());
    }

    return CacheKey(digest);
}

}  // namespace qcache::cache
