// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * QCache - Query result caching for remote endpoints
 * Copyright (C) 2024 QCache contributors
 */

#include "cache_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

#include "errors.hpp"

namespace qcache::executor {

namespace {

auto readEnv(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

auto toLower(std::string_view text) -> std::string {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

auto parseBool(const char* name, const std::string& value) -> bool {
    const auto lower = toLower(value);
    if (lower == "true" || lower == "1" || lower == "yes") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        return false;
    }
    THROW_CONFIGURATION_ERROR(name, " must be true or false, got '", value,
                              "'");
}

auto parseInt(const char* name, const std::string& value) -> int64_t {
    int64_t result = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        THROW_CONFIGURATION_ERROR(name, " must be an integer, got '", value,
                                  "'");
    }
    return result;
}

auto readInteger(const json& j, const char* key, int64_t fallback)
    -> int64_t {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        THROW_CONFIGURATION_ERROR(key, " must be an integer, got ",
                                  value.dump());
    }
    return value.get<int64_t>();
}

auto readBool(const json& j, const char* key, bool fallback) -> bool {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_boolean()) {
        THROW_CONFIGURATION_ERROR(key, " must be a boolean, got ",
                                  value.dump());
    }
    return value.get<bool>();
}

auto parsePolicy(const std::string& value) -> cache::EvictionPolicyKind {
    auto policy = cache::policyFromString(value);
    if (!policy) {
        THROW_CONFIGURATION_ERROR("Unknown cache policy '", value,
                                  "', expected one of lru, lfu, fifo");
    }
    return *policy;
}

}  // namespace

void CacheConfig::validate() const {
    if (ttlSeconds <= 0 || ttlSeconds > MAX_TTL_SECONDS) {
        THROW_CONFIGURATION_ERROR("ttlSeconds must be in [1, ",
                                  MAX_TTL_SECONDS, "], got ", ttlSeconds);
    }
    if (maxSize <= 0 || maxSize > MAX_ENTRIES) {
        THROW_CONFIGURATION_ERROR("maxSize must be in [1, ", MAX_ENTRIES,
                                  "], got ", maxSize);
    }
    if (policy != cache::EvictionPolicyKind::LRU &&
        policy != cache::EvictionPolicyKind::LFU &&
        policy != cache::EvictionPolicyKind::FIFO) {
        THROW_CONFIGURATION_ERROR("Unknown cache policy value ",
                                  static_cast<int>(policy));
    }
    if (defaultFormat.empty()) {
        THROW_CONFIGURATION_ERROR("defaultFormat must not be empty");
    }
}

auto CacheConfig::toJson() const -> json {
    return {{"cacheEnabled", cacheEnabled},
            {"ttlSeconds", ttlSeconds},
            {"maxSize", maxSize},
            {"policy", cache::policyToString(policy)},
            {"defaultFormat", defaultFormat}};
}

auto CacheConfig::fromJson(const json& j) -> CacheConfig {
    if (!j.is_object()) {
        THROW_CONFIGURATION_ERROR("Cache configuration must be a JSON object");
    }

    CacheConfig cfg;
    try {
        cfg.cacheEnabled = readBool(j, "cacheEnabled", cfg.cacheEnabled);
        cfg.ttlSeconds = readInteger(j, "ttlSeconds", cfg.ttlSeconds);
        cfg.maxSize = readInteger(j, "maxSize", cfg.maxSize);
        cfg.defaultFormat = j.value("defaultFormat", cfg.defaultFormat);
        if (j.contains("policy")) {
            cfg.policy = parsePolicy(j.at("policy").get<std::string>());
        }
    } catch (const json::exception& e) {
        THROW_CONFIGURATION_ERROR("Invalid cache configuration: ", e.what());
    }

    cfg.validate();
    return cfg;
}

auto CacheConfig::fromEnvironment() -> CacheConfig {
    CacheConfig cfg;

    if (auto value = readEnv("QCACHE_CACHE_ENABLED")) {
        cfg.cacheEnabled = parseBool("QCACHE_CACHE_ENABLED", *value);
    }
    if (auto value = readEnv("QCACHE_CACHE_TTL")) {
        cfg.ttlSeconds = parseInt("QCACHE_CACHE_TTL", *value);
    }
    if (auto value = readEnv("QCACHE_CACHE_MAX_SIZE")) {
        cfg.maxSize = parseInt("QCACHE_CACHE_MAX_SIZE", *value);
    }
    if (auto value = readEnv("QCACHE_CACHE_STRATEGY")) {
        cfg.policy = parsePolicy(*value);
    }
    if (auto value = readEnv("QCACHE_FORMAT")) {
        cfg.defaultFormat = *value;
    }

    cfg.validate();
    return cfg;
}

auto CacheStats::toJson() const -> json {
    if (!enabled) {
        return {{"enabled", false}};
    }
    return {{"enabled", true},
            {"size", size},
            {"maxSize", maxSize},
            {"ttl", ttl.count()},
            {"policy", cache::policyToString(policy)}};
}

}  // namespace qcache::executor
