#include "osync/sync/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

namespace osync::sync {
namespace {

std::chrono::milliseconds read_ms(const json& document, const char* key, std::chrono::milliseconds fallback) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    return std::chrono::milliseconds{it->get<std::int64_t>()};
}

/// Non-numbers throw json::type_error, which parse_config reports as Parse.
template<typename T>
Result<T> read_count(const json& document, const char* key, T fallback) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return Ok(fallback);
    }
    if (it->is_number() && (!it->is_number_unsigned() ||
                            it->get<std::uint64_t>() > std::numeric_limits<T>::max())) {
        return Err<T>(ErrorKind::InvalidArgument, std::string(key) + " must be a non-negative integer, got " +
                                                  it->dump());
    }
    return Ok(it->get<T>());
}

} // namespace

Result<void> SyncConfig::validate() const {
    if (batch_size == 0) {
        return Err<void>(ErrorKind::InvalidArgument, "batch_size must be at least 1");
    }
    if (backoff_base.count() < 0 || backoff_cap.count() < 0) {
        return Err<void>(ErrorKind::InvalidArgument, "backoff durations must not be negative");
    }
    if (backoff_cap < backoff_base) {
        return Err<void>(ErrorKind::InvalidArgument, "backoff_cap must not be below backoff_base");
    }
    if (request_timeout.count() <= 0) {
        return Err<void>(ErrorKind::InvalidArgument, "request_timeout must be positive");
    }
    if (session_timeout.count() < 0 || sync_interval_hint.count() < 0) {
        return Err<void>(ErrorKind::InvalidArgument, "durations must not be negative");
    }

    std::set<std::string> seen;
    for (const auto& collection : collections) {
        if (collection.empty() || collection.find('/') != std::string::npos) {
            return Err<void>(ErrorKind::InvalidArgument, "invalid collection name '" + collection + "'");
        }
        if (!seen.insert(collection).second) {
            return Err<void>(ErrorKind::InvalidArgument, "duplicate collection '" + collection + "'");
        }
    }
    return Ok();
}

Result<SyncConfig> parse_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<SyncConfig>(ErrorKind::Parse, "sync config must be a JSON object");
    }

    SyncConfig config;
    try {
        auto batch_size = read_count(document, "batch_size", config.batch_size);
        if (batch_size.is_error()) {
            return Err<SyncConfig>(batch_size.error());
        }
        config.batch_size = batch_size.value();
        auto max_retries = read_count(document, "max_retries", config.max_retries);
        if (max_retries.is_error()) {
            return Err<SyncConfig>(max_retries.error());
        }
        config.max_retries = max_retries.value();
        config.backoff_base = read_ms(document, "backoff_base_ms", config.backoff_base);
        config.backoff_cap = read_ms(document, "backoff_cap_ms", config.backoff_cap);
        config.sync_interval_hint = read_ms(document, "sync_interval_hint_ms", config.sync_interval_hint);
        config.request_timeout = read_ms(document, "request_timeout_ms", config.request_timeout);
        config.session_timeout = read_ms(document, "session_timeout_ms", config.session_timeout);
        config.collections = document.value("collections", config.collections);

        if (const auto it = document.find("conflict_policy"); it != document.end()) {
            const auto name = it->get<std::string>();
            const auto policy = parse_conflict_policy(name);
            if (!policy.has_value()) {
                return Err<SyncConfig>(ErrorKind::InvalidArgument, "unknown conflict_policy '" + name + "'");
            }
            config.conflict_policy = *policy;
        }

        if (const auto it = document.find("required_features"); it != document.end()) {
            for (const auto& [entity_type, value] : it->items()) {
                const auto name = value.get<std::string>();
                const auto feature = version::FeatureMatrix::parse_feature(name);
                if (!feature.has_value()) {
                    return Err<SyncConfig>(ErrorKind::InvalidArgument,
                                           "unknown feature '" + name + "' for " + entity_type);
                }
                config.required_features[entity_type] = *feature;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<SyncConfig>(ErrorKind::Parse, std::string("malformed sync config: ") + e.what());
    }

    if (auto res = config.validate(); res.is_error()) {
        return Err<SyncConfig>(res.error());
    }
    return Ok(std::move(config));
}

Result<SyncConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(ErrorKind::NotFound, "cannot open sync config " + path.string());
    }

    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::exception& e) {
        return Err<SyncConfig>(ErrorKind::Parse, "invalid JSON in " + path.string() + ": " + e.what());
    }

    auto config = parse_config(document);
    if (config.is_error()) {
        spdlog::error("[Config] {}: {}", path.string(), config.error().message);
    }
    return config;
}

} // namespace osync::sync
