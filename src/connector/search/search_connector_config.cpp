//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/search_connector_config.cpp
//===----------------------------------------------------------------------===//

#include "connector/search/search_connector_config.hpp"
#include "errors/harness_error.hpp"

namespace duckes {

namespace {

std::chrono::milliseconds ParseDurationProperty(const std::string& key, const std::string& value) {
    auto parsed = ParseDuration(value);
    if (!parsed) {
        throw ConfigError("Invalid duration for " + key + ": '" + value + "'");
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*parsed);
}

uint32_t ParsePositiveProperty(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || value[0] == '-' || parsed == 0 || parsed > UINT32_MAX) {
        throw ConfigError("Invalid value for " + key + ": '" + value + "' (expected a positive integer)");
    }
    return static_cast<uint32_t>(parsed);
}

} // namespace

SearchConnectorConfig SearchConnectorConfig::FromProperties(const CatalogProperties& properties) {
    SearchConnectorConfig config;
    for (const auto& property : properties) {
        const std::string& key = property.first;
        const std::string& value = property.second;

        if (key == "default-schema-name") {
            if (value.empty()) {
                throw ConfigError("default-schema-name must not be empty");
            }
            config.default_schema = value;
        } else if (key == "table-description-directory") {
            if (value.empty()) {
                throw ConfigError("table-description-directory must not be empty");
            }
            config.table_description_directory = value;
        } else if (key == "scroll-size") {
            config.scroll_size = ParsePositiveProperty(key, value);
        } else if (key == "scroll-timeout") {
            config.scroll_timeout_duration = ParseDurationProperty(key, value);
            config.scroll_timeout = value;
        } else if (key == "request-timeout") {
            config.request_timeout = ParseDurationProperty(key, value);
            if (config.request_timeout.count() == 0) {
                throw ConfigError("request-timeout must be positive");
            }
        } else if (key == "max-request-retries") {
            config.max_request_retries = ParsePositiveProperty(key, value);
        } else if (key == "max-request-retry-time") {
            config.max_request_retry_time = ParseDurationProperty(key, value);
        } else {
            throw ConfigError("Unknown search connector property '" + key + "'");
        }
    }
    return config;
}

RetryPolicy SearchConnectorConfig::GetRetryPolicy() const {
    RetryPolicy policy;
    policy.max_attempts = max_request_retries;
    policy.max_retry_time = max_request_retry_time;
    if (policy.max_backoff > max_request_retry_time) {
        policy.max_backoff = max_request_retry_time;
    }
    if (policy.initial_backoff > policy.max_backoff) {
        policy.initial_backoff = policy.max_backoff;
    }
    return policy;
}

} // namespace duckes
