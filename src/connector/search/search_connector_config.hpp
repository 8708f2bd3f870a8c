//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/search_connector_config.hpp
//
// Catalog properties of the search connector:
//   default-schema-name          schema of descriptors that do not name one
//   table-description-directory  path or file:// URI of the descriptor directory
//   scroll-size                  hits per scroll page
//   scroll-timeout               scroll keep-alive
//   request-timeout              per HTTP request
//   max-request-retries          attempts per bulk batch
//   max-request-retry-time       time cap across the attempts of one batch
//===----------------------------------------------------------------------===//

#pragma once

#include "config/duration.hpp"
#include "connector/connector.hpp"
#include "loader/retry_policy.hpp"

namespace duckes {

struct SearchConnectorConfig {
    std::string default_schema = "default";
    std::string table_description_directory = "etc/search";
    uint32_t scroll_size = 1000;
    std::string scroll_timeout = "1s";
    std::chrono::milliseconds scroll_timeout_duration{1000};
    std::chrono::milliseconds request_timeout{10000};
    uint32_t max_request_retries = 5;
    std::chrono::milliseconds max_request_retry_time{10000};

    // Throws ConfigError on unknown keys or malformed values
    static SearchConnectorConfig FromProperties(const CatalogProperties& properties);

    RetryPolicy GetRetryPolicy() const;
};

} // namespace duckes
