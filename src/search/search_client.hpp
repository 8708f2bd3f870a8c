//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/search_client.hpp
//
// Client for the search node REST API (bulk, indices, count, scroll)
//===----------------------------------------------------------------------===//

#pragma once

#include "http/http_client.hpp"
#include "search/bulk_transport.hpp"
#include <chrono>
#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace duckes {

class SearchClientError : public std::runtime_error {
public:
    SearchClientError(const std::string& message, int status_p)
        : std::runtime_error(message), status(status_p) {}

    int GetStatus() const { return status; }
    bool IsTransient() const { return IsTransientStatus(status); }

private:
    int status;
};

struct SearchPage {
    std::string scroll_id;
    uint64_t total_hits = 0;
    std::vector<Json::Value> documents;  // _source of every hit
};

class SearchClient : public BulkTransport {
public:
    SearchClient(std::string host, uint16_t port, std::chrono::milliseconds request_timeout);

    // Cluster info from GET /, throws on failure
    Json::Value Info() const;

    // Returns false if the index already exists
    bool CreateIndex(const std::string& index, const Json::Value& properties) const;
    bool IndexExists(const std::string& index) const;

    BulkResponse Bulk(const std::string& index, const std::vector<Json::Value>& documents) override;

    uint64_t Count(const std::string& index) const;

    SearchPage StartScroll(const std::string& index, uint32_t size, const std::string& keep_alive) const;
    SearchPage ContinueScroll(const std::string& scroll_id, const std::string& keep_alive) const;
    void ClearScroll(const std::string& scroll_id) const;

    uint64_t GetBulkRequestCount() const { return bulk_requests; }
    const HttpClient& GetHttpClient() const { return http; }

private:
    Json::Value ParseBody(const HttpResult& result, const std::string& operation) const;
    SearchPage ParsePage(const Json::Value& body) const;

    HttpClient http;
    uint64_t bulk_requests = 0;
};

} // namespace duckes
