//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/search_client.cpp
//===----------------------------------------------------------------------===//

#include "search/search_client.hpp"
#include "search/json_util.hpp"
#include "logging/logger.hpp"

namespace duckes {

SearchClient::SearchClient(std::string host, uint16_t port, std::chrono::milliseconds request_timeout)
    : http(std::move(host), port, request_timeout) {
}

Json::Value SearchClient::ParseBody(const HttpResult& result, const std::string& operation) const {
    Json::Value body;
    std::string error;
    if (!ParseJson(result.body, body, error)) {
        throw SearchClientError(operation + ": invalid JSON response: " + error, result.status);
    }
    return body;
}

Json::Value SearchClient::Info() const {
    auto result = http.Get("/");
    if (result.status != 200) {
        throw SearchClientError("info: HTTP " + std::to_string(result.status), result.status);
    }
    return ParseBody(result, "info");
}

bool SearchClient::CreateIndex(const std::string& index, const Json::Value& properties) const {
    Json::Value request;
    request["mappings"]["properties"] = properties;

    auto result = http.Send("PUT", "/" + index, ToCompactJson(request));
    if (result.status == 200) {
        LOG_DEBUG("search_client", "Created index " + index);
        return true;
    }
    if (result.status == 400 || result.status == 409) {
        auto body = ParseBody(result, "create index");
        if (body["error"]["type"].asString() == "resource_already_exists_exception") {
            return false;
        }
    }
    throw SearchClientError("create index " + index + ": HTTP " + std::to_string(result.status) +
                            " " + result.body, result.status);
}

bool SearchClient::IndexExists(const std::string& index) const {
    auto result = http.Send("HEAD", "/" + index);
    return result.status == 200;
}

BulkResponse SearchClient::Bulk(const std::string& index, const std::vector<Json::Value>& documents) {
    Json::Value action;
    action["index"]["_index"] = index;
    action["index"]["_type"] = "doc";
    const std::string action_line = ToCompactJson(action);

    std::string body;
    for (const auto& doc : documents) {
        body += action_line;
        body += '\n';
        body += ToCompactJson(doc);
        body += '\n';
    }

    bulk_requests++;
    auto result = http.Post("/_bulk?refresh=true", body, "application/x-ndjson");

    BulkResponse response;
    response.status = result.status;
    if (result.status != 200) {
        response.error = result.body;
        return response;
    }

    Json::Value parsed = ParseBody(result, "bulk");
    if (!parsed["errors"].asBool()) {
        return response;
    }

    const Json::Value& items = parsed["items"];
    for (Json::ArrayIndex i = 0; i < items.size(); ++i) {
        const Json::Value& item = items[i]["index"];
        int status = item["status"].asInt();
        if (status >= 200 && status < 300) {
            continue;
        }
        BulkItemFailure failure;
        failure.item_index = i;
        failure.status = status;
        failure.type = item["error"]["type"].asString();
        failure.reason = item["error"]["reason"].asString();
        response.failures.push_back(std::move(failure));
    }
    return response;
}

uint64_t SearchClient::Count(const std::string& index) const {
    auto result = http.Get("/" + index + "/_count");
    if (result.status != 200) {
        throw SearchClientError("count " + index + ": HTTP " + std::to_string(result.status), result.status);
    }
    return ParseBody(result, "count")["count"].asUInt64();
}

SearchPage SearchClient::ParsePage(const Json::Value& body) const {
    SearchPage page;
    page.scroll_id = body["_scroll_id"].asString();
    page.total_hits = body["hits"]["total"].asUInt64();
    for (const auto& hit : body["hits"]["hits"]) {
        page.documents.push_back(hit["_source"]);
    }
    return page;
}

SearchPage SearchClient::StartScroll(const std::string& index, uint32_t size,
                                     const std::string& keep_alive) const {
    Json::Value request;
    request["size"] = size;
    request["query"]["match_all"] = Json::Value(Json::objectValue);

    auto result = http.Post("/" + index + "/_search?scroll=" + keep_alive, ToCompactJson(request));
    if (result.status != 200) {
        throw SearchClientError("search " + index + ": HTTP " + std::to_string(result.status), result.status);
    }
    return ParsePage(ParseBody(result, "search"));
}

SearchPage SearchClient::ContinueScroll(const std::string& scroll_id, const std::string& keep_alive) const {
    Json::Value request;
    request["scroll"] = keep_alive;
    request["scroll_id"] = scroll_id;

    auto result = http.Post("/_search/scroll", ToCompactJson(request));
    if (result.status != 200) {
        throw SearchClientError("scroll: HTTP " + std::to_string(result.status), result.status);
    }
    return ParsePage(ParseBody(result, "scroll"));
}

void SearchClient::ClearScroll(const std::string& scroll_id) const {
    Json::Value request;
    request["scroll_id"].append(scroll_id);

    auto result = http.Send("DELETE", "/_search/scroll", ToCompactJson(request));
    if (result.status != 200 && result.status != 404) {
        throw SearchClientError("clear scroll: HTTP " + std::to_string(result.status), result.status);
    }
}

} // namespace duckes
