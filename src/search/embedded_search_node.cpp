//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/embedded_search_node.cpp
//===----------------------------------------------------------------------===//

#include "search/embedded_search_node.hpp"
#include "search/json_util.hpp"
#include "search/search_client.hpp"
#include "config/duration.hpp"
#include "logging/logger.hpp"
#include <sstream>

namespace duckes {

namespace {

constexpr const char* SEARCH_VERSION = "6.8.0";

std::chrono::milliseconds KeepAlive(const std::string& text) {
    auto parsed = ParseDuration(text);
    if (!parsed) {
        throw std::invalid_argument("failed to parse setting [scroll] with value [" + text + "]");
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*parsed);
}

} // namespace

EmbeddedSearchNode::EmbeddedSearchNode() : EmbeddedSearchNode(Config{}) {
}

EmbeddedSearchNode::EmbeddedSearchNode(const Config& config_p) : config(config_p) {
}

EmbeddedSearchNode::~EmbeddedSearchNode() {
    Stop();
}

void EmbeddedSearchNode::Start() {
    if (server && server->IsRunning()) {
        return;
    }
    auto created = std::make_unique<HttpServer>(
        config.host, config.port, "search_node",
        [this](const HttpRequest& request) { return Handle(request); });
    created->Start();
    server = std::move(created);

    LOG_INFO("search_node", "Embedded search node '" + config.cluster_name + "' listening on " + GetBaseUrl());
}

void EmbeddedSearchNode::Stop() {
    if (server) {
        server->Stop();
        server.reset();
        LOG_INFO("search_node", "Embedded search node stopped");
    }
}

bool EmbeddedSearchNode::IsRunning() const {
    return server && server->IsRunning();
}

uint16_t EmbeddedSearchNode::GetPort() const {
    return server ? server->GetPort() : config.port;
}

std::string EmbeddedSearchNode::GetBaseUrl() const {
    return "http://" + config.host + ":" + std::to_string(GetPort());
}

std::unique_ptr<SearchClient> EmbeddedSearchNode::CreateClient(std::chrono::milliseconds request_timeout) const {
    return std::make_unique<SearchClient>(config.host, GetPort(), request_timeout);
}

uint64_t EmbeddedSearchNode::GetRequestCount() const {
    return server ? server->GetRequestCount() : 0;
}

void EmbeddedSearchNode::InjectFailures(const std::string& path_prefix, int status, size_t count) {
    std::lock_guard<std::mutex> lock(failure_mutex);
    injected_failures.push_back({path_prefix, status, count});
}

bool EmbeddedSearchNode::TakeInjectedFailure(const std::string& path, int& status) {
    std::lock_guard<std::mutex> lock(failure_mutex);
    for (auto it = injected_failures.begin(); it != injected_failures.end(); ++it) {
        if (path.compare(0, it->path_prefix.size(), it->path_prefix) != 0) {
            continue;
        }
        status = it->status;
        if (--it->remaining == 0) {
            injected_failures.erase(it);
        }
        return true;
    }
    return false;
}

HttpResponse EmbeddedSearchNode::JsonResponse(int status, const Json::Value& body) {
    return {status, "application/json", ToCompactJson(body)};
}

HttpResponse EmbeddedSearchNode::ErrorResponse(int status, const std::string& type, const std::string& reason) {
    Json::Value body;
    body["error"]["type"] = type;
    body["error"]["reason"] = reason;
    body["status"] = status;
    return JsonResponse(status, body);
}

HttpResponse EmbeddedSearchNode::Handle(const HttpRequest& request) {
    int injected_status = 0;
    if (TakeInjectedFailure(request.path, injected_status)) {
        LOG_DEBUG("search_node", "Injected HTTP " + std::to_string(injected_status) + " for " + request.path);
        return ErrorResponse(injected_status, "injected_failure", "failure injected for " + request.path);
    }

    // Split "/a/b" into segments
    std::vector<std::string> segments;
    std::stringstream ss(request.path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) segments.push_back(segment);
    }

    try {
        if (segments.empty() && request.method == "GET") {
            return HandleInfo();
        }
        if (segments.size() == 1 && segments[0] == "_bulk" && request.method == "POST") {
            return HandleBulk(request);
        }
        if (segments.size() == 2 && segments[0] == "_search" && segments[1] == "scroll") {
            if (request.method == "POST" || request.method == "GET") return HandleScroll(request);
            if (request.method == "DELETE") return HandleClearScroll(request);
        }
        if (segments.size() == 1 && segments[0][0] != '_') {
            if (request.method == "PUT") return HandleCreateIndex(segments[0], request);
            if (request.method == "HEAD") {
                return {store.HasIndex(segments[0]) ? 200 : 404, "application/json", ""};
            }
        }
        if (segments.size() == 2 && segments[1] == "_count" && request.method == "GET") {
            return HandleCount(segments[0]);
        }
        if (segments.size() == 2 && segments[1] == "_search" &&
            (request.method == "POST" || request.method == "GET")) {
            return HandleSearch(segments[0], request);
        }
    } catch (const std::invalid_argument& e) {
        return ErrorResponse(400, "illegal_argument_exception", e.what());
    }

    return ErrorResponse(405, "method_not_allowed",
                         "Incorrect HTTP method for uri [" + request.path + "] and method [" + request.method + "]");
}

HttpResponse EmbeddedSearchNode::HandleInfo() {
    Json::Value body;
    body["name"] = "node-0";
    body["cluster_name"] = config.cluster_name;
    body["version"]["number"] = SEARCH_VERSION;
    body["tagline"] = "You Know, for Search";
    return JsonResponse(200, body);
}

HttpResponse EmbeddedSearchNode::HandleCreateIndex(const std::string& index, const HttpRequest& request) {
    Json::Value body(Json::objectValue);
    std::string error;
    if (!request.body.empty() && !ParseJson(request.body, body, error)) {
        return ErrorResponse(400, "parse_exception", error);
    }

    const Json::Value& properties = body["mappings"]["properties"];
    if (!store.CreateIndex(index, properties.isObject() ? properties : Json::Value(Json::objectValue))) {
        return ErrorResponse(400, "resource_already_exists_exception", "index [" + index + "] already exists");
    }

    Json::Value response;
    response["acknowledged"] = true;
    response["index"] = index;
    return JsonResponse(200, response);
}

HttpResponse EmbeddedSearchNode::HandleBulk(const HttpRequest& request) {
    auto start = Clock::now();
    std::istringstream lines(request.body);
    std::string action_line;
    std::string source_line;

    Json::Value items(Json::arrayValue);
    bool errors = false;

    while (std::getline(lines, action_line)) {
        if (action_line.empty()) continue;

        Json::Value action;
        std::string error;
        if (!ParseJson(action_line, action, error) || !action.isObject() || action.size() != 1) {
            return ErrorResponse(400, "illegal_argument_exception", "Malformed action/metadata line: " + error);
        }
        std::string op = action.getMemberNames()[0];
        if (op != "index" && op != "create") {
            return ErrorResponse(400, "illegal_argument_exception", "Unsupported bulk action [" + op + "]");
        }
        std::string index = action[op]["_index"].asString();
        if (index.empty()) {
            return ErrorResponse(400, "action_request_validation_exception", "index is missing");
        }

        if (!std::getline(lines, source_line)) {
            return ErrorResponse(400, "illegal_argument_exception", "The bulk request must be terminated by a newline");
        }

        Json::Value item;
        item["_index"] = index;
        item["_type"] = action[op].get("_type", "doc");

        Json::Value source;
        if (!ParseJson(source_line, source, error)) {
            item["status"] = 400;
            item["error"]["type"] = "mapper_parsing_exception";
            item["error"]["reason"] = "failed to parse: " + error;
            errors = true;
        } else {
            auto result = store.Index(index, source);
            item["status"] = result.status;
            if (result.status >= 300) {
                item["error"]["type"] = result.error_type;
                item["error"]["reason"] = result.reason;
                errors = true;
            } else {
                item["_id"] = result.id;
                item["result"] = "created";
            }
        }

        Json::Value wrapped;
        wrapped[op] = item;
        items.append(wrapped);
    }

    Json::Value response;
    response["took"] = static_cast<Json::Int64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
    response["errors"] = errors;
    response["items"] = items;
    return JsonResponse(200, response);
}

HttpResponse EmbeddedSearchNode::HandleCount(const std::string& index) {
    if (!store.HasIndex(index)) {
        return ErrorResponse(404, "index_not_found_exception", "no such index [" + index + "]");
    }
    Json::Value response;
    response["count"] = static_cast<Json::UInt64>(store.Count(index));
    return JsonResponse(200, response);
}

static Json::Value PageToJson(const IndexStore::ScrollPage& page, const std::string& index) {
    Json::Value response;
    response["_scroll_id"] = page.scroll_id;
    response["hits"]["total"] = static_cast<Json::UInt64>(page.total);
    Json::Value hits(Json::arrayValue);
    for (const auto& hit : page.hits) {
        Json::Value entry;
        entry["_index"] = index;
        entry["_type"] = "doc";
        entry["_id"] = hit.first;
        entry["_source"] = hit.second;
        hits.append(entry);
    }
    response["hits"]["hits"] = hits;
    return response;
}

HttpResponse EmbeddedSearchNode::HandleSearch(const std::string& index, const HttpRequest& request) {
    Json::Value body(Json::objectValue);
    std::string error;
    if (!request.body.empty() && !ParseJson(request.body, body, error)) {
        return ErrorResponse(400, "parse_exception", error);
    }

    uint32_t size = body.get("size", 10).asUInt();
    auto keep_alive = KeepAlive(request.GetParam("scroll", "1m"));

    auto page = store.OpenScroll(index, size, keep_alive);
    if (!page) {
        return ErrorResponse(404, "index_not_found_exception", "no such index [" + index + "]");
    }
    return JsonResponse(200, PageToJson(*page, index));
}

HttpResponse EmbeddedSearchNode::HandleScroll(const HttpRequest& request) {
    Json::Value body;
    std::string error;
    if (!ParseJson(request.body, body, error)) {
        return ErrorResponse(400, "parse_exception", error);
    }

    std::string scroll_id = body["scroll_id"].asString();
    auto page = store.NextPage(scroll_id, KeepAlive(body.get("scroll", "1m").asString()));
    if (!page) {
        return ErrorResponse(404, "search_context_missing_exception", "No search context found for id [" + scroll_id + "]");
    }
    return JsonResponse(200, PageToJson(*page, ""));
}

HttpResponse EmbeddedSearchNode::HandleClearScroll(const HttpRequest& request) {
    Json::Value body;
    std::string error;
    if (!ParseJson(request.body, body, error)) {
        return ErrorResponse(400, "parse_exception", error);
    }

    Json::Value ids = body["scroll_id"];
    if (!ids.isArray()) {
        Json::Value single(Json::arrayValue);
        single.append(ids);
        ids = single;
    }

    uint32_t freed = 0;
    for (const auto& id : ids) {
        if (store.ClearScroll(id.asString())) freed++;
    }

    Json::Value response;
    response["succeeded"] = true;
    response["num_freed"] = freed;
    return JsonResponse(freed > 0 ? 200 : 404, response);
}

} // namespace duckes
