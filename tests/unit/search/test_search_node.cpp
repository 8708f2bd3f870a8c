//===----------------------------------------------------------------------===//
//                     DuckES Query Runner - Unit Tests
//
// tests/unit/search/test_search_node.cpp
//
// Tests for the embedded search node through SearchClient over HTTP
//===----------------------------------------------------------------------===//

#include "search/embedded_search_node.hpp"
#include "search/search_client.hpp"
#include "logging/logger.hpp"
#include <cassert>
#include <iostream>

using namespace duckes;

static std::vector<Json::Value> Nations(int count) {
    std::vector<Json::Value> docs;
    for (int i = 0; i < count; ++i) {
        Json::Value doc;
        doc["n_nationkey"] = i;
        doc["n_name"] = "NATION_" + std::to_string(i);
        docs.push_back(doc);
    }
    return docs;
}

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

void TestStartStop() {
    std::cout << "  Testing start and stop..." << std::endl;

    EmbeddedSearchNode node;
    assert(!node.IsRunning());
    node.Start();
    assert(node.IsRunning());
    assert(node.GetPort() != 0);
    assert(node.GetBaseUrl() == "http://127.0.0.1:" + std::to_string(node.GetPort()));

    // Second start is a no-op
    uint16_t port = node.GetPort();
    node.Start();
    assert(node.GetPort() == port);

    node.Stop();
    assert(!node.IsRunning());
    node.Stop();

    std::cout << "    PASSED" << std::endl;
}

void TestInfo() {
    std::cout << "  Testing cluster info..." << std::endl;

    EmbeddedSearchNode::Config config;
    config.cluster_name = "runner-test";
    EmbeddedSearchNode node(config);
    node.Start();

    auto client = node.CreateClient(std::chrono::seconds(5));
    auto info = client->Info();
    assert(info["version"]["number"].asString() == "6.8.0");
    assert(info["cluster_name"].asString() == "runner-test");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Indices and bulk
//===----------------------------------------------------------------------===//

void TestCreateIndex() {
    std::cout << "  Testing index creation..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));

    Json::Value properties;
    properties["n_nationkey"]["type"] = "long";
    properties["n_name"]["type"] = "keyword";

    assert(!client->IndexExists("nation"));
    assert(client->CreateIndex("nation", properties));
    assert(client->IndexExists("nation"));
    assert(!client->CreateIndex("nation", properties));
    assert(client->Count("nation") == 0);

    Json::Value bad;
    bad["x"]["type"] = "geo_shape";
    bool threw = false;
    try {
        client->CreateIndex("broken", bad);
    } catch (const SearchClientError& e) {
        threw = true;
        assert(e.GetStatus() == 400);
        assert(!e.IsTransient());
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestBulkAndCount() {
    std::cout << "  Testing bulk indexing and count..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));

    auto response = client->Bulk("nation", Nations(25));
    assert(response.Ok());
    assert(client->GetBulkRequestCount() == 1);
    assert(client->Count("nation") == 25);
    assert(node.GetStore().Count("nation") == 25);

    // Indexing again duplicates documents
    assert(client->Bulk("nation", Nations(25)).Ok());
    assert(client->Count("nation") == 50);

    std::cout << "    PASSED" << std::endl;
}

void TestBulkItemFailure() {
    std::cout << "  Testing bulk item failure..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));

    std::vector<Json::Value> docs = Nations(3);
    docs[1]["n_nationkey"] = "one";  // conflicts with the inferred long

    auto response = client->Bulk("nation", docs);
    assert(response.status == 200);
    assert(!response.Ok());
    assert(response.failures.size() == 1);
    assert(response.failures[0].item_index == 1);
    assert(response.failures[0].status == 400);
    assert(response.failures[0].type == "mapper_parsing_exception");
    assert(client->Count("nation") == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestInjectedFailures() {
    std::cout << "  Testing injected failures..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));

    node.InjectFailures("/_bulk", 503, 2);

    auto first = client->Bulk("nation", Nations(1));
    assert(first.status == 503);
    assert(IsTransientStatus(first.status));
    // The error holds the response body, the status is reported separately
    assert(first.error.find("injected_failure") != std::string::npos);
    assert(first.error.find("HTTP") == std::string::npos);
    assert(client->Bulk("nation", Nations(1)).status == 503);
    assert(client->Bulk("nation", Nations(1)).Ok());
    assert(client->Count("nation") == 1);

    // Other paths are unaffected
    node.InjectFailures("/_bulk", 429, 1);
    assert(client->Count("nation") == 1);
    assert(client->Bulk("nation", Nations(1)).status == 429);

    std::cout << "    PASSED" << std::endl;
}

void TestMissingIndex() {
    std::cout << "  Testing missing index..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));

    bool threw = false;
    try {
        client->Count("absent");
    } catch (const SearchClientError& e) {
        threw = true;
        assert(e.GetStatus() == 404);
    }
    assert(threw);

    threw = false;
    try {
        client->StartScroll("absent", 10, "1m");
    } catch (const SearchClientError& e) {
        threw = true;
        assert(e.GetStatus() == 404);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Scroll
//===----------------------------------------------------------------------===//

void TestScroll() {
    std::cout << "  Testing scroll paging..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));
    assert(client->Bulk("nation", Nations(25)).Ok());

    auto page = client->StartScroll("nation", 10, "1m");
    assert(page.total_hits == 25);
    assert(page.documents.size() == 10);
    assert(!page.scroll_id.empty());

    size_t seen = page.documents.size();
    std::string scroll_id = page.scroll_id;
    while (true) {
        auto next = client->ContinueScroll(scroll_id, "1m");
        if (next.documents.empty()) break;
        seen += next.documents.size();
    }
    assert(seen == 25);

    assert(node.GetStore().OpenScrollCount() == 1);
    client->ClearScroll(scroll_id);
    assert(node.GetStore().OpenScrollCount() == 0);
    // Clearing twice is tolerated
    client->ClearScroll(scroll_id);

    bool threw = false;
    try {
        client->ContinueScroll(scroll_id, "1m");
    } catch (const SearchClientError& e) {
        threw = true;
        assert(e.GetStatus() == 404);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestBadKeepAlive() {
    std::cout << "  Testing invalid scroll keep-alive..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    auto client = node.CreateClient(std::chrono::seconds(5));
    assert(client->Bulk("nation", Nations(1)).Ok());

    bool threw = false;
    try {
        client->StartScroll("nation", 10, "soon");
    } catch (const SearchClientError& e) {
        threw = true;
        assert(e.GetStatus() == 400);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Routing
//===----------------------------------------------------------------------===//

void TestUnknownRoute() {
    std::cout << "  Testing unknown route..." << std::endl;

    EmbeddedSearchNode node;
    node.Start();
    HttpClient http("127.0.0.1", node.GetPort(), std::chrono::seconds(5));

    auto result = http.Send("PATCH", "/nation");
    assert(result.status == 405);
    assert(result.body.find("method_not_allowed") != std::string::npos);

    auto malformed = http.Post("/_bulk", "not json\n{}\n", "application/x-ndjson");
    assert(malformed.status == 400);

    assert(node.GetRequestCount() >= 2);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    Logger::Initialize("", "warn");

    std::cout << "=== EmbeddedSearchNode Tests ===" << std::endl;

    std::cout << "\n1. Lifecycle:" << std::endl;
    TestStartStop();
    TestInfo();

    std::cout << "\n2. Indices and Bulk:" << std::endl;
    TestCreateIndex();
    TestBulkAndCount();
    TestBulkItemFailure();
    TestInjectedFailures();
    TestMissingIndex();

    std::cout << "\n3. Scroll:" << std::endl;
    TestScroll();
    TestBadKeepAlive();

    std::cout << "\n4. Routing:" << std::endl;
    TestUnknownRoute();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    Logger::Shutdown();
    return 0;
}
