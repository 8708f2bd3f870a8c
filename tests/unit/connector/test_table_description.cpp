//===----------------------------------------------------------------------===//
//                     DuckES Query Runner - Unit Tests
//
// tests/unit/connector/test_table_description.cpp
//
// Unit tests for table description decoding and directory resolution
//===----------------------------------------------------------------------===//

#include "connector/search/table_description.hpp"
#include "connector/search/search_connector_config.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "query/type_decoder.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace duckes;
namespace fs = std::filesystem;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static const char* NATION_JSON = R"({
    "tableName": "nation",
    "schemaName": "tpch",
    "index": "nation",
    "columns": [
        { "name": "n_nationkey", "type": "BIGINT" },
        { "name": "n_name", "type": "VARCHAR" },
        { "name": "n_regionkey", "type": "INTEGER" },
        { "name": "n_comment", "type": "VARCHAR" }
    ]
})";

// Scratch directory removed on scope exit
class TempDirectory {
public:
    explicit TempDirectory(const std::string& name)
        : path(fs::temp_directory_path() / ("duckes_test_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void Write(const std::string& file, const std::string& content) const {
        std::ofstream out(path / file);
        out << content;
    }

    fs::path path;
};

static bool DecodeRejects(TypeDecoder& decoder, const std::string& json, const std::string& fragment) {
    try {
        DecodeTableDescription(json, "tpch", decoder, "test.json");
    } catch (const ConfigError& e) {
        std::string message = e.what();
        return message.find("test.json") != std::string::npos && message.find(fragment) != std::string::npos;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Decoding
//===----------------------------------------------------------------------===//

void TestDecode(TypeDecoder& decoder) {
    std::cout << "  Testing descriptor decoding..." << std::endl;

    auto descriptor = DecodeTableDescription(NATION_JSON, "default", decoder);
    assert(descriptor.GetSchemaName() == "tpch");
    assert(descriptor.GetTableName() == "nation");
    assert(descriptor.GetIndexName() == "nation");
    assert(descriptor.GetColumns().size() == 4);
    assert(descriptor.GetColumns()[0].name == "n_nationkey");
    assert(descriptor.GetColumns()[0].type == duckdb::LogicalType::BIGINT);
    assert(descriptor.GetColumns()[2].type == duckdb::LogicalType::INTEGER);

    auto decimal = DecodeTableDescription(
        R"({"tableName": "orders", "columns": [{"name": "o_totalprice", "type": "DECIMAL(15,2)"},
                                               {"name": "o_orderdate", "type": "DATE"}]})",
        "tpch", decoder);
    assert(decimal.GetColumns()[0].type.id() == duckdb::LogicalTypeId::DECIMAL);
    assert(duckdb::DecimalType::GetScale(decimal.GetColumns()[0].type) == 2);
    assert(decimal.GetColumns()[1].type == duckdb::LogicalType::DATE);

    std::cout << "    PASSED" << std::endl;
}

void TestDefaultSchema(TypeDecoder& decoder) {
    std::cout << "  Testing default schema..." << std::endl;

    auto descriptor = DecodeTableDescription(R"({"tableName": "region", "columns": []})", "tpch", decoder);
    assert(descriptor.GetSchemaName() == "tpch");
    assert(descriptor.GetIndexName() == "region");
    assert(descriptor.GetColumns().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestIndexName(TypeDecoder& decoder) {
    std::cout << "  Testing index name derivation..." << std::endl;

    assert(TableDescriptor::IndexNameFor("LineItem") == "lineitem");

    // Mixed-case table names are kept, the index is lower-cased
    auto descriptor = DecodeTableDescription(R"({"tableName": "PartSupp", "columns": []})", "tpch", decoder);
    assert(descriptor.GetTableName() == "PartSupp");
    assert(descriptor.GetIndexName() == "partsupp");

    assert(DecodeRejects(decoder, R"({"tableName": "nation", "index": "nations", "columns": []})",
                         "lower-cased table name"));
    assert(DecodeRejects(decoder, R"({"tableName": "Nation", "index": "Nation", "columns": []})",
                         "lower-cased table name"));

    std::cout << "    PASSED" << std::endl;
}

void TestDecodeErrors(TypeDecoder& decoder) {
    std::cout << "  Testing decode errors..." << std::endl;

    assert(DecodeRejects(decoder, "{ not json", "malformed JSON"));
    assert(DecodeRejects(decoder, "[1, 2]", "JSON object"));
    assert(DecodeRejects(decoder, R"({"columns": []})", "tableName"));
    assert(DecodeRejects(decoder, R"({"tableName": 5, "columns": []})", "tableName"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "schemaName": "", "columns": []})", "schemaName"));
    assert(DecodeRejects(decoder, R"({"tableName": "t"})", "columns"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "columns": {}})", "columns"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "columns": [5]})", "column 0"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "columns": [{"type": "BIGINT"}]})", "name"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "columns": [{"name": "a"}]})", "type"));
    assert(DecodeRejects(decoder,
                         R"({"tableName": "t", "columns": [{"name": "a", "type": "BIGINT"},
                                                           {"name": "a", "type": "VARCHAR"}]})",
                         "duplicate column 'a'"));
    assert(DecodeRejects(decoder, R"({"tableName": "t", "columns": [{"name": "a", "type": "NOT_A_TYPE"}]})",
                         "'a'"));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Provider
//===----------------------------------------------------------------------===//

void TestProvider(TypeDecoder& decoder) {
    std::cout << "  Testing description provider..." << std::endl;

    std::vector<TableDescriptor> descriptors;
    descriptors.push_back(DecodeTableDescription(NATION_JSON, "tpch", decoder));
    descriptors.push_back(DecodeTableDescription(R"({"tableName": "region", "columns": []})", "tpch", decoder));
    descriptors.push_back(DecodeTableDescription(R"({"tableName": "region", "columns": []})", "other", decoder));

    TableDescriptionProvider provider(std::move(descriptors));
    assert(provider.Size() == 3);
    assert(provider.GetAll().size() == 3);

    assert(provider.Get("tpch", "nation") != nullptr);
    assert(provider.Get("other", "region") != nullptr);
    assert(provider.Get("tpch", "NATION") == nullptr);
    assert(provider.Get("other", "nation") == nullptr);

    auto tables = provider.ListTables("tpch");
    assert((tables == std::vector<std::string>{"nation", "region"}));
    assert(provider.ListTables("missing").empty());

    std::vector<TableDescriptor> duplicates;
    duplicates.push_back(DecodeTableDescription(NATION_JSON, "tpch", decoder));
    duplicates.push_back(DecodeTableDescription(NATION_JSON, "tpch", decoder));
    bool threw = false;
    try {
        TableDescriptionProvider rejected(std::move(duplicates));
    } catch (const ConfigError& e) {
        threw = true;
        assert(std::string(e.what()).find("tpch.nation") != std::string::npos);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Resolution
//===----------------------------------------------------------------------===//

void TestResolveDirectory() {
    std::cout << "  Testing directory location resolution..." << std::endl;

    TempDirectory dir("resolve");
    std::string absolute = dir.path.string();

    assert(ResolveDescriptionDirectory(absolute) == absolute);
    assert(ResolveDescriptionDirectory("file://" + absolute) == absolute);
    assert(ResolveDescriptionDirectory("file://localhost" + absolute) == absolute);
    assert(ResolveDescriptionDirectory("file:" + absolute) == absolute);

    auto rejects = [](const std::string& location) {
        try {
            ResolveDescriptionDirectory(location);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };
    assert(rejects("http://example.com/descriptions"));
    assert(rejects("file://remote-host" + absolute));
    assert(rejects("file://"));
    assert(rejects(absolute + "/missing"));

    dir.Write("plain.json", "{}");
    assert(rejects(absolute + "/plain.json"));

    std::cout << "    PASSED" << std::endl;
}

void TestResolveDescriptions(TypeDecoder& decoder) {
    std::cout << "  Testing description directory loading..." << std::endl;

    TempDirectory dir("descriptions");
    dir.Write("nation.json", NATION_JSON);
    dir.Write("region.json", R"({"tableName": "region", "columns": [{"name": "r_regionkey", "type": "BIGINT"}]})");
    dir.Write("README.md", "not a description");

    SearchConnectorConfig config;
    config.default_schema = "tpch";
    config.table_description_directory = "file://" + dir.path.string();

    auto provider = ResolveTableDescriptions(config, decoder);
    assert(provider->Size() == 2);
    assert(provider->Get("tpch", "nation"));
    assert(provider->Get("tpch", "region")->GetColumns().size() == 1);

    // One malformed document fails the whole directory, naming the file
    dir.Write("zzz.json", R"({"tableName": "broken", "index": "other", "columns": []})");
    bool threw = false;
    try {
        ResolveTableDescriptions(config, decoder);
    } catch (const ConfigError& e) {
        threw = true;
        assert(std::string(e.what()).find("zzz.json") != std::string::npos);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestBundledDescriptions(TypeDecoder& decoder) {
    std::cout << "  Testing bundled descriptions..." << std::endl;

    SearchConnectorConfig config;
    config.default_schema = "tpch";
    config.table_description_directory = std::string(DUCKES_RESOURCE_DIR) + "/queryrunner";

    auto provider = ResolveTableDescriptions(config, decoder);
    assert(provider->Size() == 8);
    for (const auto* descriptor : provider->GetAll()) {
        assert(descriptor->GetSchemaName() == "tpch");
        assert(descriptor->GetIndexName() == descriptor->GetTableName());
        assert(!descriptor->GetColumns().empty());
    }
    assert(provider->Get("tpch", "lineitem")->GetColumns().size() == 16);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    Logger::Initialize("", "error");

    duckdb::DuckDB db(nullptr);
    TypeDecoder decoder(*db.instance);

    std::cout << "=== Table Description Unit Tests ===" << std::endl;

    std::cout << "\n1. Decoding:" << std::endl;
    TestDecode(decoder);
    TestDefaultSchema(decoder);
    TestIndexName(decoder);
    TestDecodeErrors(decoder);

    std::cout << "\n2. Provider:" << std::endl;
    TestProvider(decoder);

    std::cout << "\n3. Resolution:" << std::endl;
    TestResolveDirectory();
    TestResolveDescriptions(decoder);
    TestBundledDescriptions(decoder);

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    Logger::Shutdown();
    return 0;
}
