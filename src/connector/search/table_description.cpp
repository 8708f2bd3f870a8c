//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// connector/search/table_description.cpp
//===----------------------------------------------------------------------===//

#include "connector/search/table_description.hpp"
#include "connector/search/search_connector_config.hpp"
#include "errors/harness_error.hpp"
#include "logging/logger.hpp"
#include "query/type_decoder.hpp"
#include "search/json_util.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <parallel_hashmap/phmap.h>
#include <sstream>

namespace duckes {

namespace fs = std::filesystem;

TableDescriptor::TableDescriptor(std::string schema_name_p, std::string table_name_p,
                                 std::vector<ColumnDescriptor> columns_p)
    : schema_name(std::move(schema_name_p))
    , table_name(std::move(table_name_p))
    , index_name(IndexNameFor(table_name))
    , columns(std::move(columns_p)) {
}

std::string TableDescriptor::IndexNameFor(const std::string& table_name) {
    return duckdb::StringUtil::Lower(table_name);
}

//===----------------------------------------------------------------------===//
// Decoding
//===----------------------------------------------------------------------===//

namespace {

std::string RequireString(const Json::Value& object, const char* field, const std::string& source) {
    const Json::Value& value = object[field];
    if (!value.isString() || value.asString().empty()) {
        throw ConfigError(source + ": '" + field + "' must be a non-empty string");
    }
    return value.asString();
}

} // namespace

TableDescriptor DecodeTableDescription(const std::string& json_text,
                                       const std::string& default_schema,
                                       TypeDecoder& decoder,
                                       const std::string& source) {
    Json::Value root;
    std::string parse_error;
    if (!ParseJson(json_text, root, parse_error)) {
        throw ConfigError(source + ": malformed JSON: " + parse_error);
    }
    if (!root.isObject()) {
        throw ConfigError(source + ": table description must be a JSON object");
    }

    std::string table_name = RequireString(root, "tableName", source);
    std::string schema_name = default_schema;
    if (root.isMember("schemaName")) {
        schema_name = RequireString(root, "schemaName", source);
    }

    std::string expected_index = TableDescriptor::IndexNameFor(table_name);
    if (root.isMember("index")) {
        std::string index = RequireString(root, "index", source);
        if (index != expected_index) {
            throw ConfigError(source + ": index '" + index + "' must be the lower-cased table name '" +
                              expected_index + "'");
        }
    }
    if (table_name != expected_index) {
        LOG_WARN("table_description", source + ": table name '" + table_name +
                 "' is not lower-case, lookups are case-sensitive");
    }

    const Json::Value& columns_node = root["columns"];
    if (!columns_node.isArray()) {
        throw ConfigError(source + ": 'columns' must be an array");
    }

    std::vector<ColumnDescriptor> columns;
    phmap::flat_hash_set<std::string> seen;
    for (Json::ArrayIndex i = 0; i < columns_node.size(); i++) {
        const Json::Value& column = columns_node[i];
        std::string column_source = source + ": column " + std::to_string(i);
        if (!column.isObject()) {
            throw ConfigError(column_source + " must be an object");
        }
        ColumnDescriptor descriptor;
        descriptor.name = RequireString(column, "name", column_source);
        if (!seen.insert(descriptor.name).second) {
            throw ConfigError(column_source + ": duplicate column '" + descriptor.name + "'");
        }
        std::string type_name = RequireString(column, "type", column_source);
        try {
            descriptor.type = decoder.Decode(type_name);
        } catch (const ConfigError& e) {
            throw ConfigError(column_source + " ('" + descriptor.name + "'): " + e.what());
        }
        columns.push_back(std::move(descriptor));
    }

    return TableDescriptor(std::move(schema_name), std::move(table_name), std::move(columns));
}

//===----------------------------------------------------------------------===//
// Provider
//===----------------------------------------------------------------------===//

TableDescriptionProvider::TableDescriptionProvider(std::vector<TableDescriptor> descriptors_p) {
    for (auto& descriptor : descriptors_p) {
        auto key = std::make_pair(descriptor.GetSchemaName(), descriptor.GetTableName());
        if (descriptors.count(key) > 0) {
            throw ConfigError("Duplicate table description for " + key.first + "." + key.second);
        }
        descriptors.emplace(std::move(key), std::move(descriptor));
    }
}

const TableDescriptor* TableDescriptionProvider::Get(const std::string& schema, const std::string& table) const {
    auto it = descriptors.find(std::make_pair(schema, table));
    return it == descriptors.end() ? nullptr : &it->second;
}

std::vector<std::string> TableDescriptionProvider::ListTables(const std::string& schema) const {
    std::vector<std::string> tables;
    for (const auto& entry : descriptors) {
        if (entry.first.first == schema) {
            tables.push_back(entry.first.second);
        }
    }
    return tables;
}

std::vector<const TableDescriptor*> TableDescriptionProvider::GetAll() const {
    std::vector<const TableDescriptor*> all;
    all.reserve(descriptors.size());
    for (const auto& entry : descriptors) {
        all.push_back(&entry.second);
    }
    return all;
}

//===----------------------------------------------------------------------===//
// Resolution
//===----------------------------------------------------------------------===//

std::string ResolveDescriptionDirectory(const std::string& location) {
    static const std::string FILE_SCHEME = "file:";

    std::string path = location;
    if (location.compare(0, FILE_SCHEME.size(), FILE_SCHEME) == 0) {
        path = location.substr(FILE_SCHEME.size());
        // file:///abs -> /abs, file://localhost/abs -> /abs
        if (path.compare(0, 2, "//") == 0) {
            auto slash = path.find('/', 2);
            std::string authority = path.substr(2, slash == std::string::npos ? std::string::npos : slash - 2);
            if (!authority.empty() && authority != "localhost") {
                throw ConfigError("Unsupported host in table description location: " + location);
            }
            path = slash == std::string::npos ? "" : path.substr(slash);
        }
    } else if (location.find("://") != std::string::npos) {
        throw ConfigError("Unsupported table description location: " + location);
    }

    if (path.empty()) {
        throw ConfigError("Empty table description location: '" + location + "'");
    }

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw ConfigError("Table description location is not a directory: " + location);
    }
    return path;
}

std::shared_ptr<const TableDescriptionProvider> ResolveTableDescriptions(const SearchConnectorConfig& config,
                                                                         TypeDecoder& decoder) {
    std::string directory = ResolveDescriptionDirectory(config.table_description_directory);

    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json" && it->is_regular_file()) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw ConfigError("Cannot list table descriptions in " + directory + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::vector<TableDescriptor> descriptors;
    for (const auto& file : files) {
        std::ifstream in(file);
        if (!in) {
            throw ConfigError("Cannot read table description " + file.string());
        }
        std::stringstream content;
        content << in.rdbuf();
        descriptors.push_back(DecodeTableDescription(content.str(), config.default_schema, decoder, file.string()));
    }

    auto provider = std::make_shared<const TableDescriptionProvider>(std::move(descriptors));
    LOG_INFO("table_description", "Loaded " + std::to_string(provider->Size()) +
             " table descriptions from " + directory);
    return provider;
}

} // namespace duckes
