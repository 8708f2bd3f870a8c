//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// query/type_decoder.cpp
//===----------------------------------------------------------------------===//

#include "query/type_decoder.hpp"
#include "errors/harness_error.hpp"
#include <cctype>

namespace duckes {

TypeDecoder::TypeDecoder(duckdb::DatabaseInstance& db)
    : connection(std::make_unique<duckdb::Connection>(db)) {
}

bool TypeDecoder::IsWellFormed(const std::string& type_name) {
    if (type_name.empty()) {
        return false;
    }
    for (char c : type_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '(' && c != ')' && c != ',' && c != ' ' && c != '[' && c != ']') {
            return false;
        }
    }
    return true;
}

duckdb::LogicalType TypeDecoder::Decode(const std::string& type_name) {
    if (!IsWellFormed(type_name)) {
        throw ConfigError("Malformed type name '" + type_name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(type_name);
    if (it != cache.end()) {
        return it->second;
    }

    auto result = connection->Query("SELECT CAST(NULL AS " + type_name + ")");
    if (result->HasError()) {
        throw ConfigError("Unknown type '" + type_name + "': " + result->GetError());
    }

    duckdb::LogicalType decoded = result->types[0];
    cache.emplace(type_name, decoded);
    return decoded;
}

} // namespace duckes
