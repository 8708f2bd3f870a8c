//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/document_converter.hpp
//
// Query result rows to search documents
//===----------------------------------------------------------------------===//

#pragma once

#include "loader/row_stream.hpp"
#include <json/json.h>
#include <stdexcept>

namespace duckes {

class UnconvertibleValueError : public std::runtime_error {
public:
    UnconvertibleValueError(const std::string& column_p, const std::string& message)
        : std::runtime_error(message), column(column_p) {}

    const std::string& GetColumn() const { return column; }

private:
    std::string column;
};

// Booleans, integers, floating point, decimals (as double), strings,
// dates and timestamps (ISO-8601) and times. Throws UnconvertibleValueError
// for any other type and for non-finite floating point values.
Json::Value ConvertValue(const duckdb::Value& value, const std::string& column = "");

// One field per column, named verbatim. NULL values are omitted.
Json::Value RowToDocument(const QueryResultRow& row);

} // namespace duckes
