//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/document_converter.cpp
//===----------------------------------------------------------------------===//

#include "loader/document_converter.hpp"
#include <cmath>

namespace duckes {

namespace {

// "1998-12-01 10:15:00" -> "1998-12-01T10:15:00"
std::string ToIsoTimestamp(const duckdb::Value& value) {
    std::string text = value.DefaultCastAs(duckdb::LogicalType::TIMESTAMP).ToString();
    auto space = text.find(' ');
    if (space != std::string::npos) {
        text[space] = 'T';
    }
    return text;
}

Json::Value ConvertFloating(double value, const std::string& column) {
    if (!std::isfinite(value)) {
        throw UnconvertibleValueError(column, "Column '" + column + "': non-finite value " +
                                      std::to_string(value) + " has no JSON representation");
    }
    return Json::Value(value);
}

} // namespace

Json::Value ConvertValue(const duckdb::Value& value, const std::string& column) {
    using duckdb::LogicalTypeId;

    if (value.IsNull()) {
        return Json::Value(Json::nullValue);
    }

    const auto& type = value.type();
    switch (type.id()) {
    case LogicalTypeId::BOOLEAN:
        return Json::Value(value.GetValue<bool>());
    case LogicalTypeId::TINYINT:
    case LogicalTypeId::SMALLINT:
    case LogicalTypeId::INTEGER:
    case LogicalTypeId::BIGINT:
        return Json::Value(static_cast<Json::Int64>(value.GetValue<int64_t>()));
    case LogicalTypeId::UTINYINT:
    case LogicalTypeId::USMALLINT:
    case LogicalTypeId::UINTEGER:
    case LogicalTypeId::UBIGINT:
        return Json::Value(static_cast<Json::UInt64>(value.GetValue<uint64_t>()));
    case LogicalTypeId::HUGEINT: {
        duckdb::Value narrowed = value;
        if (!narrowed.DefaultTryCastAs(duckdb::LogicalType::BIGINT)) {
            throw UnconvertibleValueError(column, "Column '" + column + "': HUGEINT " + value.ToString() +
                                          " does not fit in 64 bits");
        }
        return Json::Value(static_cast<Json::Int64>(narrowed.GetValue<int64_t>()));
    }
    case LogicalTypeId::FLOAT:
    case LogicalTypeId::DOUBLE:
    case LogicalTypeId::DECIMAL:
        return ConvertFloating(value.GetValue<double>(), column);
    case LogicalTypeId::VARCHAR:
        return Json::Value(duckdb::StringValue::Get(value));
    case LogicalTypeId::DATE:
    case LogicalTypeId::TIME:
        return Json::Value(value.ToString());
    case LogicalTypeId::TIMESTAMP:
    case LogicalTypeId::TIMESTAMP_MS:
    case LogicalTypeId::TIMESTAMP_SEC:
    case LogicalTypeId::TIMESTAMP_NS:
        return Json::Value(ToIsoTimestamp(value));
    default:
        throw UnconvertibleValueError(column, "Column '" + column + "': unsupported type " + type.ToString());
    }
}

Json::Value RowToDocument(const QueryResultRow& row) {
    Json::Value document(Json::objectValue);
    for (const auto& field : row.fields) {
        if (field.second.IsNull()) {
            continue;
        }
        document[field.first] = ConvertValue(field.second, field.first);
    }
    return document;
}

} // namespace duckes
