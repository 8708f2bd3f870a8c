//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/row_stream.cpp
//===----------------------------------------------------------------------===//

#include "loader/row_stream.hpp"
#include "session/session.hpp"

namespace duckes {

DuckDBRowStream::DuckDBRowStream(duckdb::unique_ptr<duckdb::QueryResult> result_p)
    : result(std::move(result_p)) {
    if (!result) {
        throw QueryError("No query result to stream");
    }
    for (const auto& name : result->names) {
        names.push_back(name);
    }
}

bool DuckDBRowStream::FetchChunk() {
    try {
        chunk = result->Fetch();
    } catch (const std::exception& e) {
        throw QueryError(e.what());
    }
    if (result->HasError()) {
        throw QueryError(result->GetError());
    }
    chunk_row = 0;
    if (!chunk || chunk->size() == 0) {
        finished = true;
        chunk.reset();
        return false;
    }
    chunks_fetched++;
    return true;
}

bool DuckDBRowStream::Next(QueryResultRow& row) {
    if (finished) {
        return false;
    }
    if (!chunk || chunk_row >= chunk->size()) {
        if (!FetchChunk()) {
            return false;
        }
    }

    row.position = position++;
    row.fields.clear();
    row.fields.reserve(names.size());
    for (duckdb::idx_t col = 0; col < chunk->ColumnCount(); col++) {
        row.fields.emplace_back(names[col], chunk->GetValue(col, chunk_row));
    }
    chunk_row++;
    return true;
}

VectorRowStream::VectorRowStream(std::vector<std::string> names_p, std::vector<std::vector<duckdb::Value>> rows_p)
    : names(std::move(names_p))
    , rows(std::move(rows_p)) {
}

bool VectorRowStream::Next(QueryResultRow& row) {
    if (next >= rows.size()) {
        return false;
    }
    const auto& values = rows[next];
    row.position = next;
    row.fields.clear();
    for (size_t i = 0; i < values.size() && i < names.size(); i++) {
        row.fields.emplace_back(names[i], values[i]);
    }
    next++;
    return true;
}

} // namespace duckes
