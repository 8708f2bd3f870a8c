//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/row_stream.hpp
//
// Forward-only row iteration over a query result
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include <string>
#include <utility>
#include <vector>

namespace duckes {

struct QueryResultRow {
    // Zero-based position of the row in its result
    uint64_t position = 0;
    // (column name, value) in result column order
    std::vector<std::pair<std::string, duckdb::Value>> fields;
};

class RowStream {
public:
    virtual ~RowStream() = default;

    // Fills row and returns true, or returns false at end of stream.
    // Not restartable. Throws QueryError if the source fails mid-stream.
    virtual bool Next(QueryResultRow& row) = 0;

    virtual const std::vector<std::string>& GetColumnNames() const = 0;
};

// Pulls chunks from a streaming DuckDB result as rows are consumed
class DuckDBRowStream : public RowStream {
public:
    explicit DuckDBRowStream(duckdb::unique_ptr<duckdb::QueryResult> result_p);

    bool Next(QueryResultRow& row) override;
    const std::vector<std::string>& GetColumnNames() const override { return names; }

    uint64_t GetChunksFetched() const { return chunks_fetched; }

private:
    bool FetchChunk();

    duckdb::unique_ptr<duckdb::QueryResult> result;
    duckdb::unique_ptr<duckdb::DataChunk> chunk;
    std::vector<std::string> names;
    duckdb::idx_t chunk_row = 0;
    uint64_t position = 0;
    uint64_t chunks_fetched = 0;
    bool finished = false;
};

// Rows held in memory
class VectorRowStream : public RowStream {
public:
    VectorRowStream(std::vector<std::string> names_p, std::vector<std::vector<duckdb::Value>> rows_p);

    bool Next(QueryResultRow& row) override;
    const std::vector<std::string>& GetColumnNames() const override { return names; }

private:
    std::vector<std::string> names;
    std::vector<std::vector<duckdb::Value>> rows;
    size_t next = 0;
};

} // namespace duckes
