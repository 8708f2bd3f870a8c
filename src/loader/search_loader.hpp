//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/search_loader.hpp
//
// Streams a query result into a search index through bulk requests.
//
//   Idle -> Querying -> Streaming -> (Retrying)* -> Done | Failed
//
// Rows become documents (see document_converter.hpp) and are grouped into
// batches of batch_size. Each batch is retried under the RetryPolicy: a
// transport failure, HTTP 429 or 5xx resubmits only the documents that did
// not make it, any other 4xx fails the load at once. Batches already
// acknowledged stay indexed when a later batch fails.
//
// With pipelining, the next batch is read while the previous one is being
// submitted; at most one batch is in flight and batches are submitted in
// result order.
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "errors/harness_error.hpp"
#include "executor/executor_pool.hpp"
#include "loader/retry_policy.hpp"
#include "loader/row_stream.hpp"
#include "search/bulk_transport.hpp"
#include <future>

namespace duckes {

struct BulkIndexBatch {
    uint64_t batch_index = 0;
    std::vector<Json::Value> documents;
    // Source row position of each document
    std::vector<uint64_t> row_positions;

    void Add(Json::Value document, uint64_t row_position) {
        documents.push_back(std::move(document));
        row_positions.push_back(row_position);
    }
    size_t Size() const { return documents.size(); }
    bool Empty() const { return documents.empty(); }
};

class SearchLoader {
public:
    enum class State {
        IDLE,
        QUERYING,
        STREAMING,
        RETRYING,
        DONE,
        FAILED
    };

    struct Options {
        size_t batch_size = DEFAULT_BATCH_SIZE;
        RetryPolicy retry;
        bool pipeline = true;
    };

    struct Stats {
        uint64_t rows_observed = 0;
        uint64_t rows_loaded = 0;
        uint64_t batches = 0;
        uint64_t bulk_requests = 0;
        uint64_t retries = 0;
        uint64_t resubmitted_documents = 0;
        std::vector<size_t> batch_sizes;
    };

    // The session must be bound to the source catalog
    SearchLoader(Session* session_p, BulkTransport& transport_p, const Options& options_p);
    ~SearchLoader();

    SearchLoader(const SearchLoader&) = delete;
    SearchLoader& operator=(const SearchLoader&) = delete;

    // Runs source_query and indexes its rows into target_index. `table` names
    // the load in errors and logs (defaults to the index). Returns the number
    // of rows loaded. Throws LoadError.
    uint64_t Load(const std::string& source_query, const std::string& target_index,
                  const std::string& table = "");

    // Indexes rows already being produced by a stream. Throws LoadError.
    uint64_t LoadStream(RowStream& rows, const std::string& target_index, const std::string& table = "");

    // Statistics of the last load
    const Stats& GetStats() const { return stats; }
    State GetState() const { return state; }
    const Options& GetOptions() const { return options; }

    static const char* StateName(State state);

private:
    void SubmitBatch(const BulkIndexBatch& batch, const std::string& index, const std::string& table);
    void Dispatch(BulkIndexBatch batch, const std::string& index, const std::string& table);
    void WaitInFlight();
    void AbandonInFlight();

    Session* session;
    BulkTransport& transport;
    Options options;
    Stats stats;
    std::atomic<State> state{State::IDLE};

    std::unique_ptr<ExecutorPool> executor;
    std::future<void> in_flight;
};

} // namespace duckes
