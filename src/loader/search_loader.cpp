//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// loader/search_loader.cpp
//===----------------------------------------------------------------------===//

#include "loader/search_loader.hpp"
#include "config/duration.hpp"
#include "http/http_client.hpp"
#include "loader/document_converter.hpp"
#include "logging/logger.hpp"
#include "session/session.hpp"

namespace duckes {

const char* SearchLoader::StateName(State state) {
    switch (state) {
        case State::IDLE:      return "idle";
        case State::QUERYING:  return "querying";
        case State::STREAMING: return "streaming";
        case State::RETRYING:  return "retrying";
        case State::DONE:      return "done";
        case State::FAILED:    return "failed";
    }
    return "unknown";
}

SearchLoader::SearchLoader(Session* session_p, BulkTransport& transport_p, const Options& options_p)
    : session(session_p)
    , transport(transport_p)
    , options(options_p) {
    if (options.batch_size == 0) {
        throw ConfigError("Batch size must be greater than 0");
    }
    std::string error;
    if (!options.retry.Validate(error)) {
        throw ConfigError(error);
    }
    if (options.pipeline) {
        executor = std::make_unique<ExecutorPool>(1);
        executor->Start();
    }
}

SearchLoader::~SearchLoader() {
    AbandonInFlight();
    if (executor) {
        executor->Stop();
    }
}

uint64_t SearchLoader::Load(const std::string& source_query, const std::string& target_index,
                            const std::string& table) {
    const std::string& name = table.empty() ? target_index : table;
    stats = Stats{};
    state = State::QUERYING;

    if (!session) {
        state = State::FAILED;
        throw LoadError(name, std::nullopt, std::nullopt, "No source session", true);
    }

    duckdb::unique_ptr<duckdb::QueryResult> result;
    try {
        result = session->Stream(source_query);
    } catch (const std::exception& e) {
        state = State::FAILED;
        LOG_ERROR("loader", "Query for " + name + " failed: " + std::string(e.what()));
        throw LoadError(name, std::nullopt, std::nullopt, e.what(), true);
    }

    DuckDBRowStream rows(std::move(result));
    uint64_t loaded = 0;
    try {
        loaded = LoadStream(rows, target_index, name);
    } catch (const LoadError&) {
        session->MarkQueryEnd();
        throw;
    }
    session->MarkQueryEnd();
    return loaded;
}

uint64_t SearchLoader::LoadStream(RowStream& rows, const std::string& target_index, const std::string& table) {
    const std::string& name = table.empty() ? target_index : table;
    if (state != State::QUERYING) {
        stats = Stats{};
    }
    state = State::STREAMING;

    BulkIndexBatch batch;
    QueryResultRow row;
    uint64_t next_batch_index = 0;

    try {
        while (true) {
            bool has_row;
            try {
                has_row = rows.Next(row);
            } catch (const std::exception& e) {
                throw LoadError(name, next_batch_index, std::nullopt, e.what(), true);
            }
            if (!has_row) {
                break;
            }
            stats.rows_observed++;

            try {
                batch.Add(RowToDocument(row), row.position);
            } catch (const UnconvertibleValueError& e) {
                throw LoadError(name, next_batch_index, row.position, e.what(), true);
            }

            if (batch.Size() >= options.batch_size) {
                batch.batch_index = next_batch_index++;
                Dispatch(std::move(batch), target_index, name);
                batch = BulkIndexBatch{};
            }
        }

        if (!batch.Empty()) {
            batch.batch_index = next_batch_index++;
            Dispatch(std::move(batch), target_index, name);
        }
        WaitInFlight();
    } catch (const LoadError& e) {
        AbandonInFlight();
        state = State::FAILED;
        LOG_ERROR("loader", e.what());
        throw;
    }

    state = State::DONE;
    DLOG_DEBUG("loader", "Loaded {} rows into {} in {} batches ({} retries)",
               stats.rows_loaded, target_index, stats.batches, stats.retries);
    return stats.rows_loaded;
}

// Submits the batch once the previous one is acknowledged
void SearchLoader::Dispatch(BulkIndexBatch batch, const std::string& index, const std::string& table) {
    WaitInFlight();
    if (!executor) {
        SubmitBatch(batch, index, table);
        return;
    }
    auto shared = std::make_shared<BulkIndexBatch>(std::move(batch));
    in_flight = executor->SubmitWithFuture([this, shared, index, table]() {
        SubmitBatch(*shared, index, table);
    });
}

void SearchLoader::WaitInFlight() {
    if (in_flight.valid()) {
        auto pending = std::move(in_flight);
        pending.get();  // rethrows the batch's LoadError
    }
}

// Used on the failure path: the primary error wins
void SearchLoader::AbandonInFlight() {
    if (!in_flight.valid()) {
        return;
    }
    auto pending = std::move(in_flight);
    try {
        pending.get();
    } catch (const std::exception& e) {
        LOG_WARN("loader", "In-flight batch also failed: " + std::string(e.what()));
    }
}

void SearchLoader::SubmitBatch(const BulkIndexBatch& batch, const std::string& index, const std::string& table) {
    const RetryPolicy& policy = options.retry;
    const auto start = Clock::now();

    // Positions within batch.documents still waiting for acknowledgment
    std::vector<size_t> pending(batch.Size());
    for (size_t i = 0; i < pending.size(); i++) {
        pending[i] = i;
    }

    std::string last_cause;
    uint32_t attempt = 0;
    while (true) {
        attempt++;
        if (attempt > 1) {
            auto backoff = policy.BackoffBefore(attempt);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            if (elapsed + backoff > policy.max_retry_time) {
                throw LoadError(table, batch.batch_index, std::nullopt,
                                "retry time " + FormatDuration(policy.max_retry_time) + " exhausted after " +
                                std::to_string(attempt - 1) + " attempts: " + last_cause, false);
            }
            state = State::RETRYING;
            stats.retries++;
            stats.resubmitted_documents += pending.size();
            LOG_WARN("loader", "Retrying batch " + std::to_string(batch.batch_index) + " of " + table +
                     " (" + std::to_string(pending.size()) + " documents, attempt " +
                     std::to_string(attempt) + "): " + last_cause);
            std::this_thread::sleep_for(backoff);
        }

        std::vector<Json::Value> documents;
        documents.reserve(pending.size());
        for (size_t position : pending) {
            documents.push_back(batch.documents[position]);
        }

        BulkResponse response;
        bool transient_failure = false;
        stats.bulk_requests++;
        try {
            response = transport.Bulk(index, documents);
        } catch (const HttpTransportError& e) {
            last_cause = e.what();
            transient_failure = true;
        } catch (const std::exception& e) {
            throw LoadError(table, batch.batch_index, std::nullopt, e.what(), true);
        }

        if (!transient_failure) {
            if (response.status != 200) {
                last_cause = "HTTP " + std::to_string(response.status) +
                             (response.error.empty() ? "" : ": " + response.error);
                if (!IsTransientStatus(response.status)) {
                    throw LoadError(table, batch.batch_index, std::nullopt, last_cause, true);
                }
            } else {
                std::vector<size_t> retry_pending;
                for (const auto& failure : response.failures) {
                    if (failure.item_index >= pending.size()) {
                        throw LoadError(table, batch.batch_index, std::nullopt,
                                        "bulk response names unknown item " + std::to_string(failure.item_index),
                                        true);
                    }
                    size_t position = pending[failure.item_index];
                    std::string cause = failure.type + " (" + std::to_string(failure.status) + "): " + failure.reason;
                    if (!IsTransientStatus(failure.status)) {
                        throw LoadError(table, batch.batch_index, batch.row_positions[position], cause, true);
                    }
                    last_cause = cause;
                    retry_pending.push_back(position);
                }
                if (retry_pending.empty()) {
                    break;
                }
                pending = std::move(retry_pending);
            }
        }

        if (attempt >= policy.max_attempts) {
            throw LoadError(table, batch.batch_index, std::nullopt,
                            "gave up after " + std::to_string(attempt) + " attempts: " + last_cause, false);
        }
    }

    stats.batches++;
    stats.rows_loaded += batch.Size();
    stats.batch_sizes.push_back(batch.Size());
    if (state == State::RETRYING) {
        state = State::STREAMING;
    }
}

} // namespace duckes
