//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// common.hpp
//
// Common definitions and includes for the query runner
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <unordered_map>

// DuckDB includes
#include "duckdb.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/main/query_result.hpp"

namespace duckes {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class Session;
class QueryNode;
class QueryCluster;
class ExecutorPool;
class CatalogRegistry;
class SearchClient;
class EmbeddedSearchNode;
struct RunnerConfig;

// Shared pointer types
using SessionPtr = std::shared_ptr<Session>;

// Catalog names
constexpr const char* TPCH_CATALOG = "tpch";
constexpr const char* TPCH_TINY_SCHEMA = "tiny";
constexpr const char* SEARCH_CATALOG = "search";
constexpr const char* SEARCH_SCHEMA = "tpch";

// Constants
constexpr uint32_t DEFAULT_NODE_COUNT = 2;
constexpr size_t DEFAULT_BATCH_SIZE = 1000;
constexpr size_t DEFAULT_MAX_SESSIONS = 64;

} // namespace duckes
