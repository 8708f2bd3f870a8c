//===----------------------------------------------------------------------===//
//                     DuckES Query Runner - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger output as the runner and loader produce it
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include "loader/search_loader.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <vector>

using namespace duckes;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static const char* LOG_PATH = "/tmp/duckes_test_logger.log";

static std::vector<std::string> ReadLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

static std::string FindLine(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) {
            return line;
        }
    }
    return "";
}

// "[time] [level] [thread] message" -> field 0, 1 or 2
static std::string PatternField(const std::string& line, size_t field) {
    size_t start = 0;
    for (size_t i = 0; i < field; i++) {
        start = line.find("] [", start);
        if (start == std::string::npos) {
            return "";
        }
        start += 2;
    }
    size_t close = line.find(']', start);
    if (line.empty() || line[start] != '[' || close == std::string::npos) {
        return "";
    }
    return line.substr(start + 1, close - start - 1);
}

static bool IsNumber(const std::string& text) {
    return !text.empty() && text.find_first_not_of("0123456789") == std::string::npos;
}

static void StartFileLog(const std::string& level) {
    Logger::Shutdown();
    std::filesystem::remove(LOG_PATH);
    Logger::Initialize(LOG_PATH, level);
}

// First bulk request is refused with 503, the rest are acknowledged
class BusyOnceTransport : public BulkTransport {
public:
    BulkResponse Bulk(const std::string&, const std::vector<Json::Value>&) override {
        BulkResponse response;
        if (calls++ == 0) {
            response.status = 503;
            response.error = "{\"error\":\"node busy\"}";
        }
        return response;
    }

    int calls = 0;
};

//===----------------------------------------------------------------------===//
// Lifecycle Tests
//===----------------------------------------------------------------------===//

void TestInitializedState() {
    std::cout << "  Testing initialized state follows Get and Shutdown..." << std::endl;

    assert(!Logger::IsInitialized());
    assert(Logger::GetLogFile().empty());

    // First use sets up a console-only logger
    Logger::Get();
    assert(Logger::IsInitialized());
    assert(Logger::GetLogFile().empty());
    assert(Logger::Get()->name() == "duckes");
    assert(Logger::Get()->level() == spdlog::level::info);

    Logger::Shutdown();
    assert(!Logger::IsInitialized());

    Logger::Initialize(LOG_PATH, "warn");
    assert(Logger::GetLogFile() == LOG_PATH);
    Logger::Shutdown();
    assert(Logger::GetLogFile().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestRotatingFileSink() {
    std::cout << "  Testing rotating file sink limits..." << std::endl;

    static_assert(Logger::MAX_FILE_SIZE == 50 * 1024 * 1024, "log file rotates at 50MB");
    static_assert(Logger::MAX_FILES == 3, "three rotated log files are kept");

    StartFileLog("info");
    auto& sinks = Logger::Get()->sinks();
    assert(sinks.size() == 2);
    auto rotating = std::dynamic_pointer_cast<spdlog::sinks::rotating_file_sink_mt>(sinks[1]);
    assert(rotating);
    assert(rotating->filename() == LOG_PATH);
    Logger::Shutdown();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Level Tests
//===----------------------------------------------------------------------===//

void TestOffLevel() {
    std::cout << "  Testing off level silences every component..." << std::endl;

    assert(Logger::ToSpdlogLevel("off") == spdlog::level::off);
    assert(Logger::ToSpdlogLevel("OFF") == spdlog::level::off);

    StartFileLog("off");
    LOG_FATAL("runner", "Bootstrap failed");
    DLOG_ERROR("loader", "Gave up on batch {} of {}", 3, "lineitem");
    Logger::Flush();

    // Back on: only what is logged from here reaches the file
    Logger::SetLevel("warn");
    LOG_WARN("runner", "Retrying after 503");
    Logger::Shutdown();

    auto lines = ReadLines(LOG_PATH);
    assert(lines.size() == 1);
    assert(lines[0].find("[runner] Retrying after 503") != std::string::npos);

    std::filesystem::remove(LOG_PATH);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File Pattern Tests
//===----------------------------------------------------------------------===//

void TestFilePattern() {
    std::cout << "  Testing file line carries level, thread and component..." << std::endl;

    StartFileLog("info");
    LOG_INFO("runner", "Running import for nation");
    DLOG_INFO("runner", "Imported {} rows of {}", 25, "nation");
    Logger::Shutdown();

    auto lines = ReadLines(LOG_PATH);
    assert(lines.size() == 2);

    auto line = FindLine(lines, "[runner] Imported 25 rows of nation");
    assert(!line.empty());
    // No color codes in the file
    assert(line.find("\033[") == std::string::npos);
    assert(PatternField(line, 1) == "info");
    assert(IsNumber(PatternField(line, 2)));
    // Both lines came from this thread
    assert(PatternField(lines[0], 2) == PatternField(lines[1], 2));

    std::filesystem::remove(LOG_PATH);

    std::cout << "    PASSED" << std::endl;
}

void TestLoaderThreadsInFile() {
    std::cout << "  Testing pipelined loader logs from its worker thread..." << std::endl;

    StartFileLog("debug");
    {
        BusyOnceTransport transport;
        SearchLoader::Options options;
        options.batch_size = 10;
        options.pipeline = true;
        options.retry.max_attempts = 3;
        options.retry.initial_backoff = std::chrono::milliseconds(1);
        options.retry.max_backoff = std::chrono::milliseconds(1);
        SearchLoader loader(nullptr, transport, options);

        std::vector<std::vector<duckdb::Value>> data;
        data.push_back({duckdb::Value::BIGINT(0)});
        data.push_back({duckdb::Value::BIGINT(1)});
        VectorRowStream rows({"n_nationkey"}, std::move(data));
        assert(loader.LoadStream(rows, "nation") == 2);
    }
    Logger::Shutdown();

    auto lines = ReadLines(LOG_PATH);

    // Logged by the submitting worker
    auto retry = FindLine(lines, "[loader] Retrying batch 0 of nation");
    assert(!retry.empty());
    assert(PatternField(retry, 1) == "warning");
    assert(retry.find("HTTP 503: {\"error\":\"node busy\"}") != std::string::npos);

    // Logged by the caller once the stream is drained
    auto done = FindLine(lines, "[loader] Loaded 2 rows into nation in 1 batches (1 retries)");
    assert(!done.empty());
    assert(PatternField(done, 1) == "debug");

    assert(IsNumber(PatternField(retry, 2)));
    assert(IsNumber(PatternField(done, 2)));
    assert(PatternField(retry, 2) != PatternField(done, 2));

    std::filesystem::remove(LOG_PATH);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Lifecycle:" << std::endl;
    TestInitializedState();
    TestRotatingFileSink();

    std::cout << "\n2. Levels:" << std::endl;
    TestOffLevel();

    std::cout << "\n3. File Pattern:" << std::endl;
    TestFilePattern();
    TestLoaderThreadsInFile();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
