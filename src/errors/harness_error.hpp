//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// errors/harness_error.hpp
//
// Exception taxonomy of the query runner
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace duckes {

class HarnessError : public std::runtime_error {
public:
    explicit HarnessError(const std::string& message) : std::runtime_error(message) {}
};

// Fatal: aborts the runner and tears down everything acquired so far
class BootstrapError : public HarnessError {
public:
    explicit BootstrapError(const std::string& message) : HarnessError(message) {}
};

// Fatal: malformed or unresolvable configuration / table descriptions
class ConfigError : public HarnessError {
public:
    explicit ConfigError(const std::string& message) : HarnessError(message) {}
};

// Fatal to one table's load
class LoadError : public HarnessError {
public:
    LoadError(std::string table_p,
              std::optional<uint64_t> batch_index_p,
              std::optional<uint64_t> row_position_p,
              std::string cause_p,
              bool structural_p);

    const std::string& GetTable() const { return table; }
    std::optional<uint64_t> GetBatchIndex() const { return batch_index; }
    std::optional<uint64_t> GetRowPosition() const { return row_position; }
    const std::string& GetCause() const { return cause; }

    // Structural failures (bad query, bad document) are never retried
    bool IsStructural() const { return structural; }

private:
    static std::string FormatMessage(const std::string& table,
                                     const std::optional<uint64_t>& batch_index,
                                     const std::optional<uint64_t>& row_position,
                                     const std::string& cause);

    std::string table;
    std::optional<uint64_t> batch_index;
    std::optional<uint64_t> row_position;
    std::string cause;
    bool structural;
};

} // namespace duckes
