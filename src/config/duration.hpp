//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// config/duration.hpp
//
// Duration strings used by configuration ("500ms", "5s", "1m", "2h")
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace duckes {

using Nanos = std::chrono::nanoseconds;

// Parse "<number><unit>" with unit one of ns, us, ms, s, m, h, d.
// Fractional values are accepted ("1.5s"). Returns nullopt on malformed input.
std::optional<Nanos> ParseDuration(const std::string& text);

// Format using the most succinct unit, two decimals ("1.50s", "250.00ms")
std::string FormatDuration(Nanos duration);

template<typename Rep, typename Period>
std::string FormatDuration(std::chrono::duration<Rep, Period> duration) {
    return FormatDuration(std::chrono::duration_cast<Nanos>(duration));
}

} // namespace duckes
