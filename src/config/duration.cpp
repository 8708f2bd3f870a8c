//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// config/duration.cpp
//===----------------------------------------------------------------------===//

#include "config/duration.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace duckes {

namespace {

struct UnitInfo {
    const char* suffix;
    double nanos;
};

constexpr UnitInfo PARSE_UNITS[] = {
    {"ns", 1.0},
    {"us", 1e3},
    {"ms", 1e6},
    {"s", 1e9},
    {"m", 60e9},
    {"h", 3600e9},
    {"d", 86400e9},
};

constexpr UnitInfo FORMAT_UNITS[] = {
    {"d", 86400e9},
    {"h", 3600e9},
    {"m", 60e9},
    {"s", 1e9},
    {"ms", 1e6},
    {"us", 1e3},
    {"ns", 1.0},
};

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

std::optional<Nanos> ParseDuration(const std::string& text) {
    std::string value = Trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    size_t unit_pos = 0;
    while (unit_pos < value.size() &&
           (std::isdigit(static_cast<unsigned char>(value[unit_pos])) || value[unit_pos] == '.')) {
        ++unit_pos;
    }
    if (unit_pos == 0 || unit_pos == value.size()) {
        return std::nullopt;
    }

    std::string number = value.substr(0, unit_pos);
    std::string unit = Trim(value.substr(unit_pos));

    char* end = nullptr;
    double magnitude = std::strtod(number.c_str(), &end);
    if (end == number.c_str() || *end != '\0' || !std::isfinite(magnitude) || magnitude < 0) {
        return std::nullopt;
    }

    for (const auto& u : PARSE_UNITS) {
        if (unit == u.suffix) {
            return Nanos(static_cast<Nanos::rep>(std::llround(magnitude * u.nanos)));
        }
    }
    return std::nullopt;
}

std::string FormatDuration(Nanos duration) {
    double nanos = static_cast<double>(duration.count());
    for (const auto& u : FORMAT_UNITS) {
        if (std::fabs(nanos) >= u.nanos || u.nanos == 1.0) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.2f%s", nanos / u.nanos, u.suffix);
            return buf;
        }
    }
    return "0.00ns";
}

} // namespace duckes
