//===----------------------------------------------------------------------===//
//                     DuckES Query Runner - Unit Tests
//
// tests/unit/config/test_duration.cpp
//
// Unit tests for duration strings
//===----------------------------------------------------------------------===//

#include "config/duration.hpp"
#include <cassert>
#include <iostream>

using namespace duckes;
using namespace std::chrono;

void TestParseUnits() {
    std::cout << "  Testing ParseDuration units..." << std::endl;

    assert(*ParseDuration("15ns") == nanoseconds(15));
    assert(*ParseDuration("3us") == microseconds(3));
    assert(*ParseDuration("250ms") == milliseconds(250));
    assert(*ParseDuration("5s") == seconds(5));
    assert(*ParseDuration("1m") == minutes(1));
    assert(*ParseDuration("2h") == hours(2));
    assert(*ParseDuration("1d") == hours(24));

    std::cout << "    PASSED" << std::endl;
}

void TestParseFractionsAndSpaces() {
    std::cout << "  Testing fractions and whitespace..." << std::endl;

    assert(*ParseDuration("1.5s") == milliseconds(1500));
    assert(*ParseDuration("0.5m") == seconds(30));
    assert(*ParseDuration(" 2m ") == minutes(2));
    assert(*ParseDuration("10 s") == seconds(10));
    assert(*ParseDuration("0s") == nanoseconds(0));

    std::cout << "    PASSED" << std::endl;
}

void TestParseInvalid() {
    std::cout << "  Testing malformed durations..." << std::endl;

    assert(!ParseDuration(""));
    assert(!ParseDuration("   "));
    assert(!ParseDuration("10"));
    assert(!ParseDuration("s"));
    assert(!ParseDuration("-1s"));
    assert(!ParseDuration("1.2.3s"));
    assert(!ParseDuration("5 minutes"));
    assert(!ParseDuration("5S"));

    std::cout << "    PASSED" << std::endl;
}

void TestFormat() {
    std::cout << "  Testing FormatDuration..." << std::endl;

    assert(FormatDuration(milliseconds(1500)) == "1.50s");
    assert(FormatDuration(milliseconds(250)) == "250.00ms");
    assert(FormatDuration(minutes(1)) == "1.00m");
    assert(FormatDuration(seconds(90)) == "1.50m");
    assert(FormatDuration(nanoseconds(0)) == "0.00ns");
    assert(FormatDuration(hours(48)) == "2.00d");

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Duration Unit Tests ===" << std::endl;

    std::cout << "\n1. Parsing:" << std::endl;
    TestParseUnits();
    TestParseFractionsAndSpaces();
    TestParseInvalid();

    std::cout << "\n2. Formatting:" << std::endl;
    TestFormat();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
