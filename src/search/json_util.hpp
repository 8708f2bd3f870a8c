//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/json_util.hpp
//
// jsoncpp helpers
//===----------------------------------------------------------------------===//

#pragma once

#include <json/json.h>
#include <string>

namespace duckes {

// Single-line JSON, as required by NDJSON bulk bodies
std::string ToCompactJson(const Json::Value& value);

bool ParseJson(const std::string& text, Json::Value& out, std::string& error);

} // namespace duckes
