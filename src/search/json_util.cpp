//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/json_util.cpp
//===----------------------------------------------------------------------===//

#include "search/json_util.hpp"
#include <memory>

namespace duckes {

std::string ToCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value& out, std::string& error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &out, &error);
}

} // namespace duckes
