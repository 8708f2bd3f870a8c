//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_message.hpp
//
// Minimal HTTP/1.1 request/response types shared by client and server
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <string>

namespace duckes {

struct HttpRequest {
    std::string method;
    std::string path;                           // without query string
    std::map<std::string, std::string> params;  // decoded query parameters
    std::map<std::string, std::string> headers; // lower-cased names
    std::string body;

    std::string GetParam(const std::string& name, const std::string& default_val = "") const {
        auto it = params.find(name);
        return it == params.end() ? default_val : it->second;
    }
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

const char* HttpStatusText(int status);

// Split "/a/b?x=1&y=2" into path and decoded parameters
void ParseRequestTarget(const std::string& target, std::string& path,
                        std::map<std::string, std::string>& params);

std::string UrlDecode(const std::string& value);

// Parse the header block of a request or response (up to and including the blank line).
// The first line is returned in start_line. Returns false on malformed input.
bool ParseHeaderBlock(const std::string& block, std::string& start_line,
                      std::map<std::string, std::string>& headers);

} // namespace duckes
