//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_message.cpp
//===----------------------------------------------------------------------===//

#include "http/http_message.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace duckes {

const char* HttpStatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

std::string UrlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void ParseRequestTarget(const std::string& target, std::string& path,
                        std::map<std::string, std::string>& params) {
    auto qpos = target.find('?');
    path = UrlDecode(target.substr(0, qpos));
    if (qpos == std::string::npos) {
        return;
    }

    std::stringstream ss(target.substr(qpos + 1));
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[UrlDecode(pair)] = "";
        } else {
            params[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
        }
    }
}

bool ParseHeaderBlock(const std::string& block, std::string& start_line,
                      std::map<std::string, std::string>& headers) {
    std::istringstream iss(block);
    std::string line;

    if (!std::getline(iss, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) {
        return false;
    }
    start_line = line;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return false;
        }
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);

        size_t vstart = colon + 1;
        while (vstart < line.size() && line[vstart] == ' ') ++vstart;
        headers[name] = line.substr(vstart);
    }
    return true;
}

} // namespace duckes
