//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_client.hpp
//
// Blocking HTTP/1.1 client on top of asio with a per-request timeout
//===----------------------------------------------------------------------===//

#pragma once

#include "http/http_message.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace duckes {

// Connection refused, reset, timed out or an unparsable response.
// Always considered transient by callers.
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& message, bool timed_out_p = false)
        : std::runtime_error(message), timed_out(timed_out_p) {}

    bool IsTimeout() const { return timed_out; }

private:
    bool timed_out;
};

struct HttpResult {
    int status = 0;
    std::string body;
};

class HttpClient {
public:
    HttpClient(std::string host, uint16_t port, std::chrono::milliseconds request_timeout);

    // Throws HttpTransportError, never returns status 0
    HttpResult Send(const std::string& method, const std::string& target,
                    const std::string& body = "",
                    const std::string& content_type = "application/json") const;

    HttpResult Get(const std::string& target) const { return Send("GET", target); }
    HttpResult Post(const std::string& target, const std::string& body,
                    const std::string& content_type = "application/json") const {
        return Send("POST", target, body, content_type);
    }

    const std::string& GetHost() const { return host_; }
    uint16_t GetPort() const { return port_; }
    std::chrono::milliseconds GetRequestTimeout() const { return request_timeout_; }

private:
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace duckes
