//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_client.cpp
//===----------------------------------------------------------------------===//

#include "http/http_client.hpp"
#include "logging/logger.hpp"
#include <asio.hpp>
#include <sstream>

namespace duckes {

HttpClient::HttpClient(std::string host, uint16_t port, std::chrono::milliseconds request_timeout)
    : host_(std::move(host))
    , port_(port)
    , request_timeout_(request_timeout) {
}

HttpResult HttpClient::Send(const std::string& method, const std::string& target,
                            const std::string& body, const std::string& content_type) const {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    asio::streambuf response_buf;

    std::ostringstream request;
    request << method << " " << target << " HTTP/1.1\r\n"
            << "Host: " << host_ << ":" << port_ << "\r\n"
            << "Accept: application/json\r\n"
            << "Connection: close\r\n";
    if (!body.empty() || method == "POST" || method == "PUT") {
        request << "Content-Type: " << content_type << "\r\n"
                << "Content-Length: " << body.size() << "\r\n";
    }
    request << "\r\n" << body;
    std::string request_data = request.str();

    asio::error_code result_ec;
    bool completed = false;

    asio::ip::tcp::resolver resolver(io);
    asio::error_code resolve_ec;
    auto endpoints = resolver.resolve(host_, std::to_string(port_), resolve_ec);
    if (resolve_ec) {
        throw HttpTransportError("Cannot resolve " + host_ + ": " + resolve_ec.message());
    }

    asio::async_connect(socket, endpoints,
        [&](std::error_code ec, const asio::ip::tcp::endpoint&) {
            if (ec) {
                result_ec = ec;
                completed = true;
                return;
            }
            asio::async_write(socket, asio::buffer(request_data),
                [&](std::error_code write_ec, size_t) {
                    if (write_ec) {
                        result_ec = write_ec;
                        completed = true;
                        return;
                    }
                    // Server closes the connection after the response
                    asio::async_read(socket, response_buf, asio::transfer_all(),
                        [&](std::error_code read_ec, size_t) {
                            if (read_ec && read_ec != asio::error::eof) {
                                result_ec = read_ec;
                            }
                            completed = true;
                        });
                });
        });

    io.run_for(request_timeout_);

    if (!completed) {
        asio::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
        throw HttpTransportError(method + " " + target + " timed out after " +
                                 std::to_string(request_timeout_.count()) + "ms", true);
    }
    if (result_ec) {
        throw HttpTransportError(method + " " + target + " failed: " + result_ec.message());
    }

    std::string raw(asio::buffers_begin(response_buf.data()), asio::buffers_end(response_buf.data()));
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw HttpTransportError(method + " " + target + ": truncated response");
    }

    std::string status_line;
    std::map<std::string, std::string> headers;
    if (!ParseHeaderBlock(raw.substr(0, header_end + 4), status_line, headers)) {
        throw HttpTransportError(method + " " + target + ": malformed response headers");
    }

    HttpResult result;
    std::istringstream iss(status_line);
    std::string version;
    iss >> version >> result.status;
    if (result.status < 100 || result.status > 599) {
        throw HttpTransportError(method + " " + target + ": malformed status line '" + status_line + "'");
    }

    result.body = raw.substr(header_end + 4);
    auto it = headers.find("content-length");
    if (it != headers.end()) {
        size_t expected = 0;
        try {
            expected = static_cast<size_t>(std::stoull(it->second));
        } catch (const std::exception&) {
            throw HttpTransportError(method + " " + target + ": invalid Content-Length");
        }
        if (result.body.size() < expected) {
            throw HttpTransportError(method + " " + target + ": connection closed before end of body");
        }
        result.body.resize(expected);
    }

    LOG_TRACE("http_client", method + " " + target + " -> " + std::to_string(result.status));
    return result;
}

} // namespace duckes
