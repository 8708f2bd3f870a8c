//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_server.hpp
//
// Small single-threaded HTTP/1.1 server used by the embedded search node
// and the coordinator endpoint
//===----------------------------------------------------------------------===//

#pragma once

#include "http/http_message.hpp"
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace duckes {

class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // port 0 binds an ephemeral port, see GetPort()
    HttpServer(std::string host, uint16_t port, std::string name, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the IO thread. Throws std::system_error if the address cannot be bound.
    void Start();
    void Stop();

    bool IsRunning() const { return running_; }
    uint16_t GetPort() const { return bound_port_; }
    const std::string& GetHost() const { return host_; }
    std::string GetBaseUrl() const;

    uint64_t GetRequestCount() const { return request_count_; }

private:
    struct Connection;

    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);
    void ReadBody(std::shared_ptr<Connection> conn, size_t content_length);
    void Dispatch(std::shared_ptr<Connection> conn);
    void WriteResponse(std::shared_ptr<Connection> conn, const HttpResponse& response);
    static std::string BuildResponse(const HttpResponse& response);

private:
    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;
    std::string name_;
    Handler handler_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> request_count_{0};
};

} // namespace duckes
