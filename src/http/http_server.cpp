//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// http/http_server.cpp
//===----------------------------------------------------------------------===//

#include "http/http_server.hpp"
#include "logging/logger.hpp"
#include <sstream>

namespace duckes {

namespace {

constexpr size_t MAX_BODY_SIZE = 256 * 1024 * 1024;

} // namespace

struct HttpServer::Connection {
    explicit Connection(asio::ip::tcp::socket socket_p) : socket(std::move(socket_p)) {}

    asio::ip::tcp::socket socket;
    asio::streambuf buffer;
    HttpRequest request;
    std::string response;
};

HttpServer::HttpServer(std::string host, uint16_t port, std::string name, Handler handler)
    : host_(std::move(host))
    , port_(port)
    , name_(std::move(name))
    , handler_(std::move(handler))
    , acceptor_(io_context_) {
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) return;

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    try {
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::system_error&) {
        asio::error_code ec;
        acceptor_.close(ec);
        throw;
    }
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    DoAccept();

    thread_ = std::thread([this]() {
        io_context_.run();
    });

    LOG_INFO(name_, "HTTP server started on " + GetBaseUrl());
}

void HttpServer::Stop() {
    if (!running_) return;
    running_ = false;

    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    asio::error_code ec;
    acceptor_.close(ec);

    LOG_INFO(name_, "HTTP server stopped");
}

std::string HttpServer::GetBaseUrl() const {
    return "http://" + host_ + ":" + std::to_string(bound_port_);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto conn = std::make_shared<Connection>(std::move(socket));

    asio::async_read_until(conn->socket, conn->buffer, "\r\n\r\n",
        [this, conn](std::error_code ec, size_t header_bytes) {
            if (ec) return;

            std::string head(asio::buffers_begin(conn->buffer.data()),
                             asio::buffers_begin(conn->buffer.data()) + header_bytes);
            conn->buffer.consume(header_bytes);

            std::string request_line;
            if (!ParseHeaderBlock(head, request_line, conn->request.headers)) {
                WriteResponse(conn, {400, "text/plain", "Malformed request"});
                return;
            }

            std::istringstream iss(request_line);
            std::string target, version;
            iss >> conn->request.method >> target >> version;
            ParseRequestTarget(target, conn->request.path, conn->request.params);

            size_t content_length = 0;
            auto it = conn->request.headers.find("content-length");
            if (it != conn->request.headers.end()) {
                try {
                    content_length = static_cast<size_t>(std::stoull(it->second));
                } catch (const std::exception&) {
                    WriteResponse(conn, {400, "text/plain", "Invalid Content-Length"});
                    return;
                }
            }
            if (content_length > MAX_BODY_SIZE) {
                WriteResponse(conn, {413, "text/plain", "Payload Too Large"});
                return;
            }
            ReadBody(conn, content_length);
        });
}

void HttpServer::ReadBody(std::shared_ptr<Connection> conn, size_t content_length) {
    if (conn->buffer.size() >= content_length) {
        conn->request.body.assign(asio::buffers_begin(conn->buffer.data()),
                                  asio::buffers_begin(conn->buffer.data()) + content_length);
        conn->buffer.consume(content_length);
        Dispatch(conn);
        return;
    }

    size_t remaining = content_length - conn->buffer.size();
    asio::async_read(conn->socket, conn->buffer, asio::transfer_exactly(remaining),
        [this, conn, content_length](std::error_code ec, size_t /*bytes_read*/) {
            if (ec) return;
            ReadBody(conn, content_length);
        });
}

void HttpServer::Dispatch(std::shared_ptr<Connection> conn) {
    request_count_++;

    HttpResponse response;
    try {
        response = handler_(conn->request);
    } catch (const std::exception& e) {
        LOG_ERROR(name_, "Handler failed for " + conn->request.method + " " +
                  conn->request.path + ": " + e.what());
        response = {500, "text/plain", e.what()};
    }
    WriteResponse(conn, response);
}

void HttpServer::WriteResponse(std::shared_ptr<Connection> conn, const HttpResponse& response) {
    conn->response = BuildResponse(response);
    asio::async_write(conn->socket, asio::buffer(conn->response),
        [conn](std::error_code /*ec*/, size_t /*bytes_written*/) {
            asio::error_code shutdown_ec;
            conn->socket.shutdown(asio::ip::tcp::socket::shutdown_both, shutdown_ec);
            conn->socket.close(shutdown_ec);
        });
}

std::string HttpServer::BuildResponse(const HttpResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << HttpStatusText(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return oss.str();
}

} // namespace duckes
