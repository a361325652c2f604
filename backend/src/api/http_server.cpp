/**
 * HttpServer — asio acceptor for the phonebook API.
 *
 * Each accepted socket becomes an HttpSession that reads the request head up
 * to the blank line, then exactly Content-Length body bytes, hands the
 * request to the Router and writes the response before closing.
 */

#include "api/http_server.h"

#include <algorithm>
#include <charconv>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "api/http_message.h"

namespace {

constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

} // namespace

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(asio::ip::tcp::socket socket, const Router& router, std::size_t max_body_bytes)
        : socket_(std::move(socket)), router_(router), max_body_bytes_(max_body_bytes) {}

    void start() {
        read_head();
    }

    /// Aborts whatever the session is waiting on; its handlers see
    /// operation_aborted and drop their references.
    void close() {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self] {
            asio::error_code ec;
            socket_.close(ec);
            if (ec) {
                spdlog::debug("HttpSession: close failed: {}", ec.message());
            }
        });
    }

private:
    void read_head() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, asio::dynamic_buffer(buffer_, kMaxHeaderBytes), "\r\n\r\n",
                               [this, self](const asio::error_code& ec, std::size_t head_size) {
                                   on_head(ec, head_size);
                               });
    }

    void on_head(const asio::error_code& ec, std::size_t head_size) {
        if (ec == asio::error::not_found) {
            write_response(HttpResponse::json(431, {{"error", "request header fields too large"}}));
            return;
        }
        if (ec) {
            if (ec != asio::error::eof) {
                spdlog::debug("HttpSession: read failed: {}", ec.message());
            }
            return;
        }

        auto parsed = parse_request_head(std::string_view(buffer_).substr(0, head_size));
        if (!parsed) {
            write_response(HttpResponse::json(400, {{"error", "bad request"}}));
            return;
        }
        request_ = std::move(*parsed);
        buffer_.erase(0, head_size);

        if (request_.has_header("Transfer-Encoding")) {
            write_response(HttpResponse::json(411, {{"error", "content-length required"}}));
            return;
        }

        std::size_t length = 0;
        if (request_.has_header("Content-Length")) {
            auto value = request_.header("Content-Length");
            auto [ptr, parse_ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (parse_ec != std::errc{} || ptr != value.data() + value.size()) {
                write_response(HttpResponse::json(400, {{"error", "invalid content-length"}}));
                return;
            }
        }
        if (length > max_body_bytes_) {
            spdlog::warn("Rejecting {} {}: body of {} bytes exceeds limit", request_.method, request_.path, length);
            write_response(HttpResponse::json(413, {{"error", "request entity too large"}}));
            return;
        }

        if (buffer_.size() >= length) {
            on_body(length);
            return;
        }

        auto self = shared_from_this();
        asio::async_read(socket_, asio::dynamic_buffer(buffer_), asio::transfer_exactly(length - buffer_.size()),
                         [this, self, length](const asio::error_code& read_ec, std::size_t) {
                             if (read_ec) {
                                 spdlog::debug("HttpSession: body read failed: {}", read_ec.message());
                                 return;
                             }
                             on_body(length);
                         });
    }

    void on_body(std::size_t length) {
        request_.body = buffer_.substr(0, length);
        std::string method = request_.method;
        std::string target = request_.target;
        HttpResponse resp = router_.dispatch(std::move(request_));
        spdlog::debug("{} {} -> {}", method, target, resp.status);
        write_response(resp);
    }

    void write_response(const HttpResponse& resp) {
        response_ = serialize_response(resp);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(response_), [this, self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                spdlog::debug("HttpSession: write failed: {}", ec.message());
                return;
            }
            asio::error_code shutdown_ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_send, shutdown_ec);
            if (shutdown_ec) {
                spdlog::debug("HttpSession: shutdown failed: {}", shutdown_ec.message());
            }
        });
    }

    asio::ip::tcp::socket socket_;
    const Router& router_;
    std::size_t max_body_bytes_;
    std::string buffer_;
    std::string response_;
    HttpRequest request_;
};

HttpServer::HttpServer(asio::io_context& io,
                       const std::string& address,
                       uint16_t port,
                       const Router& router,
                       std::size_t max_body_bytes)
    : io_(io), acceptor_(asio::make_strand(io)), router_(router), max_body_bytes_(max_body_bytes) {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

void HttpServer::start() {
    spdlog::info("HttpServer listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port());
    asio::post(acceptor_.get_executor(), [this] { do_accept(); });
}

void HttpServer::stop() {
    asio::post(acceptor_.get_executor(), [this] {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("HttpServer: close failed: {}", ec.message());
        }
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                session->close();
            }
        }
        sessions_.clear();
    });
}

uint16_t HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_), [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (!acceptor_.is_open()) {
            return;
        }
        if (ec) {
            spdlog::error("HttpServer: accept failed: {}", ec.message());
        } else {
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const std::weak_ptr<HttpSession>& weak) { return weak.expired(); }),
                            sessions_.end());
            auto session = std::make_shared<HttpSession>(std::move(socket), router_, max_body_bytes_);
            sessions_.push_back(session);
            session->start();
        }
        do_accept();
    });
}
