#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "api/router.h"

class HttpSession;

/**
 * Minimal HTTP/1.1 server. One request per connection (Connection: close).
 *
 * The acceptor is bound in the constructor, so a port clash surfaces as an
 * asio::system_error before anything runs. Port 0 picks an ephemeral port;
 * port() reports the one actually bound.
 *
 * Safe to run the io_context on several threads: the acceptor and each
 * connection get their own strand.
 */
class HttpServer {
public:
    HttpServer(asio::io_context& io,
               const std::string& address,
               uint16_t port,
               const Router& router,
               std::size_t max_body_bytes);

    void start();

    /// Closes the acceptor and every open connection, idle or not. Once their
    /// handlers drain, io_context::run() returns. Safe to call more than once.
    void stop();

    [[nodiscard]] uint16_t port() const;

private:
    void do_accept();

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    const Router& router_;
    std::size_t max_body_bytes_;
    // Only touched on the acceptor strand.
    std::vector<std::weak_ptr<HttpSession>> sessions_;
};
