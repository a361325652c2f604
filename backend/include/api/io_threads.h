#pragma once

#include <asio.hpp>
#include <cstddef>
#include <thread>
#include <vector>

/**
 * Extra threads running one io_context next to the caller's own run().
 *
 * The destructor stops the context and joins every worker, so an exception
 * out of the caller's run() never leaves a joinable std::thread behind.
 */
class IoThreads {
public:
    explicit IoThreads(asio::io_context& io);
    ~IoThreads();

    IoThreads(const IoThreads&) = delete;
    IoThreads& operator=(const IoThreads&) = delete;

    /// A worker whose run() throws logs the error and stops the context.
    void spawn(std::size_t count);

    [[nodiscard]] std::size_t size() const { return workers_.size(); }

private:
    asio::io_context& io_;
    std::vector<std::thread> workers_;
};
