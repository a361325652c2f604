/**
 * IoThreads — worker pool over a shared io_context.
 */

#include "api/io_threads.h"

#include <exception>

#include <spdlog/spdlog.h>

IoThreads::IoThreads(asio::io_context& io) : io_(io) {}

IoThreads::~IoThreads() {
    io_.stop();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void IoThreads::spawn(std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] {
            try {
                io_.run();
            } catch (const std::exception& ex) {
                spdlog::error("IoThreads: worker failed: {}", ex.what());
                io_.stop();
            }
        });
    }
}
