#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "escrow/escrow_engine.hpp"

// Periodically releases held escrows whose hold deadline has passed.
// The first sweep runs as soon as start() is called.
class AutoReleaseScheduler {
public:
    struct Options {
        std::chrono::milliseconds interval{std::chrono::seconds(60)};
    };

    explicit AutoReleaseScheduler(EscrowEngine& escrow)
        : AutoReleaseScheduler(escrow, Options{}) {}

    AutoReleaseScheduler(EscrowEngine& escrow, Options opts)
        : escrow_(escrow), opts_(opts), timer_(io_) {}

    ~AutoReleaseScheduler() { stop(); }

    AutoReleaseScheduler(const AutoReleaseScheduler&) = delete;
    AutoReleaseScheduler& operator=(const AutoReleaseScheduler&) = delete;

    // One sweep. Returns how many escrows were released; failures are logged and skipped.
    std::size_t tick();

    void start();
    // Cancels the timer and joins the worker. Safe to call more than once.
    void stop();

    bool running() const { return running_.load(std::memory_order_relaxed); }
    std::uint64_t total_released() const { return total_released_.load(std::memory_order_relaxed); }

private:
    void schedule(std::chrono::milliseconds delay);

    EscrowEngine& escrow_;
    Options opts_;
    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> total_released_{0};
};
