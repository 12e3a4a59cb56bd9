#include "scheduler/auto_release_scheduler.hpp"

#include <iostream>

#include <boost/asio/post.hpp>

namespace net = boost::asio;

std::size_t AutoReleaseScheduler::tick() {
    auto due = escrow_.due_for_release();
    if (is_error(due)) {
        std::cerr << "[scheduler] could not list due escrows: " << describe(error_of(due)) << std::endl;
        return 0;
    }

    std::size_t released = 0;
    for (const auto& e : std::get<std::vector<Escrow>>(due)) {
        auto r = escrow_.release(e.id);
        if (is_error(r)) {
            std::cerr << "[scheduler] failed to release " << e.id << ": "
                      << describe(error_of(r)) << std::endl;
            continue;
        }
        ++released;
    }
    if (released > 0) {
        total_released_.fetch_add(released, std::memory_order_relaxed);
        std::cout << "[scheduler] auto-released " << released << " escrow(s)" << std::endl;
    }
    return released;
}

void AutoReleaseScheduler::schedule(std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_.load(std::memory_order_relaxed)) {
            return;
        }
        tick();
        schedule(opts_.interval);
    });
}

void AutoReleaseScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    io_.restart();
    schedule(std::chrono::milliseconds(0));
    worker_ = std::thread([this] { io_.run(); });
    std::cout << "[scheduler] started, interval=" << opts_.interval.count() << "ms" << std::endl;
}

void AutoReleaseScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Cancel on the io thread; the aborted wait does not re-arm, so run() returns.
    net::post(io_, [this] { timer_.cancel(); });
    if (worker_.joinable()) {
        worker_.join();
    }
    std::cout << "[scheduler] stopped" << std::endl;
}
