#include "flush_timer.hpp"
#include <stdexcept>

namespace decaf {

FlushTimer::FlushTimer(std::chrono::milliseconds interval, Tick tick)
    : interval_(interval), tick_(std::move(tick))
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("flush interval must be positive");
    }
}

FlushTimer::~FlushTimer() {
    stop();
}

void FlushTimer::start() {
    if (thread_.joinable()) {
        if (running_.load()) return;
        // A failed tick ended the thread; reap it so the timer can restart.
        thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        error_.clear();
    }
    running_.store(true);
    thread_ = std::thread([this]() { run(); });
}

void FlushTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    // The error handler may call stop() from the timer thread itself;
    // the owner's later stop() does the join.
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::string FlushTimer::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void FlushTimer::run() {
    auto next = std::chrono::steady_clock::now() + interval_;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) break;
        }

        try {
            tick_();
        } catch (const std::exception& e) {
            fail(e.what());
            return;
        } catch (...) {
            fail("unknown error");
            return;
        }
        ticks_++;

        // Missed periods are skipped rather than replayed back to back.
        next += interval_;
        auto now = std::chrono::steady_clock::now();
        if (next <= now) next = now + interval_;
    }

    running_.store(false);
}

void FlushTimer::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = message;
    }
    running_.store(false);
    if (on_error_) on_error_(message);
}

} // namespace decaf
