#pragma once
#include <string>
#include <functional>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <cstdint>
#include <utility>

namespace decaf {

// Runs a callback on a fixed period from a background thread.
// Waiting happens on a condition variable so stop() wakes the thread at
// once; a tick already in progress always runs to completion first.
// A tick that throws ends the thread: the message is kept in error() and
// handed to the error handler, and no further ticks run.
class FlushTimer {
public:
    using Tick = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    // Throws std::invalid_argument if interval is not positive.
    FlushTimer(std::chrono::milliseconds interval, Tick tick);
    ~FlushTimer();

    FlushTimer(const FlushTimer&) = delete;
    FlushTimer& operator=(const FlushTimer&) = delete;

    // Must be set before start(). Called on the timer thread.
    void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

    // Start the background thread. No-op if already running; a timer
    // stopped by a failed tick starts afresh.
    void start();

    // Signal the thread and join it. Safe to call repeatedly.
    void stop();

    bool running() const { return running_.load(); }
    uint64_t tick_count() const { return ticks_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

    // Message of the exception that ended the thread, empty if none.
    std::string error() const;

private:
    void run();
    void fail(const std::string& message);

    std::chrono::milliseconds interval_;
    Tick tick_;
    ErrorHandler on_error_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::string error_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
};

} // namespace decaf
