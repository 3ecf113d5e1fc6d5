#pragma once
#include <string>
#include <atomic>
#include <cstdint>

namespace decaf {

class EventBus;

// Counts chunks absorbed versus chunks forwarded, per flush reason.
// Counters are atomic because flushes are published from two threads.
class FlushStats {
public:
    // Subscribe to ChunkBuffered and TextFlushed events.
    void subscribe_events(EventBus& bus);

    uint64_t chunks_in() const { return chunks_in_.load(); }
    uint64_t chunks_out() const;
    uint64_t bytes_in() const { return bytes_in_.load(); }
    uint64_t timer_flushes() const { return timer_flushes_.load(); }
    uint64_t response_flushes() const { return response_flushes_.load(); }
    uint64_t other_flushes() const { return other_flushes_.load(); }

    // e.g. "coalesced 20 chunks (87 bytes) into 1 (timer 0, prompt_response 1, other_message 0)"
    std::string summary() const;

private:
    std::atomic<uint64_t> chunks_in_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> timer_flushes_{0};
    std::atomic<uint64_t> response_flushes_{0};
    std::atomic<uint64_t> other_flushes_{0};
};

} // namespace decaf
