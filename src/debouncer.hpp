#pragma once
#include "buffer_store.hpp"
#include "flush_timer.hpp"
#include "sink.hpp"
#include <string>
#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace decaf {

class EventBus;

// Sits between a client and an agent and coalesces the agent's
// agent_message_chunk notifications.
//
// Agent text chunks are absorbed into a per-session buffer. Buffers are
// released as one synthesized chunk per session when:
//   - the flush timer fires (all sessions),
//   - the response to a session/prompt arrives (that session, before the
//     response is forwarded),
//   - any other agent message arrives (all sessions, before the message).
//
// Two locks: the store's own mutex (short, never held over I/O) and
// flush_mutex_, which keeps every drain-then-forward sequence whole so a
// structural message can never overtake text drained ahead of it.
class Debouncer {
public:
    // Throws std::invalid_argument if interval is not positive.
    Debouncer(std::chrono::milliseconds interval,
              MessageSink& to_client,
              MessageSink& to_agent);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    // Optional event bus for flush notifications. Set before start().
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Called on the timer thread if a timed flush fails. Set before start().
    void set_error_handler(FlushTimer::ErrorHandler handler);

    // Start/stop the flush timer. Text still buffered at stop is dropped.
    void start();
    void stop();

    // Agent -> client. Messages must be handled one at a time, in arrival
    // order. Throws TransportError if forwarding fails.
    void handle_agent_message(const nlohmann::json& message);

    // Client -> agent. Forwarded unchanged; session/prompt ids are
    // remembered so the matching response can be recognised.
    void handle_client_message(const nlohmann::json& message);

    // Forward every pending buffer. This is the timer's tick.
    void flush_all();

    SessionBufferStore& store() { return store_; }
    const FlushTimer& timer() const { return timer_; }
    size_t pending_prompt_count() const;

private:
    void flush_all_locked(const char* reason);
    void forward_flushed(const FlushedText& flushed, const char* reason);
    std::optional<std::string> take_prompt_session(const nlohmann::json& message);

    MessageSink& to_client_;
    MessageSink& to_agent_;
    EventBus* event_bus_ = nullptr;

    SessionBufferStore store_;
    std::mutex flush_mutex_;

    mutable std::mutex prompts_mutex_;
    std::unordered_map<std::string, std::string> pending_prompts_; // id_key -> sessionId

    // Declared last: destroyed first, so the thread is gone before the store.
    FlushTimer timer_;
};

} // namespace decaf
