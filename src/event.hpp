#pragma once
#include <string>
#include <cstddef>

namespace decaf {

// Tag-based event dispatch, no RTTI and no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ChunkBuffered = "ChunkBuffered";
    constexpr const char* TextFlushed   = "TextFlushed";
} // namespace event_tags

// ── Flush reasons ───────────────────────────────────────────────

namespace flush_reasons {
    constexpr const char* Timer          = "timer";
    constexpr const char* PromptResponse = "prompt_response";
    constexpr const char* OtherMessage   = "other_message";
} // namespace flush_reasons

// ── Event structs ───────────────────────────────────────────────

// An agent text chunk was absorbed into a session buffer.
struct ChunkBufferedEvent : Event {
    static constexpr const char* TAG = event_tags::ChunkBuffered;
    std::string session_id;
    size_t bytes = 0;

    ChunkBufferedEvent() { type_tag = TAG; }
};

// A coalesced chunk was handed to the client.
struct TextFlushedEvent : Event {
    static constexpr const char* TAG = event_tags::TextFlushed;
    std::string session_id;
    size_t bytes = 0;
    const char* reason = flush_reasons::Timer;

    TextFlushedEvent() { type_tag = TAG; }
};

} // namespace decaf
