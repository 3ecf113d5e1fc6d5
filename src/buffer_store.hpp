#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace decaf {

// Text taken out of one session's buffer.
struct FlushedText {
    std::string session_id;
    std::string text;
    nlohmann::json notification; // last chunk seen for the session, or null
};

// Per-session text accumulator shared by the message path and the flush
// thread. Every operation is one short critical section; nothing here
// blocks on I/O. A session without an entry counts as an empty buffer.
class SessionBufferStore {
public:
    // Append text to the session's buffer, creating it on first use.
    // A non-null notification replaces the session's template.
    void append(const std::string& session_id,
                const std::string& text,
                nlohmann::json notification = nullptr);

    // Take the text of every non-empty buffer, leaving all of them empty.
    // Order across sessions is unspecified.
    std::vector<FlushedText> drain_all();

    // Take one session's text (possibly empty), leaving its buffer empty.
    FlushedText drain_one(const std::string& session_id);

    std::string pending_text(const std::string& session_id) const;

    // Sessions ever seen (entries are emptied, never erased).
    size_t session_count() const;

    // Sessions currently holding text.
    size_t pending_session_count() const;

private:
    struct BufferedSession {
        std::string text;
        nlohmann::json notification;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, BufferedSession> sessions_;
};

} // namespace decaf
