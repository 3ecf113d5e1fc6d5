#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace decaf {

// Agent Client Protocol vocabulary used by the debouncer.
// Messages are JSON-RPC 2.0 objects; anything not recognised here is
// passed through untouched.

namespace acp_methods {
    constexpr const char* SessionUpdate = "session/update";
    constexpr const char* SessionPrompt = "session/prompt";
} // namespace acp_methods

constexpr const char* kAgentMessageChunk = "agent_message_chunk";

struct TextChunk {
    std::string session_id;
    std::string text;
};

// JSON-RPC shape checks
bool is_request(const nlohmann::json& message);
bool is_notification(const nlohmann::json& message);
bool is_response(const nlohmann::json& message);

// Stable map key for a JSON-RPC id (keeps 7 and "7" distinct).
std::string id_key(const nlohmann::json& id);

// Returns the chunk when `message` is a session/update notification
// carrying an agent_message_chunk with text content.
std::optional<TextChunk> parse_text_chunk(const nlohmann::json& message);

// Session id of a session/prompt request, if `message` is one.
std::optional<std::string> prompt_session_id(const nlohmann::json& message);

// Build an agent_message_chunk notification carrying `text`.
// When `templ` is an earlier chunk notification it is copied, so _meta,
// annotations and other fields survive; only sessionId and text change.
nlohmann::json make_text_chunk(const std::string& session_id,
                               const std::string& text,
                               const nlohmann::json& templ = nullptr);

} // namespace decaf
