#include "acp.hpp"

namespace decaf {

// Empty when the key is absent or not a string.
static std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool is_request(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           message["method"].is_string() && message.contains("id");
}

bool is_notification(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           message["method"].is_string() && !message.contains("id");
}

bool is_response(const nlohmann::json& message) {
    return message.is_object() && !message.contains("method") &&
           message.contains("id") &&
           (message.contains("result") || message.contains("error"));
}

std::string id_key(const nlohmann::json& id) {
    return id.dump();
}

std::optional<TextChunk> parse_text_chunk(const nlohmann::json& message) {
    if (!is_notification(message)) return std::nullopt;
    if (message["method"].get<std::string>() != acp_methods::SessionUpdate)
        return std::nullopt;

    auto params = message.find("params");
    if (params == message.end() || !params->is_object()) return std::nullopt;

    auto session_id = params->find("sessionId");
    if (session_id == params->end() || !session_id->is_string()) return std::nullopt;

    auto update = params->find("update");
    if (update == params->end() || !update->is_object()) return std::nullopt;
    if (string_field(*update, "sessionUpdate") != kAgentMessageChunk) return std::nullopt;

    auto content = update->find("content");
    if (content == update->end() || !content->is_object()) return std::nullopt;
    if (string_field(*content, "type") != "text") return std::nullopt;

    auto text = content->find("text");
    if (text == content->end() || !text->is_string()) return std::nullopt;

    return TextChunk{session_id->get<std::string>(), text->get<std::string>()};
}

std::optional<std::string> prompt_session_id(const nlohmann::json& message) {
    if (!is_request(message)) return std::nullopt;
    if (message["method"].get<std::string>() != acp_methods::SessionPrompt)
        return std::nullopt;

    auto params = message.find("params");
    if (params == message.end() || !params->is_object()) return std::nullopt;

    auto session_id = params->find("sessionId");
    if (session_id == params->end() || !session_id->is_string()) return std::nullopt;
    return session_id->get<std::string>();
}

nlohmann::json make_text_chunk(const std::string& session_id,
                               const std::string& text,
                               const nlohmann::json& templ) {
    if (parse_text_chunk(templ)) {
        nlohmann::json message = templ;
        message["params"]["sessionId"] = session_id;
        message["params"]["update"]["content"]["text"] = text;
        return message;
    }

    return {
        {"jsonrpc", "2.0"},
        {"method", acp_methods::SessionUpdate},
        {"params", {
            {"sessionId", session_id},
            {"update", {
                {"sessionUpdate", kAgentMessageChunk},
                {"content", {{"type", "text"}, {"text", text}}}
            }}
        }}
    };
}

} // namespace decaf
