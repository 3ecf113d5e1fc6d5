#include "debouncer.hpp"
#include "acp.hpp"
#include "event.hpp"
#include "event_bus.hpp"

namespace decaf {

Debouncer::Debouncer(std::chrono::milliseconds interval,
                     MessageSink& to_client,
                     MessageSink& to_agent)
    : to_client_(to_client)
    , to_agent_(to_agent)
    , timer_(interval, [this]() { flush_all(); })
{}

Debouncer::~Debouncer() {
    stop();
}

void Debouncer::set_error_handler(FlushTimer::ErrorHandler handler) {
    timer_.set_error_handler(std::move(handler));
}

void Debouncer::start() {
    timer_.start();
}

void Debouncer::stop() {
    timer_.stop();
}

void Debouncer::handle_agent_message(const nlohmann::json& message) {
    if (auto chunk = parse_text_chunk(message)) {
        size_t bytes = chunk->text.size();
        store_.append(chunk->session_id, chunk->text, message);
        if (event_bus_) {
            ChunkBufferedEvent ev;
            ev.session_id = chunk->session_id;
            ev.bytes = bytes;
            event_bus_->publish(ev);
        }
        return;
    }

    std::lock_guard<std::mutex> lock(flush_mutex_);
    if (auto session_id = take_prompt_session(message)) {
        // End of a prompt turn: only that session's text must go first.
        auto flushed = store_.drain_one(*session_id);
        if (!flushed.text.empty()) {
            forward_flushed(flushed, flush_reasons::PromptResponse);
        }
    } else {
        // Session of an arbitrary message is not reliably known; release all.
        flush_all_locked(flush_reasons::OtherMessage);
    }
    to_client_.send(message);
}

void Debouncer::handle_client_message(const nlohmann::json& message) {
    if (auto session_id = prompt_session_id(message)) {
        std::lock_guard<std::mutex> lock(prompts_mutex_);
        pending_prompts_[id_key(message["id"])] = *session_id;
    }
    to_agent_.send(message);
}

void Debouncer::flush_all() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    flush_all_locked(flush_reasons::Timer);
}

size_t Debouncer::pending_prompt_count() const {
    std::lock_guard<std::mutex> lock(prompts_mutex_);
    return pending_prompts_.size();
}

void Debouncer::flush_all_locked(const char* reason) {
    // Drained text is gone from the store even if a send below throws.
    for (const auto& flushed : store_.drain_all()) {
        forward_flushed(flushed, reason);
    }
}

void Debouncer::forward_flushed(const FlushedText& flushed, const char* reason) {
    to_client_.send(make_text_chunk(flushed.session_id, flushed.text, flushed.notification));

    if (event_bus_) {
        TextFlushedEvent ev;
        ev.session_id = flushed.session_id;
        ev.bytes = flushed.text.size();
        ev.reason = reason;
        event_bus_->publish(ev);
    }
}

std::optional<std::string> Debouncer::take_prompt_session(const nlohmann::json& message) {
    if (!is_response(message)) return std::nullopt;

    std::lock_guard<std::mutex> lock(prompts_mutex_);
    auto it = pending_prompts_.find(id_key(message["id"]));
    if (it == pending_prompts_.end()) return std::nullopt;

    std::string session_id = std::move(it->second);
    pending_prompts_.erase(it);
    return session_id;
}

} // namespace decaf
