#include "buffer_store.hpp"
#include <utility>

namespace decaf {

void SessionBufferStore::append(const std::string& session_id,
                                const std::string& text,
                                nlohmann::json notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& buffered = sessions_[session_id];
    buffered.text += text;
    if (!notification.is_null()) {
        buffered.notification = std::move(notification);
    }
}

std::vector<FlushedText> SessionBufferStore::drain_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FlushedText> flushed;
    for (auto& [id, buffered] : sessions_) {
        if (buffered.text.empty()) continue;
        flushed.push_back(FlushedText{id, std::move(buffered.text), buffered.notification});
        buffered.text.clear(); // moved-from string is valid but unspecified
    }
    return flushed;
}

FlushedText SessionBufferStore::drain_one(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    FlushedText flushed;
    flushed.session_id = session_id;

    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.text.empty()) return flushed;

    flushed.text = std::move(it->second.text);
    it->second.text.clear();
    flushed.notification = it->second.notification;
    return flushed;
}

std::string SessionBufferStore::pending_text(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return {};
    return it->second.text;
}

size_t SessionBufferStore::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionBufferStore::pending_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, buffered] : sessions_) {
        if (!buffered.text.empty()) count++;
    }
    return count;
}

} // namespace decaf
