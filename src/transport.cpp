#include "transport.hpp"
#include "util.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace decaf {

std::optional<nlohmann::json> parse_message(const std::string& line) {
    if (trim(line).empty()) return std::nullopt;
    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

// ── LineReader ───────────────────────────────────────────────────

LineReader::LineReader(int fd, int cancel_fd)
    : fd_(fd), cancel_fd_(cancel_fd)
{}

bool LineReader::read_line(std::string& line) {
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        if (eof_) {
            if (buffer_.empty()) return false;
            line = std::move(buffer_);
            buffer_.clear();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        if (!fill()) return false;
    }
}

// Read more bytes into buffer_. Returns false on cancellation or error;
// sets eof_ (and returns true) when the peer closed.
bool LineReader::fill() {
    struct pollfd fds[2];
    fds[0].fd = fd_;        fds[0].events = POLLIN;
    fds[1].fd = cancel_fd_; fds[1].events = POLLIN;
    nfds_t nfds = cancel_fd_ >= 0 ? 2 : 1;

    while (true) {
        int ret = ::poll(fds, nfds, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (nfds == 2 && (fds[1].revents & POLLIN)) return false;
        if (fds[0].revents & POLLNVAL) return false;
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) break;
    }

    std::array<char, 4096> chunk;
    ssize_t n;
    do {
        n = ::read(fd_, chunk.data(), chunk.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) return false;
    if (n == 0) {
        eof_ = true;
        return true;
    }
    buffer_.append(chunk.data(), static_cast<size_t>(n));
    return true;
}

// ── FdSink ───────────────────────────────────────────────────────

FdSink::FdSink(int fd, std::string name)
    : fd_(fd), name_(std::move(name))
{}

void FdSink::send(const nlohmann::json& message) {
    std::string line = message.dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(name_ + ": write failed: " + std::strerror(errno));
        }
        if (n == 0) {
            throw TransportError(name_ + ": write returned no progress");
        }
        written += static_cast<size_t>(n);
    }
}

// ── pump_messages ────────────────────────────────────────────────

size_t pump_messages(LineReader& reader, const std::string& peer,
                     const MessageHandler& handler) {
    size_t handled = 0;
    std::string line;
    while (reader.read_line(line)) {
        if (trim(line).empty()) continue;

        auto message = parse_message(line);
        if (!message) {
            std::cerr << "[" << peer << "] Dropping line that is not JSON ("
                      << line.size() << " bytes)\n";
            continue;
        }
        handler(*message);
        handled++;
    }
    return handled;
}

} // namespace decaf
