#pragma once
#include "sink.hpp"
#include <string>
#include <mutex>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace decaf {

// ACP framing: one JSON-RPC message per line, UTF-8, '\n' terminated.

// Parse one line into a message. Returns nullopt for blank or invalid JSON.
std::optional<nlohmann::json> parse_message(const std::string& line);

// Blocking line reader over a file descriptor.
class LineReader {
public:
    // cancel_fd: optional descriptor that, once readable, makes
    // read_line() return false (the shutdown pipe).
    explicit LineReader(int fd, int cancel_fd = -1);

    // Read the next line without its terminator ("\r\n" or "\n").
    // Returns false on EOF, read error or cancellation. A final line
    // without a terminator is still delivered before EOF is reported.
    bool read_line(std::string& line);

private:
    bool fill();

    int fd_;
    int cancel_fd_;
    std::string buffer_;
    bool eof_ = false;
};

// Writes messages as lines to a file descriptor. send() is serialized
// internally so the message thread and the flush thread can share it.
class FdSink : public MessageSink {
public:
    // name appears in TransportError messages ("client", "agent").
    FdSink(int fd, std::string name);

    void send(const nlohmann::json& message) override;

private:
    int fd_;
    std::string name_;
    std::mutex mutex_;
};

using MessageHandler = std::function<void(const nlohmann::json&)>;

// Read messages until EOF or cancellation, handing each to handler.
// Lines that are not JSON are reported on stderr and skipped.
// Exceptions from handler propagate. Returns the number of messages handled.
size_t pump_messages(LineReader& reader, const std::string& peer,
                     const MessageHandler& handler);

} // namespace decaf
