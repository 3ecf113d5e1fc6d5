#pragma once
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace decaf {

// Raised when a message cannot be handed to the other side
// (broken pipe, closed descriptor, peer gone).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Abstract outbound message path (injectable for testing).
// Implementations may be called from several threads at once.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    // Deliver one JSON-RPC message. Throws TransportError on failure.
    virtual void send(const nlohmann::json& message) = 0;
};

} // namespace decaf
