#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace clawlink {
namespace protocol {

// ============================================================================
// Wire Frame Types
// ============================================================================

/// Request identifiers are decimal strings on the wire.
using RequestId = std::string;

struct RequestFrame {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const RequestFrame& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
};

struct ResponseError {
    std::optional<int> code;
    std::optional<std::string> message;
    std::optional<std::string> details;

    bool operator==(const ResponseError& other) const {
        return code == other.code && message == other.message && details == other.details;
    }
};

struct ResponseFrame {
    RequestId id;
    bool ok = false;
    std::optional<nlohmann::json> payload;
    std::optional<ResponseError> error;

    /// Server-supplied error message, or the given fallback.
    std::string error_message(const std::string& fallback) const {
        if (error.has_value() && error->message.has_value() && !error->message->empty()) {
            return *error->message;
        }
        return fallback;
    }

    bool operator==(const ResponseFrame& other) const {
        return id == other.id && ok == other.ok &&
               payload == other.payload && error == other.error;
    }
};

struct EventFrame {
    std::string event;
    std::optional<nlohmann::json> payload;

    bool operator==(const EventFrame& other) const {
        return event == other.event && payload == other.payload;
    }
};

// ============================================================================
// Well-known event and method names
// ============================================================================

namespace events {
inline constexpr const char* kConnectChallenge = "connect.challenge";
inline constexpr const char* kChat = "chat";
inline constexpr const char* kAgent = "agent";
} // namespace events

namespace methods {
inline constexpr const char* kConnect = "connect";
inline constexpr const char* kChatSend = "chat.send";
inline constexpr const char* kChatHistory = "chat.history";
} // namespace methods

} // namespace protocol
} // namespace clawlink
