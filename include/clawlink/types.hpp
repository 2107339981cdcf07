#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <tl/expected.hpp>

namespace clawlink {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Connection/handshake errors
 * - 300-399: Request errors
 * - 400-499: Protocol/decoding errors
 * - 500-599: Chat errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidUrl = 101,

    // Connection errors (200-299)
    NotConnected = 200,
    ConnectionFailed = 201,
    AuthenticationFailed = 202,
    TransportFailed = 203,

    // Request errors (300-399)
    RequestTimeout = 300,
    ServerError = 301,

    // Protocol errors (400-499)
    DecodingError = 400,

    // Chat errors (500-599)
    InvalidMessage = 500,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (method name, url, ...)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

/**
 * @brief User-facing description of an error, prefixed by its category.
 */
inline std::string describe(const Error& error) {
    switch (error.code) {
        case ErrorCode::NotConnected: return "Not connected to server";
        case ErrorCode::AuthenticationFailed: return "Authentication failed: " + error.message;
        case ErrorCode::RequestTimeout: return "Request timed out: " + error.context.value_or(error.message);
        case ErrorCode::ServerError: return "Server error: " + error.message;
        case ErrorCode::DecodingError: return "Decoding error: " + error.message;
        case ErrorCode::ConnectionFailed:
        case ErrorCode::TransportFailed: return "Connection failed: " + error.message;
        default: return error.message;
    }
}

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in a conversation transcript
 */
enum class Role {
    System,
    User,
    Assistant,
    Tool
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// Unknown role names map to Assistant, which is what the gateway assumes
/// for records that omit the field.
[[nodiscard]] inline Role role_from_string(const std::string& role) {
    if (role == "user") return Role::User;
    if (role == "system") return Role::System;
    if (role == "tool") return Role::Tool;
    return Role::Assistant;
}

/**
 * @brief Single message in a conversation transcript
 *
 * Immutable once finalized by the stream reconciler. Drafts are re-emitted
 * as fresh values rather than mutated in place.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    std::string id;                          ///< Server id, run id, or a generated id
    Role role = Role::Assistant;             ///< Message role
    std::string content;                     ///< Visible text
    std::optional<std::string> timestamp;    ///< Server-supplied timestamp, verbatim
    std::optional<std::string> thinking;     ///< Reasoning text, if any

    static Message user(std::string id, std::string content) {
        return Message{std::move(id), Role::User, std::move(content), std::nullopt, std::nullopt};
    }

    static Message assistant(std::string id, std::string content,
                             std::optional<std::string> thinking = std::nullopt) {
        return Message{std::move(id), Role::Assistant, std::move(content), std::nullopt, std::move(thinking)};
    }

    static Message system(std::string id, std::string content) {
        return Message{std::move(id), Role::System, std::move(content), std::nullopt, std::nullopt};
    }

    bool is_user() const { return role == Role::User; }
    bool is_assistant() const { return role == Role::Assistant; }
    bool is_system() const { return role == Role::System; }

    /// A message with no text and no reasoning has nothing to display.
    bool is_empty() const {
        return content.empty() && (!thinking.has_value() || thinking->empty());
    }

    bool operator==(const Message& other) const {
        return id == other.id &&
               role == other.role &&
               content == other.content &&
               timestamp == other.timestamp &&
               thinking == other.thinking;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Connection State
// ============================================================================

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

/**
 * @brief Observable connection state: disconnected | connecting | connected | error(reason)
 */
struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string reason;  ///< Only meaningful for ConnectionStatus::Error

    static ConnectionState disconnected() { return {ConnectionStatus::Disconnected, {}}; }
    static ConnectionState connecting() { return {ConnectionStatus::Connecting, {}}; }
    static ConnectionState connected() { return {ConnectionStatus::Connected, {}}; }
    static ConnectionState error(std::string reason) { return {ConnectionStatus::Error, std::move(reason)}; }

    bool is_connected() const { return status == ConnectionStatus::Connected; }
    bool is_error() const { return status == ConnectionStatus::Error; }

    std::string display_text() const {
        switch (status) {
            case ConnectionStatus::Disconnected: return "Disconnected";
            case ConnectionStatus::Connecting: return "Connecting...";
            case ConnectionStatus::Connected: return "Connected";
            case ConnectionStatus::Error: return "Error: " + reason;
        }
        return "unknown";
    }

    bool operator==(const ConnectionState& other) const {
        return status == other.status && reason == other.reason;
    }

    bool operator!=(const ConnectionState& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Client Configuration
// ============================================================================

/**
 * @brief Static client descriptor sent in the connect handshake
 */
struct ClientInfo {
    std::string id = "gateway-client";
    std::string display_name = "clawlink";
    std::string version = "1.0.0";
    std::string platform = "linux";
    std::string mode = "backend";

    bool operator==(const ClientInfo& other) const {
        return id == other.id && display_name == other.display_name &&
               version == other.version && platform == other.platform &&
               mode == other.mode;
    }
};

/**
 * @brief Default heartbeat sentinels, matched case-insensitively as substrings.
 */
inline std::vector<std::string> default_heartbeat_patterns() {
    return {
        "HEARTBEAT_OK",
        "READ HEARTBEAT.MD",
        "# HEARTBEAT - EVENT-DRIVEN STATUS"
    };
}

/**
 * @brief Complete configuration for a gateway connection
 *
 * Must be validated via validate() before use. Token takes precedence over
 * password when both are non-empty; only one of them is ever sent.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    // Endpoint and credentials
    std::string url;                                         ///< ws:// or wss:// gateway URL (required)
    std::optional<std::string> token;                        ///< Gateway token
    std::optional<std::string> password;                     ///< Gateway password (used when no token)
    bool verify_tls_peer = false;                            ///< Gateways commonly run with self-signed certs

    // Handshake
    int min_protocol = 3;
    int max_protocol = 3;
    std::string role = "operator";
    ClientInfo client;
    std::chrono::milliseconds challenge_timeout = std::chrono::seconds(10);
    std::chrono::milliseconds challenge_poll_interval = std::chrono::milliseconds(100);

    // Requests
    std::chrono::milliseconds request_timeout = std::chrono::seconds(30);
    std::chrono::milliseconds send_ack_timeout = std::chrono::seconds(30);  ///< chat.send acknowledgement wait

    // Reconnect
    int max_reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_backoff = std::chrono::seconds(1);

    // Streaming
    std::vector<std::string> heartbeat_patterns = default_heartbeat_patterns();

    Expected<void> validate() const {
        if (url.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidUrl, "Server URL cannot be empty"});
        }
        if (url.rfind("ws://", 0) != 0 && url.rfind("wss://", 0) != 0) {
            return tl::unexpected(Error{ErrorCode::InvalidUrl, "Server URL must start with ws:// or wss://", url});
        }
        if (min_protocol <= 0 || max_protocol < min_protocol) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Protocol bounds must satisfy 0 < min_protocol <= max_protocol"});
        }
        if (request_timeout.count() <= 0 || send_ack_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Request timeouts must be positive"});
        }
        if (challenge_timeout.count() <= 0 || challenge_poll_interval.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Challenge timeout and poll interval must be positive"});
        }
        if (max_reconnect_attempts < 1) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_reconnect_attempts must be >= 1"});
        }
        return {};
    }

    /// Credentials actually sent in the handshake: token preferred, never both.
    std::optional<std::pair<std::string, std::string>> auth_credential() const {
        if (token.has_value() && !token->empty()) {
            return std::make_pair(std::string("token"), *token);
        }
        if (password.has_value() && !password->empty()) {
            return std::make_pair(std::string("password"), *password);
        }
        return std::nullopt;
    }
};

} // namespace clawlink
