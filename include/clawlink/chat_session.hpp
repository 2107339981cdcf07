#pragma once

#include "connection.hpp"
#include "types.hpp"
#include "protocol/types.hpp"
#include "streaming/heartbeat_filter.hpp"
#include "streaming/message_parser.hpp"
#include "streaming/stream_reconciler.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clawlink {

/**
 * @brief One conversation on a gateway connection.
 *
 * Keeps the transcript for a session key, loads its history, sends user
 * messages and folds the streamed reply into the transcript through a
 * StreamReconciler fed by a `chat:<sessionKey>` event listener.
 *
 * The Connection must outlive the ChatSession. The listener is removed on
 * destruction; a dispatch already in flight keeps the shared state alive
 * until it returns.
 */
class ChatSession {
public:
    static constexpr size_t kMaxMessageLength = 4000;

    /// Streaming notifications, called on the transport read thread.
    using StreamHandlers = streaming::StreamReconciler::Callbacks;

    ChatSession(Connection& connection, std::string session_key)
        : connection_(connection)
        , state_(std::make_shared<State>(session_key, connection.config().heartbeat_patterns))
        , listener_id_("chat:" + session_key) {
        auto state = state_;
        connection_.add_event_listener(listener_id_,
            [state](const std::string& name, const nlohmann::json& payload) {
                state->reconciler.handle_event(name, payload);
            });
    }

    ~ChatSession() {
        connection_.remove_event_listener(listener_id_);
    }

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    /**
     * @brief Replace the transcript with the server's history for this session.
     *
     * Heartbeat messages and messages with nothing to show are dropped.
     *
     * @return Number of messages kept
     */
    Expected<size_t> load_history() {
        nlohmann::json params = {{"sessionKey", session_key()}};
        auto payload = connection_.request_payload(protocol::methods::kChatHistory, params);
        if (!payload) {
            state_->set_error(describe(payload.error()));
            return tl::unexpected(payload.error());
        }

        // Top-level array or {messages: [...]}
        nlohmann::json records = nlohmann::json::array();
        if (payload->is_array()) {
            records = *payload;
        } else if (payload->is_object() && payload->contains("messages") && (*payload)["messages"].is_array()) {
            records = (*payload)["messages"];
        }

        std::vector<Message> parsed;
        parsed.reserve(records.size());
        for (const auto& record : records) {
            if (auto message = streaming::MessageParser::from_server_payload(record)) {
                parsed.push_back(std::move(*message));
            }
        }
        parsed = state_->filter.filter(parsed);

        spdlog::info("[clawlink] {}: loaded {} history messages ({} records)",
                     session_key(), parsed.size(), records.size());

        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->transcript = std::move(parsed);
        state_->last_error.reset();
        return state_->transcript.size();
    }

    /**
     * @brief Send a user message and open a streaming turn for the reply.
     *
     * Blocks until the gateway acknowledges `chat.send`. An acknowledgement
     * timeout is not a failure: the reply still arrives as events.
     *
     * @param text Message text (non-blank, at most kMaxMessageLength characters)
     * @param thinking Optional reasoning level forwarded to the gateway
     */
    Expected<void> send_message(const std::string& text,
                                const std::optional<std::string>& thinking = std::nullopt) {
        if (is_blank(text)) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage, "Message cannot be empty"});
        }
        if (utf8_length(text) > kMaxMessageLength) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage,
                "Message exceeds " + std::to_string(kMaxMessageLength) + " characters"});
        }

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->transcript.push_back(
                Message::user(streaming::MessageParser::generate_id("user-"), text));
            state_->last_error.reset();
        }
        state_->reconciler.begin_turn();

        nlohmann::json params = {
            {"sessionKey", session_key()},
            {"message", text},
            {"idempotencyKey", streaming::MessageParser::generate_id("")}
        };
        if (thinking.has_value() && !thinking->empty()) {
            params["thinking"] = *thinking;
        }

        auto result = connection_.send_request(protocol::methods::kChatSend, params,
                                               connection_.config().send_ack_timeout).get();
        if (!result) {
            if (result.error().code == ErrorCode::RequestTimeout) {
                spdlog::info("[clawlink] {}: chat.send not acknowledged in time, waiting on stream", session_key());
                return {};
            }
            return fail_send(result.error());
        }
        if (!result->ok) {
            return fail_send(Error{ErrorCode::ServerError, result->error_message("Unknown error"),
                                   std::string(protocol::methods::kChatSend)});
        }
        return {};
    }

    /**
     * @brief Transcript snapshot, with the live draft (if any) appended.
     */
    std::vector<Message> messages() const {
        auto draft = state_->reconciler.draft();
        std::lock_guard<std::mutex> lock(state_->mutex);
        std::vector<Message> out = state_->transcript;
        if (draft) {
            out.push_back(std::move(*draft));
        }
        return out;
    }

    bool is_streaming() const {
        return state_->reconciler.is_open();
    }

    std::optional<std::string> last_error() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->last_error;
    }

    /// Observe drafts, finalized messages and streaming errors as they happen.
    void set_stream_handlers(StreamHandlers handlers) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->handlers = std::move(handlers);
    }

    const std::string& session_key() const {
        return state_->reconciler.session_key();
    }

private:
    // Shared with the event listener so an in-flight dispatch never touches
    // a destroyed session.
    struct State {
        State(const std::string& session_key, const std::vector<std::string>& patterns)
            : filter(patterns)
            , reconciler(session_key, filter, streaming::StreamReconciler::Callbacks{
                  [this](const Message& draft) { on_draft(draft); },
                  [this](const Message& message) { on_final(message); },
                  [this](const std::string& error) { on_error(error); }
              }) {}

        void on_draft(const Message& draft) {
            StreamHandlers current;
            {
                std::lock_guard<std::mutex> lock(mutex);
                current = handlers;
            }
            if (current.on_draft) current.on_draft(draft);
        }

        void on_final(const Message& message) {
            StreamHandlers current;
            {
                std::lock_guard<std::mutex> lock(mutex);
                transcript.push_back(message);
                current = handlers;
            }
            if (current.on_final) current.on_final(message);
        }

        void on_error(const std::string& error) {
            spdlog::warn("[clawlink] {}: stream error: {}", reconciler.session_key(), error);
            StreamHandlers current;
            {
                std::lock_guard<std::mutex> lock(mutex);
                transcript.push_back(Message::system(
                    streaming::MessageParser::generate_id("error-"), "Error: " + error));
                last_error = error;
                current = handlers;
            }
            if (current.on_error) current.on_error(error);
        }

        void set_error(const std::string& error) {
            std::lock_guard<std::mutex> lock(mutex);
            last_error = error;
        }

        const streaming::HeartbeatFilter filter;
        streaming::StreamReconciler reconciler;

        mutable std::mutex mutex;
        std::vector<Message> transcript;
        std::optional<std::string> last_error;
        StreamHandlers handlers;
    };

    tl::unexpected<Error> fail_send(const Error& error) {
        spdlog::warn("[clawlink] {}: chat.send failed: {}", session_key(), error.to_string());
        state_->reconciler.abandon();

        const std::string text = describe(error);
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->transcript.push_back(Message::system(
            streaming::MessageParser::generate_id("error-"), "Error: " + text));
        state_->last_error = text;
        return tl::unexpected(error);
    }

    static bool is_blank(const std::string& text) {
        return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    }

    /// Code points, not bytes.
    static size_t utf8_length(const std::string& text) {
        return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](unsigned char c) {
            return (c & 0xC0) != 0x80;
        }));
    }

    Connection& connection_;
    std::shared_ptr<State> state_;
    const std::string listener_id_;
};

} // namespace clawlink
