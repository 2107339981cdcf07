#pragma once

#include "heartbeat_filter.hpp"
#include "message_parser.hpp"
#include "../protocol/types.hpp"
#include "../types.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clawlink {
namespace streaming {

/**
 * @brief Which narration channel owns the current turn.
 */
enum class StreamSource {
    None,
    Primary,    ///< "chat" events
    Secondary   ///< "agent" events
};

inline const char* stream_source_to_string(StreamSource source) {
    switch (source) {
        case StreamSource::None: return "none";
        case StreamSource::Primary: return "primary";
        case StreamSource::Secondary: return "secondary";
    }
    return "unknown";
}

/**
 * @brief Merges the two narration channels of one conversation into a single
 * growing draft and one finalized Message per turn.
 *
 * The gateway may narrate the same assistant turn on the "chat" channel
 * (`state`/`delta`/`message`) and on the "agent" channel
 * (`stream`/`data.delta`/`data.phase`). The first channel to deliver a chunk
 * owns the turn; chunks from the other channel are dropped until the turn
 * ends. Only the chat channel's terminal event finalizes a turn, so its
 * message id and timestamp end up on the finalized Message.
 *
 * Heartbeat chunks are dropped, and a draft or final message whose text
 * matches a heartbeat pattern is never emitted. A final payload whose text
 * matches a pattern is treated as carrying no text, so the accumulated draft
 * is finalized instead.
 *
 * Threading: handle_event() runs on the transport read thread; begin_turn()
 * and abandon() may be called from any thread. Callbacks are invoked without
 * the internal lock held, on the thread that triggered them.
 */
class StreamReconciler {
public:
    struct Callbacks {
        std::function<void(const Message&)> on_draft;        ///< Draft replaced (same id every time)
        std::function<void(const Message&)> on_final;        ///< Turn finalized
        std::function<void(const std::string&)> on_error;    ///< Server-reported streaming error
    };

    StreamReconciler(std::string session_key, HeartbeatFilter filter, Callbacks callbacks)
        : session_key_(std::move(session_key))
        , filter_(std::move(filter))
        , callbacks_(std::move(callbacks)) {}

    /**
     * @brief Mark the session open ahead of the first chunk (a send was issued).
     */
    void begin_turn() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
    }

    /**
     * @brief Event listener entry point.
     *
     * Events whose payload names a different `sessionKey` are ignored.
     */
    void handle_event(const std::string& name, const nlohmann::json& payload) {
        if (!payload.is_object()) {
            return;
        }
        if (auto key = MessageParser::string_field(payload, "sessionKey"); key && *key != session_key_) {
            return;
        }

        std::vector<Emission> emissions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (name == protocol::events::kChat) {
                on_chat(payload, emissions);
            } else if (name == protocol::events::kAgent) {
                on_agent(payload, emissions);
            }
        }
        emit(emissions);
    }

    /**
     * @brief Drop the current turn without emitting anything.
     */
    void abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset();
    }

    StreamSource active_source() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::string accumulated_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

    std::string accumulated_reasoning() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reasoning_;
    }

    /// Current draft, if there is anything displayable.
    std::optional<Message> draft() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_draft();
    }

    const std::string& session_key() const { return session_key_; }

    std::string draft_id() const { return "streaming-" + session_key_; }

private:
    struct Emission {
        enum class Kind { Draft, Final, Error } kind;
        Message message;
        std::string error;
    };

    // ------------------------------------------------------------------------
    // Primary channel: {state: delta|final|error|aborted, delta, message, ...}
    // ------------------------------------------------------------------------

    void on_chat(const nlohmann::json& payload, std::vector<Emission>& out) {
        const std::string state = MessageParser::string_field(payload, "state").value_or("");

        if (state == "delta") {
            if (active_ == StreamSource::Secondary) {
                spdlog::debug("[clawlink] {}: chat delta dropped, agent stream owns the turn", session_key_);
                return;
            }
            auto delta = MessageParser::string_field(payload, "delta");
            auto reasoning = reasoning_snapshot(payload);
            if (!delta && !reasoning) {
                return;
            }
            apply_chunk(StreamSource::Primary, delta, reasoning, out);
        } else if (state == "final") {
            finalize(payload, out);
        } else if (state == "error") {
            out.push_back(Emission{Emission::Kind::Error, {},
                MessageParser::string_field(payload, "errorMessage").value_or("Chat run failed")});
            promote_draft(payload, out);
        } else if (state == "aborted") {
            promote_draft(payload, out);
        }
    }

    // ------------------------------------------------------------------------
    // Secondary channel: {stream: assistant|lifecycle, data: {delta|phase|error}}
    // ------------------------------------------------------------------------

    void on_agent(const nlohmann::json& payload, std::vector<Emission>& out) {
        const std::string stream = MessageParser::string_field(payload, "stream").value_or("");
        auto data_it = payload.find("data");
        if (data_it == payload.end() || !data_it->is_object()) {
            return;
        }
        const nlohmann::json& data = *data_it;

        if (stream == "assistant") {
            if (active_ == StreamSource::Primary) {
                spdlog::debug("[clawlink] {}: agent delta dropped, chat stream owns the turn", session_key_);
                return;
            }
            auto delta = MessageParser::string_field(data, "delta");
            if (!delta) {
                return;
            }
            apply_chunk(StreamSource::Secondary, delta, std::nullopt, out);
        } else if (stream == "lifecycle") {
            const std::string phase = MessageParser::string_field(data, "phase").value_or("");
            if (phase == "start") {
                open_ = true;
            } else if (phase == "error") {
                out.push_back(Emission{Emission::Kind::Error, {},
                    MessageParser::string_field(data, "error").value_or("Agent run failed")});
            }
            // "end" waits for the chat channel's final event
        }
    }

    void apply_chunk(StreamSource source, const std::optional<std::string>& delta,
                     const std::optional<std::string>& reasoning, std::vector<Emission>& out) {
        active_ = source;
        open_ = true;

        if (delta && filter_.matches(*delta)) {
            spdlog::debug("[clawlink] {}: heartbeat chunk dropped", session_key_);
            return;
        }
        if (delta) {
            text_ += *delta;
        }
        if (reasoning) {
            reasoning_ = *reasoning;
        }

        if (auto draft = current_draft()) {
            out.push_back(Emission{Emission::Kind::Draft, std::move(*draft), {}});
        }
    }

    void finalize(const nlohmann::json& payload, std::vector<Emission>& out) {
        if (active_ == StreamSource::Secondary) {
            // The agent stream owned the turn: keep its text, take only metadata
            promote_draft(payload, out);
            return;
        }

        ExtractedContent extracted;
        auto msg_it = payload.find("message");
        if (msg_it != payload.end() && msg_it->is_object() && msg_it->contains("content")) {
            extracted = MessageParser::extract_content((*msg_it)["content"]);
        }

        // Heartbeat-tainted final text counts as no text; the draft stands in
        std::string text = std::move(extracted.text);
        if (text.empty() || filter_.matches(text)) {
            text = text_;
        }
        std::optional<std::string> thinking = extracted.thinking;
        if (!thinking && !reasoning_.empty()) {
            thinking = reasoning_;
        }

        emit_final(payload, std::move(text), std::move(thinking), out);
        reset();
    }

    /// Finalize from the accumulated draft, with metadata from the terminal payload.
    void promote_draft(const nlohmann::json& payload, std::vector<Emission>& out) {
        std::optional<std::string> thinking;
        if (!reasoning_.empty()) {
            thinking = reasoning_;
        }
        emit_final(payload, text_, std::move(thinking), out);
        reset();
    }

    void emit_final(const nlohmann::json& payload, std::string text,
                    std::optional<std::string> thinking, std::vector<Emission>& out) {
        if (filter_.matches(text)) {
            spdlog::debug("[clawlink] {}: heartbeat turn suppressed", session_key_);
            return;
        }
        if (text.empty() && (!thinking || thinking->empty())) {
            return;
        }

        Message message;
        message.role = Role::Assistant;
        message.content = std::move(text);
        message.thinking = std::move(thinking);
        message.timestamp = MessageParser::timestamp_of(payload);

        const nlohmann::json* meta = &payload;
        auto msg_it = payload.find("message");
        if (msg_it != payload.end() && msg_it->is_object()) {
            meta = &*msg_it;
        }
        if (auto id = MessageParser::string_field(*meta, "id")) {
            message.id = *id;
        } else if (auto run_id = MessageParser::string_field(payload, "runId")) {
            message.id = *run_id;
        } else {
            message.id = MessageParser::generate_id("msg-");
        }

        out.push_back(Emission{Emission::Kind::Final, std::move(message), {}});
    }

    std::optional<std::string> reasoning_snapshot(const nlohmann::json& payload) const {
        auto msg_it = payload.find("message");
        if (msg_it == payload.end() || !msg_it->is_object() || !msg_it->contains("content")) {
            return std::nullopt;
        }
        return MessageParser::extract_content((*msg_it)["content"]).thinking;
    }

    std::optional<Message> current_draft() const {
        if (text_.empty() && reasoning_.empty()) {
            return std::nullopt;
        }
        if (filter_.matches(text_)) {
            return std::nullopt;
        }
        std::optional<std::string> thinking;
        if (!reasoning_.empty()) {
            thinking = reasoning_;
        }
        return Message::assistant(draft_id(), text_, std::move(thinking));
    }

    void reset() {
        active_ = StreamSource::None;
        text_.clear();
        reasoning_.clear();
        open_ = false;
    }

    void emit(const std::vector<Emission>& emissions) const {
        for (const auto& emission : emissions) {
            switch (emission.kind) {
                case Emission::Kind::Draft:
                    if (callbacks_.on_draft) callbacks_.on_draft(emission.message);
                    break;
                case Emission::Kind::Final:
                    if (callbacks_.on_final) callbacks_.on_final(emission.message);
                    break;
                case Emission::Kind::Error:
                    if (callbacks_.on_error) callbacks_.on_error(emission.error);
                    break;
            }
        }
    }

    const std::string session_key_;
    const HeartbeatFilter filter_;
    const Callbacks callbacks_;

    mutable std::mutex mutex_;
    StreamSource active_ = StreamSource::None;
    std::string text_;
    std::string reasoning_;
    bool open_ = false;
};

} // namespace streaming
} // namespace clawlink
