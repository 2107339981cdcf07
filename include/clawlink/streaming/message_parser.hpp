#pragma once

#include "../types.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace clawlink {
namespace streaming {

/**
 * @brief Text and reasoning extracted from a message's `content` field.
 */
struct ExtractedContent {
    std::string text;
    std::optional<std::string> thinking;
};

/**
 * @brief Projects gateway message payloads into Message values.
 *
 * Gateway records come in two shapes: `{id, role, content, ...}` or the same
 * nested under a `message` key next to `runId`/`timestamp`. `content` may be
 * a plain string, an array of typed blocks, or an object.
 */
class MessageParser {
public:
    /**
     * @brief Extract text and reasoning from a `content` value.
     *
     * - string: used verbatim
     * - array: `text` blocks concatenate into text, `thinking` blocks into
     *   reasoning; other block types are ignored
     * - object: its `text`, else its `content`, else the object's JSON dump
     */
    static ExtractedContent extract_content(const nlohmann::json& content) {
        ExtractedContent out;

        if (content.is_string()) {
            out.text = content.get<std::string>();
        } else if (content.is_array()) {
            for (const auto& block : content) {
                if (!block.is_object()) {
                    continue;
                }
                const std::string type = string_field(block, "type").value_or("");
                if (type == "text") {
                    if (auto text = string_field(block, "text")) {
                        out.text += *text;
                    }
                } else if (type == "thinking") {
                    if (auto thinking = string_field(block, "thinking")) {
                        out.thinking = out.thinking.value_or("") + *thinking;
                    }
                }
            }
        } else if (content.is_object()) {
            if (auto text = string_field(content, "text")) {
                out.text = *text;
            } else if (auto inner = string_field(content, "content")) {
                out.text = *inner;
            } else {
                out.text = content.dump();
            }
        }

        return out;
    }

    /**
     * @brief Build a Message from a history record or a terminal event's message.
     *
     * Returns nullopt only when the payload is not an object.
     */
    static std::optional<Message> from_server_payload(const nlohmann::json& raw) {
        if (!raw.is_object()) {
            return std::nullopt;
        }

        const nlohmann::json& msg =
            (raw.contains("message") && raw["message"].is_object()) ? raw["message"] : raw;

        Message message;
        message.role = role_from_string(string_field(msg, "role").value_or("assistant"));

        if (auto id = string_field(msg, "id")) {
            message.id = *id;
        } else if (auto run_id = string_field(raw, "runId")) {
            message.id = *run_id;
        } else {
            message.id = generate_id("history-");
        }

        if (msg.contains("content")) {
            auto extracted = extract_content(msg["content"]);
            message.content = std::move(extracted.text);
            message.thinking = std::move(extracted.thinking);
        }

        // Top-level thinking field when no thinking blocks were present
        if (!message.thinking.has_value()) {
            message.thinking = string_field(msg, "thinking");
        }

        message.timestamp = timestamp_of(raw);

        return message;
    }

    /// Timestamp from `timestamp` or `ts`, inner message first, then the wrapper.
    static std::optional<std::string> timestamp_of(const nlohmann::json& raw) {
        if (!raw.is_object()) {
            return std::nullopt;
        }
        const nlohmann::json& msg =
            (raw.contains("message") && raw["message"].is_object()) ? raw["message"] : raw;

        if (auto ts = string_field(msg, "timestamp")) return ts;
        if (auto ts = string_field(raw, "timestamp")) return ts;
        if (auto ts = string_field(msg, "ts")) return ts;
        return string_field(raw, "ts");
    }

    static std::optional<std::string> string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object()) {
            return std::nullopt;
        }
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    static std::string generate_id(const std::string& prefix) {
        thread_local boost::uuids::random_generator generator;
        return prefix + boost::uuids::to_string(generator());
    }
};

} // namespace streaming
} // namespace clawlink
