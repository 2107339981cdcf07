#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace clawlink {
namespace protocol {

/**
 * @brief Codec for the gateway's three JSON frame kinds.
 *
 * Decoding inspects the `type` discriminator first and only then decodes the
 * full frame. Anything that is not a well-formed "res" or "event" frame is
 * reported as unknown; decode() never throws.
 * All methods are static and stateless.
 */
class FrameCodec {
public:
    // ========================================================================
    // Encoding
    // ========================================================================

    /// Empty or null params are omitted entirely: peers read a present
    /// `params` key as "may contain overrides".
    static std::string encode_request(const RequestFrame& request) {
        nlohmann::json j;
        j["type"] = "req";
        j["id"] = request.id;
        j["method"] = request.method;

        if (!request.params.is_null() && !request.params.empty()) {
            j["params"] = request.params;
        }

        return j.dump();
    }

    static std::string encode_response(const ResponseFrame& response) {
        nlohmann::json j;
        j["type"] = "res";
        j["id"] = response.id;
        j["ok"] = response.ok;

        if (response.payload.has_value()) {
            j["payload"] = *response.payload;
        }

        if (response.error.has_value()) {
            nlohmann::json err = nlohmann::json::object();
            if (response.error->code.has_value()) {
                err["code"] = *response.error->code;
            }
            if (response.error->message.has_value()) {
                err["message"] = *response.error->message;
            }
            if (response.error->details.has_value()) {
                err["details"] = *response.error->details;
            }
            j["error"] = err;
        }

        return j.dump();
    }

    static std::string encode_event(const EventFrame& event) {
        nlohmann::json j;
        j["type"] = "event";
        j["event"] = event.event;
        if (event.payload.has_value()) {
            j["payload"] = *event.payload;
        }
        return j.dump();
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    enum class FrameKind {
        Response,
        Event,
        Unknown
    };

    struct DecodeResult {
        FrameKind kind = FrameKind::Unknown;
        std::optional<ResponseFrame> response;
        std::optional<EventFrame> event;
        std::optional<std::string> error_message;  ///< Why the frame is unknown (for diagnostics)

        bool is_response() const { return kind == FrameKind::Response; }
        bool is_event() const { return kind == FrameKind::Event; }
        bool is_unknown() const { return kind == FrameKind::Unknown; }
    };

    static DecodeResult decode(const std::string& input) {
        DecodeResult result;

        nlohmann::json j = nlohmann::json::parse(input, nullptr, false);
        if (j.is_discarded()) {
            result.error_message = "JSON parse error";
            return result;
        }

        // Stage 1: discriminator only
        if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            result.error_message = "Frame has no string 'type' discriminator";
            return result;
        }
        const std::string type = j["type"].get<std::string>();

        // Stage 2: full decode by kind
        try {
            if (type == "res") {
                result.response = decode_response(j);
                result.kind = FrameKind::Response;
            } else if (type == "event") {
                result.event = decode_event(j);
                result.kind = FrameKind::Event;
            } else {
                result.error_message = "Unrecognized frame type: " + type;
            }
        } catch (const std::exception& e) {
            result.response.reset();
            result.event.reset();
            result.kind = FrameKind::Unknown;
            result.error_message = std::string("Malformed '") + type + "' frame: " + e.what();
        }

        return result;
    }

private:
    static ResponseFrame decode_response(const nlohmann::json& j) {
        ResponseFrame res;
        res.id = j.at("id").get<std::string>();
        res.ok = j.at("ok").get<bool>();

        if (j.contains("payload") && !j["payload"].is_null()) {
            res.payload = j["payload"];
        }

        if (j.contains("error") && !j["error"].is_null()) {
            const auto& err = j["error"];
            if (!err.is_object()) {
                throw std::invalid_argument("'error' must be an object");
            }
            ResponseError error;
            error.code = optional_field<int>(err, "code");
            error.message = optional_field<std::string>(err, "message");
            error.details = optional_field<std::string>(err, "details");
            res.error = std::move(error);
        }

        return res;
    }

    static EventFrame decode_event(const nlohmann::json& j) {
        EventFrame evt;
        evt.event = j.at("event").get<std::string>();
        if (j.contains("payload") && !j["payload"].is_null()) {
            evt.payload = j["payload"];
        }
        return evt;
    }

    // Absent or null yields nullopt; a present value of the wrong type throws.
    template<typename T>
    static std::optional<T> optional_field(const nlohmann::json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return std::nullopt;
        }
        return it->template get<T>();
    }
};

} // namespace protocol
} // namespace clawlink
