#pragma once

#include "types.hpp"
#include "protocol/event_dispatcher.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/request_correlator.hpp"
#include "protocol/types.hpp"
#include "transport/itransport.hpp"
#include "transport/websocket_transport.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace clawlink {

/**
 * @brief Authenticated gateway connection: state machine, handshake and RPC.
 *
 * Lifecycle:
 *   Disconnected -> Connecting -> Connected
 *   Connecting/Connected -> Error(reason)
 *   any -> Disconnected (explicit disconnect)
 *
 * connect() opens the transport and runs the handshake:
 *   1. wait (polled) for the server's `connect.challenge` event
 *   2. send `connect` with protocol bounds, client descriptor and credential
 *   3. require `ok` and a `hello-ok` payload
 * Ordinary requests are refused with NotConnected until step 3 succeeds,
 * even though the socket is already open during the handshake.
 *
 * Each connect() builds a fresh transport and request correlator (new
 * pending table, ids restart at 1). The event listener registry belongs to
 * the Connection and survives disconnect/reconnect.
 *
 * Threading: connect()/reconnect() block the calling thread. send_request()
 * may be called from any thread. Inbound frames are decoded and routed on
 * the transport read thread; event listeners run there and must not block.
 */
class Connection {
public:
    using TransportFactory = std::function<std::shared_ptr<transport::ITransport>()>;
    using StateHandler = std::function<void(const ConnectionState&)>;
    using EventHandler = protocol::EventDispatcher::EventHandler;
    using ResponseFuture = std::future<Expected<protocol::ResponseFrame>>;

    /**
     * @brief Factory method: validates configuration; does NOT connect.
     *
     * @param config Connection configuration
     * @param factory Transport factory (tests inject a mock); a WebSocket
     *        transport for config.url when null
     */
    static Expected<std::unique_ptr<Connection>> create(const Config& config,
                                                        TransportFactory factory = nullptr) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        if (!factory) {
            transport::WebSocketTransport::Config ws_config;
            ws_config.url = config.url;
            ws_config.verify_peer = config.verify_tls_peer;
            ws_config.user_agent = config.client.display_name + "/" + config.client.version;
            factory = [ws_config]() {
                return std::make_shared<transport::WebSocketTransport>(ws_config);
            };
        }

        return std::unique_ptr<Connection>(new Connection(config, std::move(factory)));
    }

    ~Connection() {
        ++generation_;
        auto link = take_link();
        close_link(link, "Connection destroyed");
    }

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the transport and authenticate.
     *
     * On failure the state becomes Error(reason) and the partially-opened
     * transport is closed.
     */
    Expected<void> connect() {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);

        auto current = state();
        if (current.status == ConnectionStatus::Connected) {
            return tl::unexpected(Error{ErrorCode::ConnectionFailed, "Already connected"});
        }

        // Drop whatever an earlier failed or lost connection left behind
        close_link(take_link(), "Reconnecting");

        const uint64_t generation = ++generation_;
        set_state(ConnectionState::connecting());
        spdlog::info("[clawlink] connecting to {}", config_.url);

        auto transport = transport_factory_();
        if (!transport) {
            return fail_connect(generation, Error{ErrorCode::ConnectionFailed, "Transport factory returned null"});
        }
        auto correlator = std::make_shared<protocol::RequestCorrelator>(config_.request_timeout);

        // The challenge listener goes in before the socket opens so an early
        // challenge cannot be missed; it is removed whatever the outcome.
        auto challenge_received = std::make_shared<std::atomic<bool>>(false);
        dispatcher_.add_listener(kChallengeListenerId,
            [challenge_received](const std::string& name, const nlohmann::json&) {
                if (name == protocol::events::kConnectChallenge) {
                    challenge_received->store(true);
                }
            });
        struct ListenerGuard {
            protocol::EventDispatcher& dispatcher;
            ~ListenerGuard() { dispatcher.remove_listener(kChallengeListenerId); }
        } guard{dispatcher_};

        transport->set_receive_callback([this, correlator](const std::string& raw) {
            handle_frame(raw, *correlator);
        });
        transport->set_close_callback([this, generation, correlator](const std::string& reason) {
            handle_transport_closed(generation, *correlator, reason);
        });

        {
            std::lock_guard<std::mutex> lock(link_mutex_);
            link_ = Link{transport, correlator};
        }

        auto opened = transport->connect();
        if (!opened) {
            return fail_connect(generation, Error{
                ErrorCode::ConnectionFailed, opened.error().message, opened.error().context});
        }

        auto handshake = perform_handshake(generation, *transport, *correlator, *challenge_received);
        if (!handshake) {
            return fail_connect(generation, handshake.error());
        }

        if (generation != generation_.load()) {
            return tl::unexpected(Error{ErrorCode::NotConnected, "Disconnected during handshake"});
        }

        set_state(ConnectionState::connected());
        spdlog::info("[clawlink] connected to {}", config_.url);
        return {};
    }

    /**
     * @brief Close the transport and fail every pending request with NotConnected.
     *
     * Event listeners are kept; their lifecycle belongs to the caller.
     */
    void disconnect() {
        ++generation_;
        close_link(take_link(), "Not connected to server");
        set_state(ConnectionState::disconnected());
    }

    /**
     * @brief Connect again after an error or a lost connection.
     *
     * No-op when already connected or connecting. Otherwise retries connect()
     * up to max_reconnect_attempts times with linearly growing backoff.
     */
    Expected<void> reconnect() {
        auto current = state();
        if (current.status == ConnectionStatus::Connected ||
            current.status == ConnectionStatus::Connecting) {
            return {};
        }

        Expected<void> result = tl::unexpected(Error{ErrorCode::ConnectionFailed, "No reconnect attempt made"});
        for (int attempt = 1; attempt <= config_.max_reconnect_attempts; ++attempt) {
            spdlog::info("[clawlink] reconnect attempt {}/{}", attempt, config_.max_reconnect_attempts);
            result = connect();
            if (result) {
                return result;
            }
            if (attempt < config_.max_reconnect_attempts) {
                std::this_thread::sleep_for(config_.reconnect_backoff * attempt);
            }
        }
        return result;
    }

    // ========================================================================
    // Requests
    // ========================================================================

    /**
     * @brief Send a request and return a future for its response.
     *
     * The future resolves exactly once: with the response frame (which may
     * carry ok=false), RequestTimeout, or NotConnected.
     */
    ResponseFuture send_request(const std::string& method,
                                const nlohmann::json& params = nlohmann::json::object(),
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        if (!is_connected()) {
            return not_connected();
        }

        auto link = current_link();
        if (!link.transport || !link.correlator) {
            return not_connected();
        }

        return send_on(*link.transport, *link.correlator, method, params, timeout);
    }

    /**
     * @brief Blocking request returning the raw payload (any JSON kind).
     *
     * ok=false becomes ServerError with the server's message; an absent
     * payload becomes an empty object.
     */
    Expected<nlohmann::json> request_payload(const std::string& method,
                                             const nlohmann::json& params = nlohmann::json::object()) {
        auto result = send_request(method, params).get();
        if (!result) {
            return tl::unexpected(result.error());
        }
        if (!result->ok) {
            return tl::unexpected(Error{ErrorCode::ServerError, result->error_message("Unknown error"), method});
        }
        return result->payload.value_or(nlohmann::json::object());
    }

    /**
     * @brief As request_payload(), but a non-object payload becomes {}.
     */
    Expected<nlohmann::json> request_object(const std::string& method,
                                            const nlohmann::json& params = nlohmann::json::object()) {
        auto payload = request_payload(method, params);
        if (!payload) {
            return payload;
        }
        if (!payload->is_object()) {
            return nlohmann::json::object();
        }
        return payload;
    }

    // ========================================================================
    // Events and state
    // ========================================================================

    void set_state_handler(StateHandler handler) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_handler_ = std::move(handler);
    }

    void set_event_handler(EventHandler handler) {
        dispatcher_.set_primary_handler(std::move(handler));
    }

    std::string add_event_listener(const std::string& id, EventHandler handler) {
        return dispatcher_.add_listener(id, std::move(handler));
    }

    void remove_event_listener(const std::string& id) {
        dispatcher_.remove_listener(id);
    }

    ConnectionState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_.is_connected();
    }

    size_t pending_count() const {
        auto link = current_link();
        return link.correlator ? link.correlator->pending_count() : 0;
    }

    const Config& config() const { return config_; }
    protocol::EventDispatcher& dispatcher() { return dispatcher_; }

    static constexpr const char* kChallengeListenerId = "clawlink.connect.challenge";

private:
    struct Link {
        std::shared_ptr<transport::ITransport> transport;
        std::shared_ptr<protocol::RequestCorrelator> correlator;
    };

    Connection(Config config, TransportFactory factory)
        : config_(std::move(config))
        , transport_factory_(std::move(factory)) {}

    Expected<void> perform_handshake(uint64_t generation,
                                     transport::ITransport& transport,
                                     protocol::RequestCorrelator& correlator,
                                     const std::atomic<bool>& challenge_received) {
        // Step 1: the challenge is a side-effecting event, not a response, so poll
        const auto deadline = std::chrono::steady_clock::now() + config_.challenge_timeout;
        while (!challenge_received.load()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            if (generation != generation_.load()) {
                return tl::unexpected(Error{ErrorCode::NotConnected, "Disconnected during handshake"});
            }
            if (!transport.is_connected()) {
                return tl::unexpected(Error{ErrorCode::ConnectionFailed, "Connection lost"});
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(config_.challenge_poll_interval, remaining));
        }

        if (!challenge_received.load()) {
            spdlog::warn("[clawlink] no connect.challenge within {} ms", config_.challenge_timeout.count());
            return tl::unexpected(Error{ErrorCode::ConnectionFailed, "Server did not send challenge"});
        }

        // Step 2: connect request, sent before the connection counts as connected
        auto result = send_on(transport, correlator, protocol::methods::kConnect, build_connect_params()).get();
        if (!result) {
            if (result.error().code == ErrorCode::RequestTimeout) {
                return tl::unexpected(Error{ErrorCode::AuthenticationFailed,
                                            result.error().message, std::string(protocol::methods::kConnect)});
            }
            return tl::unexpected(result.error());
        }

        // Step 3: hello-ok
        if (!result->ok) {
            auto message = result->error_message("Authentication failed");
            spdlog::warn("[clawlink] handshake rejected: {}", message);
            return tl::unexpected(Error{ErrorCode::AuthenticationFailed, message});
        }

        std::string type = "(none)";
        if (result->payload && result->payload->is_object()) {
            auto it = result->payload->find("type");
            if (it != result->payload->end() && it->is_string()) {
                type = it->get<std::string>();
            }
        }
        if (type != "hello-ok") {
            spdlog::warn("[clawlink] handshake returned unexpected payload type: {}", type);
            return tl::unexpected(Error{ErrorCode::AuthenticationFailed, "Unexpected response type: " + type});
        }

        return {};
    }

    nlohmann::json build_connect_params() const {
        nlohmann::json auth = nlohmann::json::object();
        if (auto credential = config_.auth_credential()) {
            auth[credential->first] = credential->second;
        }

        return {
            {"minProtocol", config_.min_protocol},
            {"maxProtocol", config_.max_protocol},
            {"role", config_.role},
            {"client", {
                {"id", config_.client.id},
                {"displayName", config_.client.display_name},
                {"version", config_.client.version},
                {"platform", config_.client.platform},
                {"mode", config_.client.mode}
            }},
            {"auth", auth}
        };
    }

    ResponseFuture send_on(transport::ITransport& transport,
                           protocol::RequestCorrelator& correlator,
                           const std::string& method,
                           const nlohmann::json& params,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        // Register before writing so an immediate response finds its entry
        auto [id, future] = correlator.create_pending_request(method, timeout);

        protocol::RequestFrame frame;
        frame.id = id;
        frame.method = method;
        frame.params = params;

        auto sent = transport.send(protocol::FrameCodec::encode_request(frame));
        if (!sent) {
            spdlog::warn("[clawlink] failed to send {} (id={}): {}", method, id, sent.error().message);
            correlator.fail(id, Error{ErrorCode::NotConnected, sent.error().message, method});
        }

        return std::move(future);
    }

    void handle_frame(const std::string& raw, protocol::RequestCorrelator& correlator) {
        auto decoded = protocol::FrameCodec::decode(raw);

        if (decoded.is_response()) {
            correlator.resolve(*decoded.response);
        } else if (decoded.is_event()) {
            const auto& event = *decoded.event;
            const nlohmann::json payload =
                (event.payload && event.payload->is_object()) ? *event.payload : nlohmann::json::object();
            dispatcher_.dispatch(event.event, payload);
        } else {
            spdlog::debug("[clawlink] dropping frame: {}", decoded.error_message.value_or("unknown"));
        }
    }

    void handle_transport_closed(uint64_t generation, protocol::RequestCorrelator& correlator,
                                 const std::string& reason) {
        if (generation != generation_.load()) {
            return;
        }
        spdlog::warn("[clawlink] transport closed: {}", reason);
        correlator.cancel_all("Not connected to server");

        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_.status == ConnectionStatus::Connected) {
            lock.unlock();
            set_state(ConnectionState::error("Connection lost"));
        }
    }

    Expected<void> fail_connect(uint64_t generation, Error error) {
        spdlog::warn("[clawlink] connect failed: {}", error.to_string());
        if (generation == generation_.load()) {
            close_link(take_link(), "Not connected to server");
            set_state(ConnectionState::error(error.message));
        }
        return tl::unexpected(std::move(error));
    }

    Link take_link() {
        std::lock_guard<std::mutex> lock(link_mutex_);
        Link link = std::move(link_);
        link_ = Link{};
        return link;
    }

    Link current_link() const {
        std::lock_guard<std::mutex> lock(link_mutex_);
        return link_;
    }

    static void close_link(const Link& link, const std::string& reason) {
        if (link.correlator) {
            link.correlator->cancel_all(reason);
        }
        if (link.transport) {
            link.transport->disconnect();
        }
    }

    void set_state(ConnectionState next) {
        StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == next) {
                return;
            }
            state_ = next;
            handler = state_handler_;
        }
        spdlog::debug("[clawlink] state -> {}", next.display_text());
        if (handler) {
            handler(next);
        }
    }

    static ResponseFuture not_connected() {
        std::promise<Expected<protocol::ResponseFrame>> promise;
        promise.set_value(tl::unexpected(Error{ErrorCode::NotConnected, "Not connected to server"}));
        return promise.get_future();
    }

    const Config config_;
    const TransportFactory transport_factory_;
    protocol::EventDispatcher dispatcher_;

    std::mutex connect_mutex_;             ///< Serializes connect() calls
    std::atomic<uint64_t> generation_{0};  ///< Bumped per connect()/disconnect(); stale callbacks compare against it

    mutable std::mutex link_mutex_;
    Link link_;

    mutable std::mutex state_mutex_;
    ConnectionState state_;
    StateHandler state_handler_;
};

} // namespace clawlink
