#pragma once

/**
 * @file clawlink.hpp
 * @brief Main convenience header for the clawlink gateway client
 *
 * Include this single header to get access to all public clawlink APIs.
 *
 * clawlink is a C++17 client for an assistant gateway that speaks JSON
 * frames over a WebSocket: request/response RPC, server-pushed events, a
 * challenge/connect/hello-ok handshake, and two streaming channels that are
 * merged into one transcript.
 *
 * Quick Start:
 * @code
 * #include <clawlink/clawlink.hpp>
 *
 * int main() {
 *     clawlink::Config config;
 *     config.url = "wss://gateway.example:18789";
 *     config.token = "secret";
 *
 *     auto connection = clawlink::Connection::create(config);
 *     if (!connection) {
 *         std::cerr << "Error: " << connection.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     if (auto ok = (*connection)->connect(); !ok) {
 *         std::cerr << clawlink::describe(ok.error()) << std::endl;
 *         return 1;
 *     }
 *
 *     clawlink::ChatSession chat(**connection, "main");
 *     chat.load_history();
 *     chat.send_message("Hello!");
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - clawlink::Connection: state machine, handshake and RPC
 * - clawlink::ChatSession: transcript, history and streamed replies for one session
 * - clawlink::protocol::FrameCodec: wire frame encoding/decoding
 * - clawlink::protocol::RequestCorrelator: request id to future routing with deadlines
 * - clawlink::protocol::EventDispatcher: event fan-out to keyed listeners
 * - clawlink::streaming::StreamReconciler: merges the chat and agent channels
 *
 * Thread Safety:
 * - The transport owns one read thread; events and responses arrive there
 * - send_request() is thread-safe and returns std::future
 * - Event listeners and stream callbacks execute on the read thread
 */

// Core types
#include "types.hpp"

// Protocol
#include "protocol/types.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/request_correlator.hpp"
#include "protocol/event_dispatcher.hpp"

// Transport interface (for custom implementations and testing)
#include "transport/itransport.hpp"
#include "transport/websocket_transport.hpp"

// Streaming
#include "streaming/heartbeat_filter.hpp"
#include "streaming/message_parser.hpp"
#include "streaming/stream_reconciler.hpp"

// Public API
#include "connection.hpp"
#include "chat_session.hpp"

/**
 * @namespace clawlink
 * @brief Main namespace for the clawlink library
 *
 * Internal building blocks live in nested namespaces:
 * - clawlink::protocol: frames, codec, correlation, dispatch
 * - clawlink::transport: transport interface and WebSocket implementation
 * - clawlink::streaming: message parsing, heartbeat filtering, reconciliation
 */
