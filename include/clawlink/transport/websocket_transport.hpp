#pragma once

#include "itransport.hpp"
#include "../types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clawlink {
namespace transport {

/**
 * @brief Parsed ws:// or wss:// endpoint.
 */
struct WebSocketEndpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target = "/";

    /// Default ports are 80 (ws) and 443 (wss); the target defaults to "/".
    static Expected<WebSocketEndpoint> parse(const std::string& url);
};

/**
 * @brief Gateway transport over a WebSocket (Boost.Beast), plain or TLS.
 *
 * Every outgoing message is sent as one text frame. A background read thread
 * delivers each inbound frame to the receive callback.
 *
 * Threading model:
 * - A background read thread continuously reads frames and invokes receive_callback
 * - send() is thread-safe (protected by write_mutex_)
 * - connect()/disconnect() are not thread-safe (called from the owning thread only)
 * - disconnect() may be called from inside a callback; when the transport is
 *   owned by a shared_ptr the read thread holds a reference until it exits, so
 *   a callback may also drop the last outside owner
 */
class WebSocketTransport : public ITransport,
                           public std::enable_shared_from_this<WebSocketTransport> {
public:
    struct Config {
        std::string url;
        bool verify_peer = false;  ///< Verify the server certificate chain (wss only)
        std::string user_agent = "clawlink/1.0";
    };

    explicit WebSocketTransport(Config config);
    ~WebSocketTransport() override;

    // Non-copyable, non-movable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;
    WebSocketTransport(WebSocketTransport&&) = delete;
    WebSocketTransport& operator=(WebSocketTransport&&) = delete;

    Expected<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;

    Expected<void> send(const std::string& message) override;

    void set_receive_callback(ReceiveCallback callback) override;
    void set_close_callback(CloseCallback callback) override;

private:
    struct Stream;  ///< Beast/Asio state, kept out of this header

    void read_loop();

    Config config_;
    std::unique_ptr<Stream> stream_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};
    std::thread read_thread_;
    std::mutex write_mutex_;  ///< Single writer on the socket
    ReceiveCallback receive_callback_;
    CloseCallback close_callback_;
};

} // namespace transport
} // namespace clawlink
