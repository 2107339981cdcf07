#include "clawlink/transport/websocket_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace clawlink {
namespace transport {

// ============================================================================
// Endpoint parsing
// ============================================================================

Expected<WebSocketEndpoint> WebSocketEndpoint::parse(const std::string& url) {
    WebSocketEndpoint endpoint;
    std::string rest;

    if (url.rfind("wss://", 0) == 0) {
        endpoint.tls = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        return tl::unexpected(Error{ErrorCode::InvalidUrl, "URL scheme must be ws:// or wss://", url});
    }

    auto slash = rest.find('/');
    std::string hostport = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
    }

    // Bracketed IPv6 literal: [::1]:18789
    std::string::size_type colon = std::string::npos;
    if (!hostport.empty() && hostport.front() == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            return tl::unexpected(Error{ErrorCode::InvalidUrl, "Unterminated IPv6 host", url});
        }
        endpoint.host = hostport.substr(1, close - 1);
        if (close + 1 < hostport.size() && hostport[close + 1] == ':') {
            colon = close + 1;
        }
    } else {
        colon = hostport.rfind(':');
        endpoint.host = hostport.substr(0, colon);
    }

    if (colon != std::string::npos) {
        endpoint.port = hostport.substr(colon + 1);
    }
    if (endpoint.port.empty()) {
        endpoint.port = endpoint.tls ? "443" : "80";
    }

    if (endpoint.host.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidUrl, "URL has no host", url});
    }

    return endpoint;
}

// ============================================================================
// Stream state
// ============================================================================

struct WebSocketTransport::Stream {
    net::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};
    std::unique_ptr<websocket::stream<tcp::socket>> ws;
    std::unique_ptr<websocket::stream<beast::ssl_stream<tcp::socket>>> wss;

    tcp::socket& socket() {
        if (wss) {
            return beast::get_lowest_layer(*wss);
        }
        return beast::get_lowest_layer(*ws);
    }

    template<typename Fn>
    auto visit(Fn&& fn) {
        if (wss) {
            return fn(*wss);
        }
        return fn(*ws);
    }
};

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(Config config)
    : config_(std::move(config)) {}

WebSocketTransport::~WebSocketTransport() {
    disconnect();
}

Expected<void> WebSocketTransport::connect() {
    if (connected_.load()) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Already connected"});
    }

    auto endpoint = WebSocketEndpoint::parse(config_.url);
    if (!endpoint) {
        return tl::unexpected(endpoint.error());
    }

    auto stream = std::make_unique<Stream>();
    const std::string host_header = endpoint->host + ":" + endpoint->port;
    const std::string user_agent = config_.user_agent;
    auto decorate = [user_agent](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, user_agent);
    };

    spdlog::info("[clawlink] connecting to {} (host={} port={} target={} tls={})",
                 config_.url, endpoint->host, endpoint->port, endpoint->target, endpoint->tls);

    try {
        tcp::resolver resolver(stream->ioc);
        auto const results = resolver.resolve(endpoint->host, endpoint->port);

        if (endpoint->tls) {
            if (config_.verify_peer) {
                stream->ssl_ctx.set_default_verify_paths();
                stream->ssl_ctx.set_verify_mode(ssl::verify_peer);
            } else {
                stream->ssl_ctx.set_verify_mode(ssl::verify_none);
            }

            stream->wss = std::make_unique<websocket::stream<beast::ssl_stream<tcp::socket>>>(
                stream->ioc, stream->ssl_ctx);
            net::connect(beast::get_lowest_layer(*stream->wss), results.begin(), results.end());

            // SNI
            if (!SSL_set_tlsext_host_name(stream->wss->next_layer().native_handle(), endpoint->host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            stream->wss->next_layer().handshake(ssl::stream_base::client);

            stream->wss->set_option(websocket::stream_base::decorator(decorate));
            stream->wss->text(true);
            stream->wss->handshake(host_header, endpoint->target);
        } else {
            stream->ws = std::make_unique<websocket::stream<tcp::socket>>(stream->ioc);
            net::connect(stream->ws->next_layer(), results.begin(), results.end());

            stream->ws->set_option(websocket::stream_base::decorator(decorate));
            stream->ws->text(true);
            stream->ws->handshake(host_header, endpoint->target);
        }
    } catch (const beast::system_error& e) {
        spdlog::error("[clawlink] websocket connect failed ({}): {}", config_.url, e.code().message());
        return tl::unexpected(Error{
            ErrorCode::ConnectionFailed,
            "WebSocket connect failed: " + e.code().message(),
            config_.url
        });
    } catch (const std::exception& e) {
        spdlog::error("[clawlink] websocket connect failed ({}): {}", config_.url, e.what());
        return tl::unexpected(Error{
            ErrorCode::ConnectionFailed,
            std::string("WebSocket connect failed: ") + e.what(),
            config_.url
        });
    }

    stream_ = std::move(stream);
    closing_.store(false);
    connected_.store(true);

    try {
        // Null when not owned by a shared_ptr
        std::shared_ptr<WebSocketTransport> self = weak_from_this().lock();
        read_thread_ = std::thread([this, self]() {
            read_loop();
        });
    } catch (const std::system_error& e) {
        connected_.store(false);
        boost::system::error_code ec;
        stream_->socket().close(ec);
        stream_.reset();
        return tl::unexpected(Error{
            ErrorCode::TransportFailed,
            std::string("Failed to start read thread: ") + e.what()
        });
    }

    spdlog::info("[clawlink] websocket connected: {}", config_.url);
    return {};
}

void WebSocketTransport::disconnect() {
    if (!stream_) {
        return;
    }

    // Signal the read loop that the coming socket error is expected
    closing_.store(true);
    connected_.store(false);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        boost::system::error_code ec;
        stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    if (read_thread_.joinable()) {
        if (read_thread_.get_id() == std::this_thread::get_id()) {
            // Called from a receive/close callback: the loop exits on return
            read_thread_.detach();
        } else {
            read_thread_.join();
        }
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    boost::system::error_code ec;
    stream_->socket().close(ec);
    stream_.reset();
    spdlog::debug("[clawlink] websocket closed: {}", config_.url);
}

bool WebSocketTransport::is_connected() const {
    return connected_.load();
}

Expected<void> WebSocketTransport::send(const std::string& message) {
    if (!connected_.load()) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "Not connected"});
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!stream_) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "WebSocket stream not available"});
    }

    beast::error_code ec;
    stream_->visit([&](auto& ws) {
        ws.write(net::buffer(message), ec);
    });

    if (ec) {
        spdlog::warn("[clawlink] websocket write failed: {}", ec.message());
        return tl::unexpected(Error{ErrorCode::TransportFailed, "WebSocket write failed: " + ec.message()});
    }

    spdlog::trace("[clawlink] tx bytes={}", message.size());
    return {};
}

void WebSocketTransport::set_receive_callback(ReceiveCallback callback) {
    receive_callback_ = std::move(callback);
}

void WebSocketTransport::set_close_callback(CloseCallback callback) {
    close_callback_ = std::move(callback);
}

void WebSocketTransport::read_loop() {
    beast::flat_buffer buffer;
    std::string reason;

    try {
        while (!closing_.load()) {
            stream_->visit([&](auto& ws) {
                ws.read(buffer);
            });

            std::string frame = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            spdlog::trace("[clawlink] rx bytes={}", frame.size());

            if (receive_callback_) {
                receive_callback_(frame);
            }
        }
    } catch (const beast::system_error& e) {
        if (e.code() == websocket::error::closed) {
            reason = "Connection closed by server";
        } else {
            reason = e.code().message();
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }

    // Anything but an explicit disconnect() is an unexpected close
    if (!closing_.load() && connected_.exchange(false)) {
        spdlog::warn("[clawlink] websocket read loop ended: {}", reason);
        if (close_callback_) {
            close_callback_(reason);
        }
    }
}

} // namespace transport
} // namespace clawlink
