#pragma once

#include "../types.hpp"
#include <functional>
#include <string>

namespace clawlink {
namespace transport {

/**
 * @brief Abstract interface for a message-based duplex gateway transport.
 *
 * A transport carries whole JSON text frames; it knows nothing about the
 * frame envelope.
 *
 * Threading model:
 * - connect()/disconnect() called from the owning thread
 * - send() may be called from any thread (writes are serialized)
 * - receive callback invoked from the transport's single read thread, one
 *   frame at a time, in wire order
 * - close callback invoked from the read thread when the peer or the network
 *   ends the stream; never invoked for an explicit disconnect()
 */
class ITransport {
public:
    using ReceiveCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void(const std::string&)>;

    virtual ~ITransport() = default;

    virtual Expected<void> connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual Expected<void> send(const std::string& message) = 0;

    virtual void set_receive_callback(ReceiveCallback callback) = 0;
    virtual void set_close_callback(CloseCallback callback) = 0;
};

} // namespace transport
} // namespace clawlink
