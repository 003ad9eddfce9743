#pragma once

#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace tether {

// One unit as delivered by the transport: binary or text, never re-typed
struct TransportMessage {
    enum class Kind { Binary, Text };

    Kind kind = Kind::Text;
    std::string data;

    static TransportMessage binary(std::string bytes) { return {Kind::Binary, std::move(bytes)}; }
    static TransportMessage text(std::string s) { return {Kind::Text, std::move(s)}; }

    bool is_binary() const { return kind == Kind::Binary; }
};

// Ordered, reliable, message-oriented channel between the two peers.
// Units are delivered in send order, whole, exactly once.
class Channel {
public:
    using SendHandler = std::function<void(const boost::system::error_code&)>;
    using ReceiveHandler = std::function<void(TransportMessage)>;
    using CloseHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~Channel() = default;

    // Safe from any thread. Units are written in call order; the handler
    // runs once the unit is on the wire, or with operation_aborted.
    virtual void send(TransportMessage message, SendHandler handler) = 0;

    // Handlers run on the channel's executor. Units that arrive before a
    // receive handler is set are held until one is.
    virtual void set_receive_handler(ReceiveHandler handler) = 0;
    virtual void set_close_handler(CloseHandler handler) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

} // namespace tether
