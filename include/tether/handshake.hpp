#pragma once

#include "tether/channel.hpp"
#include "tether/session_descriptor.hpp"
#include "tether/transport.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>

namespace tether {

// Out-of-band path for descriptors: whatever is published on one side is
// supplied verbatim on the other
class DescriptorExchange {
public:
    using ReceiveHandler = std::function<void(const boost::system::error_code&, std::string)>;

    virtual ~DescriptorExchange() = default;

    virtual void publish(const SessionDescriptor& descriptor) = 0;
    virtual void async_receive(SessionDescriptor::Type expected, ReceiveHandler handler) = 0;
};

// Drives the offer/answer exchange until the transport reports the channel
// open. Exactly one descriptor is published and one consumed per role.
class HandshakeCoordinator {
public:
    using CompletionHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<Channel>)>;

    HandshakeCoordinator(Transport& transport, DescriptorExchange& exchange, Role role);

    // Handler runs once. No timeout is applied here.
    void start(CompletionHandler handler);

private:
    void on_remote_descriptor(const boost::system::error_code& ec, const std::string& text);
    void await_open();
    void fail(const boost::system::error_code& ec);

    Transport& transport_;
    DescriptorExchange& exchange_;
    Role role_;
    bool started_ = false;
    CompletionHandler handler_;
};

} // namespace tether
