#pragma once

#include "tether/channel.hpp"
#include "tether/wire_unit.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace tether {

// Owns all traffic on the open channel: classifies inbound units and routes
// them, serializes outbound units in call order.
class ChannelFramer {
public:
    using SendHandler = Channel::SendHandler;

    struct Routes {
        std::function<void(const ControlMessage&)> on_control;
        std::function<void(const ChunkUnit&)> on_chunk;
        std::function<void(const ChatUnit&)> on_chat;
    };

    explicit ChannelFramer(std::shared_ptr<Channel> channel, bool verbose = false);

    // Installs the routes and starts taking units from the channel
    void attach(Routes routes);

    void send_control(const ControlMessage& message, SendHandler handler = nullptr);
    void send_chunk(std::vector<uint8_t> bytes, SendHandler handler = nullptr);
    void send_chat(const std::string& text, SendHandler handler = nullptr);

    void dispatch(TransportMessage message);

private:
    void send(const WireUnit& unit, SendHandler handler);

    std::shared_ptr<Channel> channel_;
    Routes routes_;
    bool verbose_;
};

} // namespace tether
