#include "tether/channel_framer.hpp"
#include <iostream>

namespace tether {

ChannelFramer::ChannelFramer(std::shared_ptr<Channel> channel, bool verbose)
    : channel_(std::move(channel)), verbose_(verbose) {}

void ChannelFramer::attach(Routes routes) {
    routes_ = std::move(routes);
    channel_->set_receive_handler([this](TransportMessage message) {
        dispatch(std::move(message));
    });
}

void ChannelFramer::dispatch(TransportMessage message) {
    WireUnit unit = classify(std::move(message));

    if (auto* chunk = std::get_if<ChunkUnit>(&unit)) {
        if (verbose_) {
            std::cout << "[Framer] <- chunk (" << chunk->bytes.size() << " bytes)" << std::endl;
        }
        if (routes_.on_chunk) {
            routes_.on_chunk(*chunk);
        }
    } else if (auto* control = std::get_if<ControlMessage>(&unit)) {
        if (verbose_) {
            std::cout << "[Framer] <- file-meta " << control->filename << " (" << control->size << " bytes)" << std::endl;
        }
        if (routes_.on_control) {
            routes_.on_control(*control);
        }
    } else if (auto* chat = std::get_if<ChatUnit>(&unit)) {
        if (verbose_) {
            std::cout << "[Framer] <- chat (" << chat->text.size() << " bytes)" << std::endl;
        }
        if (routes_.on_chat) {
            routes_.on_chat(*chat);
        }
    }
}

void ChannelFramer::send_control(const ControlMessage& message, SendHandler handler) {
    send(message, std::move(handler));
}

void ChannelFramer::send_chunk(std::vector<uint8_t> bytes, SendHandler handler) {
    send(ChunkUnit{std::move(bytes)}, std::move(handler));
}

void ChannelFramer::send_chat(const std::string& text, SendHandler handler) {
    send(ChatUnit{text}, std::move(handler));
}

void ChannelFramer::send(const WireUnit& unit, SendHandler handler) {
    if (verbose_) {
        std::cout << "[Framer] -> " << (std::holds_alternative<ChunkUnit>(unit) ? "chunk" :
                                        std::holds_alternative<ControlMessage>(unit) ? "file-meta" : "chat")
                  << std::endl;
    }
    channel_->send(to_transport(unit), std::move(handler));
}

} // namespace tether
