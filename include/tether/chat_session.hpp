#pragma once

#include "tether/channel_framer.hpp"
#include "tether/wire_unit.hpp"
#include <ostream>
#include <string>

namespace tether {

const char PEER_LABEL[] = "Peer: ";
const char FAREWELL_TEXT[] = "Peer has left the chat.";

// Longest chat line accepted from the operator, in bytes
const std::size_t MAX_CHAT_LENGTH = 64 * 1024;

class ChatSession {
public:
    using SendHandler = ChannelFramer::SendHandler;

    ChatSession(ChannelFramer& framer, std::ostream& out);

    // Sends one operator line. Returns false if nothing was sent: empty
    // lines, lines over MAX_CHAT_LENGTH, and lines that would read as a
    // control message on the far side. A line the channel fails to write is
    // reported on the output.
    bool send_line(const std::string& line, SendHandler handler = nullptr);

    // Prints an incoming chat unit with the peer label
    void on_chat(const ChatUnit& chat);

    // Lines written to the channel
    std::size_t sent() const { return sent_; }
    std::size_t received() const { return received_; }

private:
    ChannelFramer& framer_;
    std::ostream& out_;
    std::size_t sent_ = 0;
    std::size_t received_ = 0;
};

} // namespace tether
