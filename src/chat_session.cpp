#include "tether/chat_session.hpp"

namespace tether {

ChatSession::ChatSession(ChannelFramer& framer, std::ostream& out)
    : framer_(framer), out_(out) {}

bool ChatSession::send_line(const std::string& line, SendHandler handler) {
    if (line.empty()) {
        return false;
    }
    if (line.size() > MAX_CHAT_LENGTH) {
        out_ << "[Chat] Not sent: the line is " << line.size() << " bytes, the limit is "
             << MAX_CHAT_LENGTH << "." << std::endl;
        return false;
    }
    if (parse_control(line)) {
        out_ << "[Chat] Not sent: the peer would read this line as a file announcement." << std::endl;
        return false;
    }
    framer_.send_chat(line, [this, handler = std::move(handler)](const boost::system::error_code& ec) {
        if (ec) {
            out_ << "[Chat] Message not delivered: " << ec.message() << std::endl;
        } else {
            ++sent_;
        }
        if (handler) {
            handler(ec);
        }
    });
    return true;
}

void ChatSession::on_chat(const ChatUnit& chat) {
    ++received_;
    out_ << PEER_LABEL << chat.text << std::endl;
}

} // namespace tether
