#pragma once

#include "tether/channel_framer.hpp"
#include "tether/chat_session.hpp"
#include "tether/config.hpp"
#include "tether/file_transfer.hpp"
#include "tether/handshake.hpp"
#include "tether/line_source.hpp"
#include "tether/transport.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <ostream>
#include <string>

namespace tether {

// Session context owned by main: handshake first, then chat and file
// transfer over the one channel until either side leaves.
class PeerSession {
public:
    enum class State { Created, Handshaking, Open, Closed };

    // Descriptors travel over exchange, operator lines come from input and
    // everything meant for the operator goes to out
    PeerSession(boost::asio::io_context& io_context, const Config& config,
                Transport& transport, DescriptorExchange& exchange,
                LineSource& input, std::ostream& out);

    void start();
    void close();

    State state() const { return state_; }
    bool handshake_failed() const { return handshake_failed_; }

    FileReceiver& get_file_receiver() { return receiver_; }
    FileSender* get_file_sender() { return sender_.get(); }

private:
    void on_open(const boost::system::error_code& ec, std::shared_ptr<Channel> channel);
    void on_channel_closed(const boost::system::error_code& ec);
    void read_input();
    void handle_line(const std::string& line);
    void leave();
    void shutdown();

    boost::asio::io_context& io_context_;
    Config config_;
    Transport& transport_;
    LineSource& input_;
    std::ostream& out_;
    boost::asio::signal_set signals_;
    HandshakeCoordinator handshake_;

    State state_ = State::Created;
    bool handshake_failed_ = false;
    bool leaving_ = false;

    std::shared_ptr<Channel> channel_;
    std::unique_ptr<ChannelFramer> framer_;
    std::unique_ptr<ChatSession> chat_;
    std::unique_ptr<FileSender> sender_;
    FileReceiver receiver_;
};

const char* to_string(PeerSession::State state);

} // namespace tether
