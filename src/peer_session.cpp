#include "tether/peer_session.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <iostream>

namespace tether {

const char* to_string(PeerSession::State state) {
    switch (state) {
    case PeerSession::State::Created: return "created";
    case PeerSession::State::Handshaking: return "handshaking";
    case PeerSession::State::Open: return "open";
    case PeerSession::State::Closed: return "closed";
    }
    return "unknown";
}

PeerSession::PeerSession(boost::asio::io_context& io_context, const Config& config,
                         Transport& transport, DescriptorExchange& exchange,
                         LineSource& input, std::ostream& out)
    : io_context_(io_context),
      config_(config),
      transport_(transport),
      input_(input),
      out_(out),
      signals_(io_context, SIGINT, SIGTERM),
      handshake_(transport, exchange, config.role),
      receiver_(config.download_dir, out) {}

void PeerSession::start() {
    signals_.async_wait([this](const boost::system::error_code& ec, int /*signo*/) {
        if (!ec) {
            std::cout << "\n[Session] Interrupted, closing." << std::endl;
            close();
        }
    });

    state_ = State::Handshaking;
    handshake_.start([this](const boost::system::error_code& ec, std::shared_ptr<Channel> channel) {
        on_open(ec, std::move(channel));
    });
}

void PeerSession::on_open(const boost::system::error_code& ec, std::shared_ptr<Channel> channel) {
    if (state_ == State::Closed) {
        if (channel) {
            channel->close();
        }
        return;
    }
    if (ec) {
        handshake_failed_ = true;
        std::cerr << "[Session] Handshake failed: " << ec.message() << std::endl;
        shutdown();
        return;
    }

    state_ = State::Open;
    channel_ = std::move(channel);
    framer_ = std::make_unique<ChannelFramer>(channel_, config_.verbose);
    chat_ = std::make_unique<ChatSession>(*framer_, out_);
    sender_ = std::make_unique<FileSender>(*framer_, io_context_.get_executor(),
                                           config_.chunk_size, out_);

    ChannelFramer::Routes routes;
    routes.on_control = [this](const ControlMessage& message) { receiver_.on_announce(message); };
    routes.on_chunk = [this](const ChunkUnit& chunk) { receiver_.on_chunk(chunk); };
    routes.on_chat = [this](const ChatUnit& chat) { chat_->on_chat(chat); };
    framer_->attach(std::move(routes));

    channel_->set_close_handler([this](const boost::system::error_code& ec) {
        // Close handlers run on the channel strand; hop back to the session
        boost::asio::post(io_context_, [this, ec]() { on_channel_closed(ec); });
    });

    out_ << "Data channel is open! Type to chat, '/send <path>' to send a file, 'bye' to leave."
                   << std::endl;

    if (!config_.greeting.empty()) {
        chat_->send_line(config_.greeting);
    }
    if (config_.file_to_send) {
        sender_->send_file(*config_.file_to_send);
    }
    read_input();
}

void PeerSession::read_input() {
    input_.async_read_line([this](const boost::system::error_code& ec, std::string line) {
        if (state_ != State::Open) {
            return;
        }
        if (ec) {
            // Input closed: keep the session up for the peer and transfers
            if (ec != boost::asio::error::operation_aborted) {
                std::cout << "[Session] Console input closed; press Ctrl+C to stop." << std::endl;
            }
            return;
        }
        handle_line(line);
        if (!leaving_) {
            read_input();
        }
    });
}

void PeerSession::handle_line(const std::string& line) {
    if (line.empty()) {
        return;
    }
    if (boost::algorithm::iequals(line, "bye")) {
        leave();
        return;
    }
    if (line == "/send" || boost::algorithm::starts_with(line, "/send ")) {
        const std::string path = boost::algorithm::trim_copy(line.substr(5));
        if (path.empty()) {
            out_ << "Usage: /send <path>" << std::endl;
            return;
        }
        sender_->send_file(path);
        return;
    }
    chat_->send_line(line);
}

void PeerSession::leave() {
    leaving_ = true;
    out_ << "Ending chat. Goodbye!" << std::endl;
    sender_->cancel();
    framer_->send_chat(FAREWELL_TEXT, [this](const boost::system::error_code& /*ec*/) {
        // Written or not, the channel goes away now
        channel_->close();
    });
}

void PeerSession::on_channel_closed(const boost::system::error_code& ec) {
    if (state_ == State::Closed) {
        return;
    }
    if (ec == boost::asio::error::operation_aborted) {
        std::cout << "[Session] Channel closed." << std::endl;
    } else if (ec == boost::asio::error::eof || ec == ssl::error::stream_truncated) {
        std::cout << "[Session] Peer closed the channel." << std::endl;
    } else {
        std::cerr << "[Session] Channel lost: " << ec.message() << std::endl;
    }
    shutdown();
}

void PeerSession::close() {
    if (state_ == State::Closed) {
        return;
    }
    if (channel_) {
        // The close handler finishes the shutdown
        channel_->close();
        return;
    }
    shutdown();
}

void PeerSession::shutdown() {
    if (state_ == State::Closed) {
        return;
    }
    state_ = State::Closed;

    receiver_.abort();
    if (sender_) {
        sender_->cancel();
    }
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    input_.close();
    transport_.close();
}

} // namespace tether
