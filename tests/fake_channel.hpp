#pragma once

#include "tether/channel.hpp"
#include <boost/asio.hpp>
#include <vector>

namespace tether {
namespace test {

// In-memory channel. Sends complete on the io_context; a connected peer
// receives each unit, in order, as it completes.
class FakeChannel : public Channel {
public:
    explicit FakeChannel(boost::asio::io_context& io) : io_(io) {}

    void connect(FakeChannel& peer) { peer_ = &peer; }

    void send(TransportMessage message, SendHandler handler) override {
        sent.push_back(message);
        boost::asio::post(io_, [this, message = std::move(message), handler = std::move(handler)]() mutable {
            if (closed_) {
                if (handler) handler(boost::asio::error::operation_aborted);
                return;
            }
            if (fail_sends_with) {
                if (handler) handler(fail_sends_with);
                return;
            }
            if (peer_) peer_->deliver(std::move(message));
            if (handler) handler({});
        });
    }

    void set_receive_handler(ReceiveHandler handler) override { on_receive_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) override { on_close_ = std::move(handler); }

    void close() override { close_with(boost::asio::error::operation_aborted); }

    // Ends the channel as if for the given cause (eof: the peer went away)
    void close_with(const boost::system::error_code& cause) {
        if (closed_) return;
        closed_ = true;
        if (on_close_) on_close_(cause);
    }

    bool is_open() const override { return !closed_; }

    void deliver(TransportMessage message) {
        if (on_receive_) on_receive_(std::move(message));
    }

    std::vector<TransportMessage> sent;
    // Completes every send with this error instead of delivering
    boost::system::error_code fail_sends_with;

private:
    boost::asio::io_context& io_;
    FakeChannel* peer_ = nullptr;
    ReceiveHandler on_receive_;
    CloseHandler on_close_;
    bool closed_ = false;
};

} // namespace test
} // namespace tether
