#pragma once

#include "tether/channel.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

namespace tether {

namespace wire {
class Frame;
}

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Channel over a mutually authenticated TLS stream. Each unit is a
// length-prefixed wire::Frame. The socket's executor must be a strand.
class SecureChannel : public Channel, public std::enable_shared_from_this<SecureChannel> {
public:
    enum class Type { CLIENT, SERVER };

    using OpenHandler = std::function<void(const boost::system::error_code&)>;

    static constexpr std::size_t MAX_FRAME_SIZE = 1024 * 1024;
    static constexpr uint32_t PROTOCOL_VERSION = 1;

    SecureChannel(tcp::socket socket, ssl::context& ctx, Type type,
                  std::string session_id, std::string remote_fingerprint);
    ~SecureChannel() override;

    // TLS handshake, fingerprint check and Hello exchange. The handler runs
    // once: success when the remote Hello matches, otherwise the cause.
    void start(OpenHandler on_open);

    void send(TransportMessage message, SendHandler handler) override;
    void set_receive_handler(ReceiveHandler handler) override;
    void set_close_handler(CloseHandler handler) override;
    void close() override;
    bool is_open() const override { return open_; }

    ssl::stream<tcp::socket>& get_socket() { return socket_; }

private:
    struct PendingWrite {
        std::shared_ptr<std::string> bytes;
        SendHandler handler;
    };

    bool verify_certificate(bool preverified, ssl::verify_context& ctx);
    void do_handshake();
    void do_read_header();
    void do_read_body(std::size_t length);
    void handle_frame(wire::Frame& frame);
    void deliver(TransportMessage message);
    void enqueue(std::shared_ptr<std::string> bytes, SendHandler handler);
    void do_write();
    void stop(const boost::system::error_code& cause);
    void finish();

    ssl::stream<tcp::socket> socket_;
    boost::asio::steady_timer linger_timer_;
    Type type_;
    std::string session_id_;
    std::string remote_fingerprint_;
    bool fingerprint_rejected_ = false;

    OpenHandler on_open_;
    ReceiveHandler on_receive_;
    CloseHandler on_close_;
    boost::system::error_code close_cause_;

    std::array<unsigned char, 4> header_{};
    std::string read_buffer_;
    std::deque<TransportMessage> backlog_;
    std::deque<PendingWrite> write_queue_;

    bool hello_received_ = false;
    bool stopped_ = false;
    std::atomic<bool> open_{false};
};

} // namespace tether
