#include "tether/secure_channel.hpp"
#include "tether/errors.hpp"
#include "tether/identity.hpp"
#include "tether.pb.h"
#include <boost/algorithm/string/predicate.hpp>
#include <iostream>

namespace tether {

namespace {

const auto LINGER_TIME = std::chrono::seconds(2);

std::shared_ptr<std::string> encode_frame(const wire::Frame& frame) {
    std::string body;
    frame.SerializeToString(&body);

    auto bytes = std::make_shared<std::string>();
    bytes->reserve(4 + body.size());
    const auto len = static_cast<uint32_t>(body.size());
    bytes->push_back(static_cast<char>((len >> 24) & 0xff));
    bytes->push_back(static_cast<char>((len >> 16) & 0xff));
    bytes->push_back(static_cast<char>((len >> 8) & 0xff));
    bytes->push_back(static_cast<char>(len & 0xff));
    bytes->append(body);
    return bytes;
}

// A peer closing its socket shows up as eof or as a truncated TLS stream
bool is_remote_close(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == ssl::error::stream_truncated;
}

} // namespace

SecureChannel::SecureChannel(tcp::socket socket, ssl::context& ctx, Type type,
                             std::string session_id, std::string remote_fingerprint)
    : socket_(std::move(socket), ctx),
      linger_timer_(socket_.get_executor()),
      type_(type),
      session_id_(std::move(session_id)),
      remote_fingerprint_(std::move(remote_fingerprint)) {
    socket_.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    socket_.set_verify_callback(
        [this](bool preverified, ssl::verify_context& vctx) {
            return verify_certificate(preverified, vctx);
        });
}

SecureChannel::~SecureChannel() {
    boost::system::error_code ec;
    socket_.lowest_layer().close(ec);
}

void SecureChannel::start(OpenHandler on_open) {
    on_open_ = std::move(on_open);
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()]() {
        self->do_handshake();
    });
}

bool SecureChannel::verify_certificate(bool /*preverified*/, ssl::verify_context& vctx) {
    X509_STORE_CTX* store = vctx.native_handle();
    // Certificates are self-signed; only the leaf's fingerprint matters
    if (X509_STORE_CTX_get_error_depth(store) != 0) {
        return true;
    }
    const std::string presented = certificate_fingerprint(X509_STORE_CTX_get_current_cert(store));
    if (!boost::algorithm::iequals(presented, remote_fingerprint_)) {
        fingerprint_rejected_ = true;
        std::cerr << "[Transport] Peer certificate " << presented
                  << " does not match descriptor fingerprint " << remote_fingerprint_ << std::endl;
        return false;
    }
    return true;
}

void SecureChannel::do_handshake() {
    auto self(shared_from_this());
    auto handshake_type = (type_ == Type::CLIENT) ?
                          ssl::stream_base::client :
                          ssl::stream_base::server;

    socket_.async_handshake(handshake_type,
        [this, self](const boost::system::error_code& ec) {
            if (ec) {
                stop(fingerprint_rejected_ ? make_error_code(errc::fingerprint_mismatch) : ec);
                return;
            }
            std::cout << "[Transport] TLS established, exchanging hello." << std::endl;

            wire::Frame hello;
            hello.mutable_hello()->set_session_id(session_id_);
            hello.mutable_hello()->set_version(PROTOCOL_VERSION);
            enqueue(encode_frame(hello), nullptr);

            do_read_header();
        });
}

void SecureChannel::do_read_header() {
    auto self(shared_from_this());
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (stopped_) {
                finish();
                return;
            }
            if (ec) {
                stop(ec);
                return;
            }
            const std::size_t length = (static_cast<std::size_t>(header_[0]) << 24) |
                                       (static_cast<std::size_t>(header_[1]) << 16) |
                                       (static_cast<std::size_t>(header_[2]) << 8) |
                                       static_cast<std::size_t>(header_[3]);
            if (length > MAX_FRAME_SIZE) {
                stop(make_error_code(errc::frame_too_large));
                return;
            }
            do_read_body(length);
        });
}

void SecureChannel::do_read_body(std::size_t length) {
    auto self(shared_from_this());
    read_buffer_.resize(length);
    boost::asio::async_read(socket_, boost::asio::buffer(&read_buffer_[0], length),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (stopped_) {
                finish();
                return;
            }
            if (ec) {
                stop(ec);
                return;
            }
            wire::Frame frame;
            if (!frame.ParseFromString(read_buffer_)) {
                stop(make_error_code(errc::malformed_frame));
                return;
            }
            handle_frame(frame);
            if (!stopped_) {
                do_read_header();
            }
        });
}

void SecureChannel::handle_frame(wire::Frame& frame) {
    if (!hello_received_) {
        if (!frame.has_hello()) {
            std::cerr << "[Transport] Data frame before hello." << std::endl;
            stop(make_error_code(errc::protocol_violation));
            return;
        }
        const auto& hello = frame.hello();
        if (hello.version() != PROTOCOL_VERSION) {
            std::cerr << "[Transport] Unsupported protocol version " << hello.version() << std::endl;
            stop(make_error_code(errc::protocol_violation));
            return;
        }
        if (hello.session_id() != session_id_) {
            std::cerr << "[Transport] Hello for session " << hello.session_id()
                      << ", expected " << session_id_ << std::endl;
            stop(make_error_code(errc::session_mismatch));
            return;
        }
        hello_received_ = true;
        open_ = true;
        if (on_open_) {
            auto handler = std::move(on_open_);
            on_open_ = nullptr;
            handler({});
        }
        return;
    }

    switch (frame.payload_case()) {
    case wire::Frame::kBinary:
        deliver(TransportMessage::binary(std::move(*frame.mutable_binary())));
        break;
    case wire::Frame::kText:
        deliver(TransportMessage::text(std::move(*frame.mutable_text())));
        break;
    case wire::Frame::kHello:
        std::cerr << "[Transport] Ignoring repeated hello." << std::endl;
        break;
    default:
        std::cerr << "[Transport] Ignoring empty frame." << std::endl;
        break;
    }
}

void SecureChannel::deliver(TransportMessage message) {
    if (on_receive_) {
        on_receive_(std::move(message));
    } else {
        backlog_.push_back(std::move(message));
    }
}

void SecureChannel::send(TransportMessage message, SendHandler handler) {
    wire::Frame frame;
    if (message.is_binary()) {
        frame.set_binary(std::move(message.data));
    } else {
        frame.set_text(std::move(message.data));
    }
    auto bytes = encode_frame(frame);

    boost::asio::post(socket_.get_executor(),
        [self = shared_from_this(), bytes, handler = std::move(handler)]() mutable {
            if (bytes->size() - 4 > MAX_FRAME_SIZE) {
                if (handler) {
                    handler(make_error_code(errc::frame_too_large));
                }
                return;
            }
            self->enqueue(std::move(bytes), std::move(handler));
        });
}

void SecureChannel::enqueue(std::shared_ptr<std::string> bytes, SendHandler handler) {
    if (stopped_) {
        if (handler) {
            handler(boost::asio::error::operation_aborted);
        }
        return;
    }
    write_queue_.push_back({std::move(bytes), std::move(handler)});
    if (write_queue_.size() == 1) {
        do_write();
    }
}

void SecureChannel::do_write() {
    auto self(shared_from_this());
    auto bytes = write_queue_.front().bytes;
    boost::asio::async_write(socket_, boost::asio::buffer(*bytes),
        [this, self, bytes](boost::system::error_code ec, std::size_t /*length*/) {
            if (stopped_) {
                return;
            }
            if (ec) {
                std::cerr << "[Transport] Write error: " << ec.message() << std::endl;
                stop(ec);
                return;
            }
            auto handler = std::move(write_queue_.front().handler);
            write_queue_.pop_front();
            if (handler) {
                handler(ec);
            }
            if (!stopped_ && !write_queue_.empty()) {
                do_write();
            }
        });
}

void SecureChannel::set_receive_handler(ReceiveHandler handler) {
    boost::asio::post(socket_.get_executor(),
        [self = shared_from_this(), handler = std::move(handler)]() mutable {
            self->on_receive_ = std::move(handler);
            while (self->on_receive_ && !self->backlog_.empty()) {
                auto message = std::move(self->backlog_.front());
                self->backlog_.pop_front();
                self->on_receive_(std::move(message));
            }
        });
}

void SecureChannel::set_close_handler(CloseHandler handler) {
    boost::asio::post(socket_.get_executor(),
        [self = shared_from_this(), handler = std::move(handler)]() mutable {
            if (self->stopped_) {
                if (handler) {
                    handler(self->close_cause_);
                }
                return;
            }
            self->on_close_ = std::move(handler);
        });
}

void SecureChannel::close() {
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()]() {
        self->stop(boost::asio::error::operation_aborted);
    });
}

void SecureChannel::stop(const boost::system::error_code& cause) {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    open_ = false;
    close_cause_ = cause;

    if (cause && cause != boost::asio::error::operation_aborted && !is_remote_close(cause)) {
        std::cerr << "[Transport] Channel failed: " << cause.message() << std::endl;
    }

    auto pending = std::move(write_queue_);
    write_queue_.clear();
    for (auto& write : pending) {
        if (write.handler) {
            write.handler(boost::asio::error::operation_aborted);
        }
    }

    if (on_open_) {
        auto handler = std::move(on_open_);
        on_open_ = nullptr;
        handler(cause ? cause : make_error_code(errc::protocol_violation));
    } else if (on_close_) {
        auto handler = std::move(on_close_);
        on_close_ = nullptr;
        handler(cause);
    }

    if (cause == boost::asio::error::operation_aborted && hello_received_) {
        // Local close: half-close so queued bytes reach the peer, then wait
        // briefly for its side to go away
        boost::system::error_code ignored;
        socket_.lowest_layer().shutdown(tcp::socket::shutdown_send, ignored);
        linger_timer_.expires_after(LINGER_TIME);
        linger_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) {
                self->finish();
            }
        });
    } else {
        finish();
    }
}

void SecureChannel::finish() {
    linger_timer_.cancel();
    boost::system::error_code ignored;
    if (socket_.lowest_layer().is_open()) {
        socket_.lowest_layer().close(ignored);
    }
}

} // namespace tether
