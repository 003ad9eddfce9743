#include "tether/transport.hpp"
#include "tether/errors.hpp"
#include "tether/hex.hpp"
#include <openssl/rand.h>
#include <iostream>
#include <stdexcept>

namespace tether {

namespace {

std::string generate_session_id() {
    unsigned char random[16];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(random, sizeof(random));
}

} // namespace

TlsTransport::TlsTransport(boost::asio::io_context& io_context, TransportOptions options)
    : io_context_(io_context),
      options_(std::move(options)),
      identity_(Identity::generate()),
      ssl_context_(ssl::context::tlsv12)
{
    ssl_context_.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::single_dh_use);
    identity_.apply_to(ssl_context_);

    std::cout << "[Transport] Local certificate " << identity_.fingerprint() << std::endl;
}

std::string TlsTransport::discover_address() const {
    // Connecting a UDP socket sends nothing but makes the kernel pick the
    // outbound interface, whose address is the best host candidate we have
    boost::system::error_code ec;
    boost::asio::ip::udp::socket probe(io_context_);
    probe.connect(boost::asio::ip::udp::endpoint(
        boost::asio::ip::make_address("192.0.2.1"), 9), ec);
    if (!ec) {
        auto local = probe.local_endpoint(ec);
        if (!ec && !local.address().is_unspecified()) {
            return local.address().to_string();
        }
    }
    return "127.0.0.1";
}

SessionDescriptor TlsTransport::create_offer() {
    if (local_type_) {
        throw std::logic_error("local descriptor already created");
    }

    auto address = boost::asio::ip::make_address(options_.bind_address);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, tcp::endpoint(address, options_.port));

    TransportParameters params;
    params.session_id = session_id_ = generate_session_id();
    params.fingerprint = identity_.fingerprint();
    params.host = options_.advertise_address.empty() ? discover_address() : options_.advertise_address;
    params.port = acceptor_->local_endpoint().port();

    std::cout << "[Transport] Listening on " << acceptor_->local_endpoint()
              << ", advertising " << params.host << ":" << params.port << std::endl;

    local_type_ = SessionDescriptor::Type::Offer;
    return SessionDescriptor(SessionDescriptor::Type::Offer, params.to_text());
}

SessionDescriptor TlsTransport::create_answer() {
    if (local_type_) {
        throw std::logic_error("local descriptor already created");
    }
    if (!remote_) {
        throw std::logic_error("an answer needs the remote offer first");
    }

    TransportParameters params;
    params.session_id = session_id_;
    params.fingerprint = identity_.fingerprint();

    local_type_ = SessionDescriptor::Type::Answer;
    return SessionDescriptor(SessionDescriptor::Type::Answer, params.to_text());
}

void TlsTransport::apply_remote(const SessionDescriptor& descriptor) {
    if (remote_) {
        throw std::logic_error("remote descriptor already applied");
    }

    const bool offering = local_type_ == SessionDescriptor::Type::Offer;
    const auto expected = offering ? SessionDescriptor::Type::Answer : SessionDescriptor::Type::Offer;
    if (descriptor.type() != expected) {
        throw HandshakeError(errc::unexpected_descriptor,
            std::string("expected an ") + to_string(expected) + ", got an " + to_string(descriptor.type()));
    }

    auto params = TransportParameters::parse(descriptor.parameters());
    if (offering) {
        if (params.session_id != session_id_) {
            throw HandshakeError(errc::session_mismatch, "answer belongs to session " + params.session_id);
        }
    } else {
        if (!params.has_candidate()) {
            throw HandshakeError(errc::malformed_descriptor, "offer carries no candidate");
        }
        session_id_ = params.session_id;
    }
    remote_ = std::move(params);
}

void TlsTransport::async_open(OpenHandler handler) {
    if (!remote_) {
        throw std::logic_error("async_open before the remote descriptor was applied");
    }
    on_open_ = std::move(handler);
    if (local_type_ == SessionDescriptor::Type::Offer) {
        do_accept();
    } else {
        do_connect();
    }
}

void TlsTransport::do_accept() {
    acceptor_->async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (closed_) {
                return;
            }
            if (ec) {
                std::cerr << "[Transport] Accept error: " << ec.message() << std::endl;
                complete(ec, nullptr);
                return;
            }

            boost::system::error_code ignored;
            auto peer = socket.remote_endpoint(ignored);
            std::cout << "[Transport] Accepted connection from " << peer << std::endl;

            auto channel = std::make_shared<SecureChannel>(std::move(socket), ssl_context_,
                SecureChannel::Type::SERVER, session_id_, remote_->fingerprint);
            pending_ = channel;
            channel->start([this, channel, peer](const boost::system::error_code& ec) {
                pending_.reset();
                if (closed_) {
                    channel->close();
                    return;
                }
                if (ec) {
                    // Not our peer; keep waiting for the right one
                    std::cerr << "[Transport] Rejected connection from " << peer << ": " << ec.message() << std::endl;
                    do_accept();
                    return;
                }
                complete({}, channel);
            });
        });
}

void TlsTransport::do_connect() {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(remote_->host, std::to_string(remote_->port), ec);
    if (ec) {
        std::cerr << "[Transport] Cannot resolve " << remote_->host << ": " << ec.message() << std::endl;
        boost::asio::post(io_context_, [this, ec]() { complete(ec, nullptr); });
        return;
    }

    std::cout << "[Transport] Connecting to " << remote_->host << ":" << remote_->port << "..." << std::endl;

    auto channel = std::make_shared<SecureChannel>(tcp::socket(boost::asio::make_strand(io_context_)),
        ssl_context_, SecureChannel::Type::CLIENT, session_id_, remote_->fingerprint);
    pending_ = channel;

    boost::asio::async_connect(channel->get_socket().lowest_layer(), endpoints,
        [this, channel](const boost::system::error_code& ec, const tcp::endpoint& /*endpoint*/) {
            if (closed_) {
                return;
            }
            if (ec) {
                pending_.reset();
                std::cerr << "[Transport] Connect error: " << ec.message() << std::endl;
                complete(ec, nullptr);
                return;
            }
            channel->start([this, channel](const boost::system::error_code& ec) {
                pending_.reset();
                if (closed_) {
                    channel->close();
                    return;
                }
                complete(ec, ec ? nullptr : channel);
            });
        });
}

void TlsTransport::complete(const boost::system::error_code& ec, std::shared_ptr<Channel> channel) {
    if (acceptor_) {
        boost::system::error_code ignored;
        acceptor_->close(ignored);
    }
    if (on_open_) {
        auto handler = std::move(on_open_);
        on_open_ = nullptr;
        handler(ec, std::move(channel));
    }
}

void TlsTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (pending_) {
        pending_->close();
        pending_.reset();
    }
    if (acceptor_) {
        boost::system::error_code ignored;
        acceptor_->close(ignored);
    }
    if (on_open_) {
        auto handler = std::move(on_open_);
        on_open_ = nullptr;
        handler(boost::asio::error::operation_aborted, nullptr);
    }
}

} // namespace tether
