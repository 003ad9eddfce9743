#pragma once

#include "tether/channel.hpp"
#include "tether/identity.hpp"
#include "tether/secure_channel.hpp"
#include "tether/session_descriptor.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tether {

// Negotiates the channel from a pair of descriptors. Delivery on the
// resulting channel must be ordered and reliable: chunks carry no sequence
// numbers.
class Transport {
public:
    using OpenHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<Channel>)>;

    virtual ~Transport() = default;

    virtual SessionDescriptor create_offer() = 0;
    // Only valid after an offer has been applied
    virtual SessionDescriptor create_answer() = 0;
    // Throws HandshakeError if the descriptor cannot be used
    virtual void apply_remote(const SessionDescriptor& descriptor) = 0;
    // Completes once, when the channel is open or can no longer open
    virtual void async_open(OpenHandler handler) = 0;
    virtual void close() = 0;
};

struct TransportOptions {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;
    // Candidate address put in offers; empty means discover it
    std::string advertise_address;
};

// TCP + mutually authenticated TLS. The offering side listens and the
// answering side connects to the offer's candidate. Driven from the thread
// running the io_context.
class TlsTransport : public Transport {
public:
    TlsTransport(boost::asio::io_context& io_context, TransportOptions options);

    SessionDescriptor create_offer() override;
    SessionDescriptor create_answer() override;
    void apply_remote(const SessionDescriptor& descriptor) override;
    void async_open(OpenHandler handler) override;
    void close() override;

    const std::string& fingerprint() const { return identity_.fingerprint(); }

private:
    void do_accept();
    void do_connect();
    void complete(const boost::system::error_code& ec, std::shared_ptr<Channel> channel);
    std::string discover_address() const;

    boost::asio::io_context& io_context_;
    TransportOptions options_;
    Identity identity_;
    ssl::context ssl_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::shared_ptr<SecureChannel> pending_;

    std::optional<SessionDescriptor::Type> local_type_;
    std::string session_id_;
    std::optional<TransportParameters> remote_;
    OpenHandler on_open_;
    bool closed_ = false;
};

} // namespace tether
