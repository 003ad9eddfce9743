#include "tether/handshake.hpp"
#include "tether/errors.hpp"
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <iostream>
#include <stdexcept>

namespace tether {

HandshakeCoordinator::HandshakeCoordinator(Transport& transport, DescriptorExchange& exchange, Role role)
    : transport_(transport), exchange_(exchange), role_(role) {}

void HandshakeCoordinator::start(CompletionHandler handler) {
    if (started_) {
        throw std::logic_error("handshake already started");
    }
    started_ = true;
    handler_ = std::move(handler);

    if (role_ == Role::Initiator) {
        std::cout << "[Handshake] Acting as initiator: creating offer." << std::endl;
        try {
            exchange_.publish(transport_.create_offer());
        } catch (const boost::system::system_error& e) {
            std::cerr << "[Handshake] Cannot create offer: " << e.what() << std::endl;
            fail(e.code());
            return;
        }
        exchange_.async_receive(SessionDescriptor::Type::Answer,
            [this](const boost::system::error_code& ec, std::string text) {
                on_remote_descriptor(ec, text);
            });
    } else {
        std::cout << "[Handshake] Acting as responder: waiting for offer." << std::endl;
        exchange_.async_receive(SessionDescriptor::Type::Offer,
            [this](const boost::system::error_code& ec, std::string text) {
                on_remote_descriptor(ec, text);
            });
    }
}

void HandshakeCoordinator::on_remote_descriptor(const boost::system::error_code& ec, const std::string& text) {
    if (ec) {
        std::cerr << "[Handshake] No remote descriptor: " << ec.message() << std::endl;
        fail(ec == boost::asio::error::eof ? make_error_code(errc::descriptor_missing) : ec);
        return;
    }

    try {
        transport_.apply_remote(SessionDescriptor::parse(text));
    } catch (const HandshakeError& e) {
        std::cerr << "[Handshake] Failed to parse " << (role_ == Role::Initiator ? "answer" : "offer")
                  << ": " << e.what() << std::endl;
        fail(make_error_code(e.code()));
        return;
    }

    if (role_ == Role::Responder) {
        exchange_.publish(transport_.create_answer());
    }
    await_open();
}

void HandshakeCoordinator::await_open() {
    std::cout << "[Handshake] Descriptors exchanged, waiting for the channel to open..." << std::endl;
    transport_.async_open([this](const boost::system::error_code& ec, std::shared_ptr<Channel> channel) {
        if (ec) {
            std::cerr << "[Handshake] Channel did not open: " << ec.message() << std::endl;
            fail(ec);
            return;
        }
        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) {
            handler({}, std::move(channel));
        }
    });
}

void HandshakeCoordinator::fail(const boost::system::error_code& ec) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(ec, nullptr);
    }
}

} // namespace tether
