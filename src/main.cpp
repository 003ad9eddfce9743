#include <iostream>
#include <boost/asio.hpp>
#include "tether/config.hpp"
#include "tether/console.hpp"
#include "tether/peer_session.hpp"
#include "tether/transport.hpp"

int main(int argc, char* argv[]) {
    tether::Config config;
    try {
        config = tether::parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << tether::usage(argv[0]);
        return 1;
    }

    try {
        boost::asio::io_context io_context;

        tether::TransportOptions options;
        options.bind_address = config.bind_address;
        options.port = config.port;
        options.advertise_address = config.advertise_address;
        tether::TlsTransport transport(io_context, options);

        tether::Console console(io_context);
        tether::PeerSession session(io_context, config, transport, console, console, std::cout);
        session.start();

        io_context.run();

        return session.handshake_failed() ? 1 : 0;
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
    }

    return 1;
}
