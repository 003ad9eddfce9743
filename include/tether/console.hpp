#pragma once

#include "tether/handshake.hpp"
#include "tether/line_source.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <iostream>
#include <string>

namespace tether {

// Operator terminal: asynchronous line input from stdin, plain output.
// Also the out-of-band path descriptors travel over.
class Console : public DescriptorExchange, public LineSource {
public:
    explicit Console(boost::asio::io_context& io_context, std::ostream& out = std::cout);

    void async_read_line(LineHandler handler) override;

    void publish(const SessionDescriptor& descriptor) override;
    void async_receive(SessionDescriptor::Type expected, ReceiveHandler handler) override;

    void close() override;

private:
    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf buffer_;
    std::ostream& out_;
};

} // namespace tether
