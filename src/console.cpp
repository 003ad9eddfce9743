#include "tether/console.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <unistd.h>

namespace tether {

Console::Console(boost::asio::io_context& io_context, std::ostream& out)
    : input_(io_context, ::dup(STDIN_FILENO)),
      out_(out) {}

void Console::async_read_line(LineHandler handler) {
    boost::asio::async_read_until(input_, buffer_, '\n',
        [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t /*n*/) {
            // A final line without a newline still counts
            if (ec && !(ec == boost::asio::error::eof && buffer_.size() > 0)) {
                handler(ec, {});
                return;
            }
            std::istream is(&buffer_);
            std::string line;
            std::getline(is, line);
            boost::algorithm::trim(line);
            handler({}, std::move(line));
        });
}

void Console::publish(const SessionDescriptor& descriptor) {
    std::string label = to_string(descriptor.type());
    boost::algorithm::to_upper(label);
    out_ << "=== Your " << label << " (copy this line to the other peer) ===" << std::endl;
    out_ << descriptor.serialize() << std::endl;
    out_ << std::string(label.size() + 48, '=') << std::endl;
}

void Console::async_receive(SessionDescriptor::Type expected, ReceiveHandler handler) {
    std::string label = to_string(expected);
    boost::algorithm::to_upper(label);
    out_ << "Paste the " << label << " from the other peer and press Enter:" << std::endl;

    async_read_line([this, expected, handler = std::move(handler)](const boost::system::error_code& ec, std::string line) {
        if (!ec && line.empty()) {
            async_receive(expected, handler);
            return;
        }
        handler(ec, std::move(line));
    });
}

void Console::close() {
    boost::system::error_code ignored;
    input_.cancel(ignored);
    input_.close(ignored);
}

} // namespace tether
