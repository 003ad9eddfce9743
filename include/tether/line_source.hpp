#pragma once

#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace tether {

// Where operator lines come from while the session is open
class LineSource {
public:
    using LineHandler = std::function<void(const boost::system::error_code&, std::string)>;

    virtual ~LineSource() = default;

    // Next line, trimmed. eof once input is exhausted.
    virtual void async_read_line(LineHandler handler) = 0;

    // Cancels any pending read
    virtual void close() = 0;
};

} // namespace tether
