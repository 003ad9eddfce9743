#include "tether/hex.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tether {

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string to_colon_hex(const std::uint8_t* data, std::size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::uppercase << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        if (i > 0) {
            hex_stream << ':';
        }
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

bool is_hex(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

} // namespace tether
