#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tether {

// Lower-case hex, two digits per byte
std::string to_hex(const std::uint8_t* data, std::size_t len);

// Upper-case hex pairs joined by ':' (certificate fingerprint notation)
std::string to_colon_hex(const std::uint8_t* data, std::size_t len);

bool is_hex(const std::string& s);

} // namespace tether
