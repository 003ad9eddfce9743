#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace tether {

enum class errc {
    malformed_descriptor = 1,
    unexpected_descriptor,
    descriptor_missing,
    session_mismatch,
    fingerprint_mismatch,
    frame_too_large,
    malformed_frame,
    protocol_violation
};

const boost::system::error_category& error_category();

inline boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), error_category());
}

// Thrown while parsing or applying a session descriptor
class HandshakeError : public std::runtime_error {
public:
    HandshakeError(errc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    errc code() const { return code_; }

private:
    errc code_;
};

} // namespace tether

namespace boost {
namespace system {
template <>
struct is_error_code_enum<tether::errc> : std::true_type {};
} // namespace system
} // namespace boost
