#include "tether/errors.hpp"

namespace tether {

namespace {

class TetherCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "tether"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::malformed_descriptor:
            return "malformed session descriptor";
        case errc::unexpected_descriptor:
            return "session descriptor of the wrong type";
        case errc::descriptor_missing:
            return "no session descriptor supplied";
        case errc::session_mismatch:
            return "peer belongs to another session";
        case errc::fingerprint_mismatch:
            return "peer certificate does not match the descriptor";
        case errc::frame_too_large:
            return "frame exceeds the maximum size";
        case errc::malformed_frame:
            return "malformed frame";
        case errc::protocol_violation:
            return "protocol violation";
        }
        return "unknown tether error";
    }
};

} // namespace

const boost::system::error_category& error_category() {
    static const TetherCategory category;
    return category;
}

} // namespace tether
