#pragma once

#include <cstdint>
#include <string>

namespace tether {

// Fixed for the lifetime of the process; decides who speaks first
enum class Role { Initiator, Responder };

const char* to_string(Role role);

// Transport parameters carried inside a descriptor, one attribute per line:
//
//   v=1
//   a=session:<32 hex digits>
//   a=fingerprint:sha-256 AB:CD:...
//   a=candidate:<host> <port>        (offers only)
struct TransportParameters {
    std::string session_id;
    std::string fingerprint;
    std::string host;
    uint16_t port = 0;

    bool has_candidate() const { return !host.empty() && port != 0; }

    std::string to_text() const;

    // Throws HandshakeError on a missing or malformed attribute
    static TransportParameters parse(const std::string& text);
};

// Opaque blob exchanged out-of-band. Immutable once created.
class SessionDescriptor {
public:
    enum class Type { Offer, Answer };

    SessionDescriptor(Type type, std::string parameters);

    Type type() const { return type_; }
    const std::string& parameters() const { return parameters_; }

    // Single line of JSON: {"type":"offer","parameters":"..."}
    std::string serialize() const;

    // Throws HandshakeError if the text is not a descriptor
    static SessionDescriptor parse(const std::string& text);

private:
    Type type_;
    std::string parameters_;
};

const char* to_string(SessionDescriptor::Type type);

} // namespace tether
