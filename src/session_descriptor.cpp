#include "tether/session_descriptor.hpp"
#include "tether/errors.hpp"
#include "tether/hex.hpp"
#include "tether.pb.h"
#include <boost/algorithm/string/trim.hpp>
#include <google/protobuf/util/json_util.h>
#include <sstream>

namespace tether {

namespace {

const char OFFER_TYPE[] = "offer";
const char ANSWER_TYPE[] = "answer";

void parse_candidate(const std::string& value, TransportParameters& params) {
    std::istringstream in(value);
    std::string host;
    long port = 0;
    if (!(in >> host >> port) || port <= 0 || port > 65535) {
        throw HandshakeError(errc::malformed_descriptor, "invalid candidate '" + value + "'");
    }
    params.host = host;
    params.port = static_cast<uint16_t>(port);
}

} // namespace

const char* to_string(Role role) {
    return role == Role::Initiator ? "initiator" : "responder";
}

const char* to_string(SessionDescriptor::Type type) {
    return type == SessionDescriptor::Type::Offer ? OFFER_TYPE : ANSWER_TYPE;
}

std::string TransportParameters::to_text() const {
    std::ostringstream out;
    out << "v=1\n";
    out << "a=session:" << session_id << "\n";
    out << "a=fingerprint:" << fingerprint << "\n";
    if (has_candidate()) {
        out << "a=candidate:" << host << " " << port << "\n";
    }
    return out.str();
}

TransportParameters TransportParameters::parse(const std::string& text) {
    TransportParameters params;
    bool have_version = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = boost::algorithm::trim_copy(line);
        if (line.empty()) {
            continue;
        }
        if (line == "v=1") {
            have_version = true;
            continue;
        }
        if (line.compare(0, 2, "v=") == 0) {
            throw HandshakeError(errc::malformed_descriptor, "unsupported version '" + line + "'");
        }
        if (line.compare(0, 2, "a=") != 0) {
            throw HandshakeError(errc::malformed_descriptor, "unexpected line '" + line + "'");
        }

        const auto colon = line.find(':', 2);
        if (colon == std::string::npos) {
            continue; // flag attribute, nothing we use
        }
        const std::string name = line.substr(2, colon - 2);
        const std::string value = boost::algorithm::trim_copy(line.substr(colon + 1));

        if (name == "session") {
            if (value.size() != 32 || !is_hex(value)) {
                throw HandshakeError(errc::malformed_descriptor, "invalid session id '" + value + "'");
            }
            params.session_id = value;
        } else if (name == "fingerprint") {
            if (value.compare(0, 8, "sha-256 ") != 0) {
                throw HandshakeError(errc::malformed_descriptor, "unsupported fingerprint '" + value + "'");
            }
            params.fingerprint = value;
        } else if (name == "candidate") {
            parse_candidate(value, params);
        }
        // Other attributes are ignored
    }

    if (!have_version) {
        throw HandshakeError(errc::malformed_descriptor, "descriptor parameters carry no version");
    }
    if (params.session_id.empty()) {
        throw HandshakeError(errc::malformed_descriptor, "descriptor parameters carry no session id");
    }
    if (params.fingerprint.empty()) {
        throw HandshakeError(errc::malformed_descriptor, "descriptor parameters carry no fingerprint");
    }
    return params;
}

SessionDescriptor::SessionDescriptor(Type type, std::string parameters)
    : type_(type), parameters_(std::move(parameters)) {}

std::string SessionDescriptor::serialize() const {
    wire::SessionDescriptor msg;
    msg.set_type(to_string(type_));
    msg.set_parameters(parameters_);

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(msg, &json, options);
    if (!status.ok()) {
        throw HandshakeError(errc::malformed_descriptor, "cannot serialize descriptor: " + status.ToString());
    }
    return json;
}

SessionDescriptor SessionDescriptor::parse(const std::string& text) {
    const std::string input = boost::algorithm::trim_copy(text);
    if (input.empty()) {
        throw HandshakeError(errc::descriptor_missing, "empty session descriptor");
    }

    wire::SessionDescriptor msg;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(input, &msg, options);
    if (!status.ok()) {
        throw HandshakeError(errc::malformed_descriptor, "session descriptor is not valid JSON: " + status.ToString());
    }

    Type type;
    if (msg.type() == OFFER_TYPE) {
        type = Type::Offer;
    } else if (msg.type() == ANSWER_TYPE) {
        type = Type::Answer;
    } else {
        throw HandshakeError(errc::malformed_descriptor, "unknown descriptor type '" + msg.type() + "'");
    }
    if (msg.parameters().empty()) {
        throw HandshakeError(errc::malformed_descriptor, "session descriptor has no parameters");
    }
    return SessionDescriptor(type, msg.parameters());
}

} // namespace tether
