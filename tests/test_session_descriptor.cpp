#include "tether/errors.hpp"
#include "tether/session_descriptor.hpp"
#include <gtest/gtest.h>

using namespace tether;

namespace {

const char SAMPLE_FINGERPRINT[] =
    "sha-256 0A:1B:2C:3D:4E:5F:60:71:82:93:A4:B5:C6:D7:E8:F9:0A:1B:2C:3D:4E:5F:60:71:82:93:A4:B5:C6:D7:E8:F9";

TransportParameters sample_offer_parameters() {
    TransportParameters params;
    params.session_id = "00112233445566778899aabbccddeeff";
    params.fingerprint = SAMPLE_FINGERPRINT;
    params.host = "192.168.1.20";
    params.port = 40123;
    return params;
}

errc parse_error(const std::string& text) {
    try {
        SessionDescriptor::parse(text);
    } catch (const HandshakeError& e) {
        return e.code();
    }
    ADD_FAILURE() << "parsed: " << text;
    return errc::protocol_violation;
}

errc parameters_error(const std::string& text) {
    try {
        TransportParameters::parse(text);
    } catch (const HandshakeError& e) {
        return e.code();
    }
    ADD_FAILURE() << "parsed: " << text;
    return errc::protocol_violation;
}

} // namespace

TEST(SessionDescriptorTest, SerializesToOneLineAndBack) {
    SessionDescriptor offer(SessionDescriptor::Type::Offer, sample_offer_parameters().to_text());

    const std::string line = offer.serialize();
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_NE(line.find("\"type\":\"offer\""), std::string::npos);

    auto parsed = SessionDescriptor::parse(line);
    EXPECT_EQ(parsed.type(), SessionDescriptor::Type::Offer);
    EXPECT_EQ(parsed.parameters(), offer.parameters());
}

TEST(SessionDescriptorTest, ToleratesSurroundingWhitespace) {
    SessionDescriptor answer(SessionDescriptor::Type::Answer, "v=1\n");
    auto parsed = SessionDescriptor::parse("  " + answer.serialize() + "\r\n");
    EXPECT_EQ(parsed.type(), SessionDescriptor::Type::Answer);
}

TEST(SessionDescriptorTest, RejectsMalformedInput) {
    EXPECT_EQ(parse_error(""), errc::descriptor_missing);
    EXPECT_EQ(parse_error("   "), errc::descriptor_missing);
    EXPECT_EQ(parse_error("hello"), errc::malformed_descriptor);
    EXPECT_EQ(parse_error(R"({"type":"offer")"), errc::malformed_descriptor);
    EXPECT_EQ(parse_error(R"({"type":"pranswer","parameters":"v=1"})"), errc::malformed_descriptor);
    EXPECT_EQ(parse_error(R"({"type":"offer"})"), errc::malformed_descriptor);
}

TEST(TransportParametersTest, RoundTripsThroughText) {
    auto original = sample_offer_parameters();
    auto parsed = TransportParameters::parse(original.to_text());

    EXPECT_EQ(parsed.session_id, original.session_id);
    EXPECT_EQ(parsed.fingerprint, original.fingerprint);
    EXPECT_EQ(parsed.host, original.host);
    EXPECT_EQ(parsed.port, original.port);
    EXPECT_TRUE(parsed.has_candidate());
}

TEST(TransportParametersTest, AnswerHasNoCandidate) {
    auto params = sample_offer_parameters();
    params.host.clear();
    params.port = 0;

    const std::string text = params.to_text();
    EXPECT_EQ(text.find("candidate"), std::string::npos);
    EXPECT_FALSE(TransportParameters::parse(text).has_candidate());
}

TEST(TransportParametersTest, IgnoresUnknownAttributes) {
    auto text = sample_offer_parameters().to_text() + "a=ice-lite\na=setup:actpass\n";
    EXPECT_NO_THROW(TransportParameters::parse(text));
}

TEST(TransportParametersTest, RejectsMissingOrBadAttributes) {
    const std::string session = "a=session:00112233445566778899aabbccddeeff\n";
    const std::string fingerprint = std::string("a=fingerprint:") + SAMPLE_FINGERPRINT + "\n";

    EXPECT_EQ(parameters_error(session + fingerprint), errc::malformed_descriptor);          // no version
    EXPECT_EQ(parameters_error("v=2\n" + session + fingerprint), errc::malformed_descriptor);
    EXPECT_EQ(parameters_error("v=1\n" + fingerprint), errc::malformed_descriptor);          // no session
    EXPECT_EQ(parameters_error("v=1\n" + session), errc::malformed_descriptor);              // no fingerprint
    EXPECT_EQ(parameters_error("v=1\na=session:xyz\n" + fingerprint), errc::malformed_descriptor);
    EXPECT_EQ(parameters_error("v=1\n" + session + "a=fingerprint:md5 00\n"), errc::malformed_descriptor);
    EXPECT_EQ(parameters_error("v=1\n" + session + fingerprint + "a=candidate:host 99999\n"),
              errc::malformed_descriptor);
    EXPECT_EQ(parameters_error("v=1\n" + session + fingerprint + "garbage\n"), errc::malformed_descriptor);
}

TEST(TransportParametersTest, AcceptsCrlfAndPaddedLines) {
    const std::string text =
        "v=1\r\n"
        "  a=session:00112233445566778899aabbccddeeff \r\n"
        "\ta=fingerprint: " + std::string(SAMPLE_FINGERPRINT) + "\t\r\n"
        "a=candidate: 10.0.0.7 5000\r\n"
        "\r\n";

    auto parsed = TransportParameters::parse(text);
    EXPECT_EQ(parsed.session_id, "00112233445566778899aabbccddeeff");
    EXPECT_EQ(parsed.fingerprint, SAMPLE_FINGERPRINT);
    EXPECT_EQ(parsed.host, "10.0.0.7");
    EXPECT_EQ(parsed.port, 5000);
}
