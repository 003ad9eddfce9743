#pragma once

#include "tether/channel.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tether {

const char FILE_META_KIND[] = "file-meta";

// Sizes up to 2^53 stay exact as a JSON number
const uint64_t MAX_ANNOUNCED_SIZE = 1ULL << 53;

// Announces the file whose chunks follow
struct ControlMessage {
    std::string kind = FILE_META_KIND;
    std::string filename;
    uint64_t size = 0;
};

// One slice of file bytes, in send order
struct ChunkUnit {
    std::vector<uint8_t> bytes;
};

struct ChatUnit {
    std::string text;
};

// Decided once at the transport boundary, never re-inspected downstream
using WireUnit = std::variant<ChunkUnit, ControlMessage, ChatUnit>;

// Binary units are always chunks. Text units are control messages when they
// parse as one with kind "file-meta", and chat otherwise.
WireUnit classify(TransportMessage message);

TransportMessage to_transport(const WireUnit& unit);

// {"kind":"file-meta","filename":"...","size":1048576}
// Throws std::out_of_range above MAX_ANNOUNCED_SIZE.
std::string serialize_control(const ControlMessage& message);

// Empty unless the text is a file-meta control message. size may be a
// number or a decimal string.
std::optional<ControlMessage> parse_control(const std::string& text);

} // namespace tether
