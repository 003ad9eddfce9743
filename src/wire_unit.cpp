#include "tether/wire_unit.hpp"
#include "tether.pb.h"
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <stdexcept>

namespace tether {

namespace {

// Overload set for std::visit
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string serialize_control(const ControlMessage& message) {
    if (message.size > MAX_ANNOUNCED_SIZE) {
        throw std::out_of_range("file size " + std::to_string(message.size) + " cannot be announced");
    }

    // Built as a Struct so size goes out as a JSON number; FileMeta's uint64
    // would print as a string
    google::protobuf::Struct meta;
    auto& fields = *meta.mutable_fields();
    fields["kind"].set_string_value(message.kind);
    fields["filename"].set_string_value(message.filename);
    fields["size"].set_number_value(static_cast<double>(message.size));

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(meta, &json);
    if (!status.ok()) {
        throw std::runtime_error("cannot serialize control message: " + status.ToString());
    }
    return json;
}

std::optional<ControlMessage> parse_control(const std::string& text) {
    // Cheap reject: the printer always emits an object
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || text[first] != '{') {
        return std::nullopt;
    }

    wire::FileMeta meta;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(text, &meta, options).ok()) {
        return std::nullopt;
    }
    if (meta.kind() != FILE_META_KIND) {
        return std::nullopt;
    }

    ControlMessage message;
    message.kind = meta.kind();
    message.filename = meta.filename();
    message.size = meta.size();
    return message;
}

WireUnit classify(TransportMessage message) {
    if (message.is_binary()) {
        return ChunkUnit{std::vector<uint8_t>(message.data.begin(), message.data.end())};
    }
    if (auto control = parse_control(message.data)) {
        return *control;
    }
    return ChatUnit{std::move(message.data)};
}

TransportMessage to_transport(const WireUnit& unit) {
    return std::visit(overloaded{
        [](const ChunkUnit& chunk) {
            return TransportMessage::binary(std::string(chunk.bytes.begin(), chunk.bytes.end()));
        },
        [](const ControlMessage& control) {
            return TransportMessage::text(serialize_control(control));
        },
        [](const ChatUnit& chat) {
            return TransportMessage::text(chat.text);
        },
    }, unit);
}

} // namespace tether
