#include "tether/config.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace tether {

namespace {

unsigned long parse_number(const std::string& what, const std::string& value, unsigned long min, unsigned long max) {
    std::size_t used = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid " + what + " '" + value + "'");
    }
    if (used != value.size() || value[0] == '-' || n < min || n > max) {
        throw std::invalid_argument("invalid " + what + " '" + value + "'");
    }
    return n;
}

uint16_t parse_port(const std::string& value) {
    return static_cast<uint16_t>(parse_number("port", value, 0, 65535));
}

std::size_t parse_chunk_size(const std::string& value) {
    return parse_number("chunk size", value, 1, MAX_CHUNK_SIZE);
}

} // namespace

void apply_environment(Config& config) {
    if (const char* v = std::getenv("TETHER_BIND")) config.bind_address = v;
    if (const char* v = std::getenv("TETHER_PORT")) config.port = parse_port(v);
    if (const char* v = std::getenv("TETHER_ADVERTISE")) config.advertise_address = v;
    if (const char* v = std::getenv("TETHER_CHUNK_SIZE")) config.chunk_size = parse_chunk_size(v);
    if (const char* v = std::getenv("TETHER_DOWNLOAD_DIR")) config.download_dir = v;
}

Config parse_command_line(int argc, const char* const argv[]) {
    Config config;
    apply_environment(config);

    bool have_role = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--role") {
            const std::string role = value();
            if (role == "offer") {
                config.role = Role::Initiator;
            } else if (role == "answer") {
                config.role = Role::Responder;
            } else {
                throw std::invalid_argument("role must be 'offer' or 'answer', got '" + role + "'");
            }
            have_role = true;
        } else if (arg == "--file") {
            config.file_to_send = std::filesystem::path(value());
        } else if (arg == "--bind") {
            config.bind_address = value();
        } else if (arg == "--port") {
            config.port = parse_port(value());
        } else if (arg == "--advertise") {
            config.advertise_address = value();
        } else if (arg == "--chunk-size") {
            config.chunk_size = parse_chunk_size(value());
        } else if (arg == "--download-dir") {
            config.download_dir = value();
        } else if (arg == "--greeting") {
            config.greeting = value();
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }

    if (!have_role) {
        throw std::invalid_argument("--role is required");
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " --role offer|answer [options]\n"
        << "  --file <path>          send this file once connected\n"
        << "  --bind <addr>          listen address on the offer side (default 0.0.0.0)\n"
        << "  --port <n>             listen port on the offer side (default: any)\n"
        << "  --advertise <addr>     address written into the offer (default: auto)\n"
        << "  --chunk-size <n>       bytes per file chunk, 1.." << MAX_CHUNK_SIZE
        << " (default " << DEFAULT_CHUNK_SIZE << ")\n"
        << "  --download-dir <dir>   where received files are written (default .)\n"
        << "  --greeting <text>      chat line sent on connect, empty to disable\n"
        << "  --verbose              trace every unit on the channel\n"
        << "While connected: type to chat, '/send <path>' to send a file, 'bye' to leave.\n";
    return out.str();
}

} // namespace tether
