#pragma once

#include "tether/file_transfer.hpp"
#include "tether/session_descriptor.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tether {

struct Config {
    Role role = Role::Initiator;
    std::optional<std::filesystem::path> file_to_send;

    // Offer side listener and the candidate it advertises
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;
    std::string advertise_address;

    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::filesystem::path download_dir = ".";
    std::string greeting = "Test message from this peer.";
    bool verbose = false;
};

// Environment first (TETHER_BIND, TETHER_PORT, TETHER_ADVERTISE,
// TETHER_CHUNK_SIZE, TETHER_DOWNLOAD_DIR), then the command line on top.
// Throws std::invalid_argument.
Config parse_command_line(int argc, const char* const argv[]);

void apply_environment(Config& config);

std::string usage(const std::string& program);

} // namespace tether
