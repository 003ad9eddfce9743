#pragma once

#include "tether/channel_framer.hpp"
#include "tether/wire_unit.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace tether {

// Default maximum chunk size (16 KiB)
const std::size_t DEFAULT_CHUNK_SIZE = 16 * 1024;
const std::size_t MAX_CHUNK_SIZE = 64 * 1024;

const char RECEIVED_PREFIX[] = "received_";

// Sends one file at a time: a file-meta announcement, then the bytes in
// chunks. Only one chunk is in flight; the next is read after the previous
// one is written, so chat and inbound traffic interleave with the transfer.
class FileSender {
public:
    using DoneHandler = std::function<void(const boost::system::error_code&)>;

    FileSender(ChannelFramer& framer, boost::asio::any_io_executor executor,
               std::size_t chunk_size, std::ostream& out);

    // Returns false, without announcing, if the file cannot be opened, is
    // too large to announce, or a transfer is already running
    bool send_file(const std::filesystem::path& path, DoneHandler done = nullptr);

    // Stops after the chunk in flight; no further chunks are read
    void cancel();

    bool busy() const { return current_ != nullptr; }

private:
    struct Outgoing {
        std::string filename;
        std::ifstream file;
        uint64_t size = 0;
        uint64_t sent = 0;
        std::size_t chunks = 0;
        bool cancelled = false;
        DoneHandler done;
    };

    void pump(const std::shared_ptr<Outgoing>& transfer);
    void finish(const std::shared_ptr<Outgoing>& transfer, const boost::system::error_code& ec);

    ChannelFramer& framer_;
    boost::asio::any_io_executor executor_;
    std::size_t chunk_size_;
    std::ostream& out_;
    std::shared_ptr<Outgoing> current_;
};

// Rebuilds incoming files from a file-meta announcement and the chunks that
// follow it. Driven by the single inbound dispatch point; not thread-safe.
class FileReceiver {
public:
    enum class State { Idle, Receiving, Complete };

    FileReceiver(std::filesystem::path directory, std::ostream& out);
    ~FileReceiver();

    void on_announce(const ControlMessage& message);
    void on_chunk(const ChunkUnit& chunk);

    // Channel went away: close the destination, leaving the partial file
    void abort();

    State state() const { return state_; }
    uint64_t bytes_written() const { return incoming_ ? incoming_->bytes_written : 0; }
    uint64_t expected_size() const { return incoming_ ? incoming_->expected_size : 0; }

    std::size_t violations() const { return violations_; }
    std::size_t completed() const { return completed_; }
    const std::filesystem::path& last_completed() const { return last_completed_; }

    // Strips directory components; empty if nothing usable remains
    static std::string sanitize_filename(const std::string& name);

private:
    struct Incoming {
        std::string filename;
        std::filesystem::path path;
        uint64_t expected_size = 0;
        uint64_t bytes_written = 0;
        std::ofstream file;
        bool failed = false;
    };

    void write(const uint8_t* data, std::size_t len);
    void finish();
    void report_violation(const std::string& what);

    std::filesystem::path directory_;
    std::ostream& out_;
    State state_ = State::Idle;
    std::optional<Incoming> incoming_;

    std::size_t violations_ = 0;
    std::size_t completed_ = 0;
    std::filesystem::path last_completed_;
};

} // namespace tether
