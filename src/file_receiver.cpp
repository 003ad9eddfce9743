#include "tether/file_transfer.hpp"

namespace tether {

FileReceiver::FileReceiver(std::filesystem::path directory, std::ostream& out)
    : directory_(std::move(directory)), out_(out) {}

FileReceiver::~FileReceiver() {
    if (incoming_ && incoming_->file.is_open()) {
        incoming_->file.close();
    }
}

std::string FileReceiver::sanitize_filename(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == ".." || base.find('\0') != std::string::npos) {
        return {};
    }
    return base;
}

void FileReceiver::report_violation(const std::string& what) {
    ++violations_;
    out_ << "[Transfer] Warning: " << what << std::endl;
}

void FileReceiver::on_announce(const ControlMessage& message) {
    const std::string filename = sanitize_filename(message.filename);
    if (filename.empty()) {
        report_violation("file announcement with unusable name '" + message.filename + "' ignored.");
        return;
    }

    if (state_ == State::Receiving) {
        report_violation("new file announced while '" + incoming_->filename + "' was incomplete (" +
                         std::to_string(incoming_->bytes_written) + " of " +
                         std::to_string(incoming_->expected_size) + " bytes); partial file left on disk.");
        incoming_->file.close();
        incoming_.reset();
        state_ = State::Idle;
    }

    incoming_.emplace();
    incoming_->filename = filename;
    incoming_->path = directory_ / (RECEIVED_PREFIX + filename);
    incoming_->expected_size = message.size;
    incoming_->file.open(incoming_->path, std::ios::binary | std::ios::trunc);
    state_ = State::Receiving;

    out_ << "Incoming file: " << filename << " (" << message.size << " bytes), saving as '"
         << incoming_->path.string() << "'" << std::endl;

    if (!incoming_->file.is_open()) {
        // Keep accounting for the chunks so they are not mistaken for strays
        incoming_->failed = true;
        out_ << "[Transfer] Cannot open '" << incoming_->path.string()
             << "' for writing; the incoming data will be discarded." << std::endl;
    }

    if (incoming_->expected_size == 0) {
        finish();
    }
}

void FileReceiver::on_chunk(const ChunkUnit& chunk) {
    if (state_ != State::Receiving) {
        report_violation("received a file chunk (" + std::to_string(chunk.bytes.size()) +
                         " bytes) with no transfer in progress; discarded.");
        return;
    }

    const uint64_t remaining = incoming_->expected_size - incoming_->bytes_written;
    if (chunk.bytes.size() > remaining) {
        write(chunk.bytes.data(), static_cast<std::size_t>(remaining));
        report_violation("'" + incoming_->filename + "' overran its announced size by " +
                         std::to_string(chunk.bytes.size() - remaining) + " bytes; excess discarded.");
    } else {
        write(chunk.bytes.data(), chunk.bytes.size());
    }

    if (incoming_->bytes_written == incoming_->expected_size) {
        finish();
    }
}

void FileReceiver::write(const uint8_t* data, std::size_t len) {
    if (!incoming_->failed && len > 0) {
        incoming_->file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!incoming_->file) {
            incoming_->failed = true;
            out_ << "[Transfer] Write error on '" << incoming_->path.string()
                 << "'; the rest of the incoming data will be discarded." << std::endl;
        }
    }
    incoming_->bytes_written += len;
}

void FileReceiver::finish() {
    incoming_->file.close();
    state_ = State::Complete;

    if (incoming_->failed) {
        out_ << "[Transfer] File '" << incoming_->filename << "' could not be saved." << std::endl;
    } else {
        ++completed_;
        last_completed_ = incoming_->path;
        out_ << "File '" << incoming_->filename << "' received successfully ("
             << incoming_->bytes_written << " bytes)." << std::endl;
    }

    incoming_.reset();
    state_ = State::Idle;
}

void FileReceiver::abort() {
    if (state_ != State::Receiving) {
        return;
    }
    out_ << "[Transfer] Transfer of '" << incoming_->filename << "' interrupted at "
         << incoming_->bytes_written << " of " << incoming_->expected_size
         << " bytes; partial file left at '" << incoming_->path.string() << "'." << std::endl;
    incoming_->file.close();
    incoming_.reset();
    state_ = State::Idle;
}

} // namespace tether
