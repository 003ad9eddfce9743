#include "tether/file_transfer.hpp"
#include <algorithm>
#include <vector>

namespace tether {

FileSender::FileSender(ChannelFramer& framer, boost::asio::any_io_executor executor,
                       std::size_t chunk_size, std::ostream& out)
    : framer_(framer),
      executor_(std::move(executor)),
      chunk_size_(chunk_size),
      out_(out) {}

bool FileSender::send_file(const std::filesystem::path& path, DoneHandler done) {
    if (current_) {
        out_ << "[Transfer] A file is already being sent ('" << current_->filename
             << "'); try again when it completes." << std::endl;
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        out_ << "[Transfer] Cannot send '" << path.string() << "': not a readable file." << std::endl;
        return false;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        out_ << "[Transfer] Cannot send '" << path.string() << "': " << ec.message() << std::endl;
        return false;
    }
    if (size > MAX_ANNOUNCED_SIZE) {
        out_ << "[Transfer] Cannot send '" << path.string() << "': " << size << " bytes is too large to announce." << std::endl;
        return false;
    }

    auto transfer = std::make_shared<Outgoing>();
    transfer->file.open(path, std::ios::binary);
    if (!transfer->file.is_open()) {
        out_ << "[Transfer] Cannot open '" << path.string() << "' for reading." << std::endl;
        return false;
    }
    transfer->filename = path.filename().string();
    transfer->size = size;
    transfer->done = std::move(done);
    current_ = transfer;

    out_ << "Sending file '" << transfer->filename << "' (" << transfer->size << " bytes)..." << std::endl;

    ControlMessage meta;
    meta.filename = transfer->filename;
    meta.size = transfer->size;
    framer_.send_control(meta, [this, transfer](const boost::system::error_code& ec) {
        if (ec) {
            finish(transfer, ec);
            return;
        }
        pump(transfer);
    });
    return true;
}

void FileSender::pump(const std::shared_ptr<Outgoing>& transfer) {
    if (transfer->cancelled) {
        finish(transfer, boost::asio::error::operation_aborted);
        return;
    }
    if (transfer->sent == transfer->size) {
        finish(transfer, {});
        return;
    }

    const auto want = static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size_, transfer->size - transfer->sent));
    std::vector<uint8_t> data(want);
    transfer->file.read(reinterpret_cast<char*>(data.data()), want);
    if (static_cast<std::size_t>(transfer->file.gcount()) != want) {
        out_ << "[Transfer] Read error on '" << transfer->filename << "' after "
             << transfer->sent << " bytes; file changed or became unreadable." << std::endl;
        finish(transfer, boost::system::errc::make_error_code(boost::system::errc::io_error));
        return;
    }

    transfer->sent += want;
    ++transfer->chunks;
    framer_.send_chunk(std::move(data), [this, transfer](const boost::system::error_code& ec) {
        if (ec) {
            finish(transfer, ec);
            return;
        }
        // Yield to the executor between chunks
        boost::asio::post(executor_, [this, transfer]() { pump(transfer); });
    });
}

void FileSender::finish(const std::shared_ptr<Outgoing>& transfer, const boost::system::error_code& ec) {
    if (current_ == transfer) {
        current_.reset();
    }
    transfer->file.close();

    if (!ec) {
        out_ << "File '" << transfer->filename << "' sent (" << transfer->size << " bytes in "
             << transfer->chunks << " chunks)." << std::endl;
    } else if (ec == boost::asio::error::operation_aborted) {
        out_ << "[Transfer] Sending '" << transfer->filename << "' stopped after "
             << transfer->sent << " of " << transfer->size << " bytes." << std::endl;
    } else {
        out_ << "[Transfer] Sending '" << transfer->filename << "' failed: " << ec.message() << std::endl;
    }

    if (transfer->done) {
        auto done = std::move(transfer->done);
        transfer->done = nullptr;
        done(ec);
    }
}

void FileSender::cancel() {
    if (current_) {
        current_->cancelled = true;
    }
}

} // namespace tether
