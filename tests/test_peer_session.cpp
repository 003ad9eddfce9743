#include "tether/peer_session.hpp"
#include "fake_transport.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <sstream>

using namespace tether;

namespace {

// Operator input fed from the test; lines queue until a read asks for one
class FakeLineSource : public LineSource {
public:
    explicit FakeLineSource(boost::asio::io_context& io) : io_(io) {}

    void async_read_line(LineHandler handler) override {
        pending_ = std::move(handler);
        pump();
    }

    void close() override {
        closed_ = true;
        if (pending_) {
            auto handler = std::move(pending_);
            pending_ = nullptr;
            boost::asio::post(io_, [handler]() { handler(boost::asio::error::operation_aborted, {}); });
        }
    }

    void push(std::string line) {
        lines_.push_back(std::move(line));
        pump();
    }

    bool closed() const { return closed_; }

private:
    void pump() {
        if (!pending_ || lines_.empty()) {
            return;
        }
        auto handler = std::move(pending_);
        pending_ = nullptr;
        auto line = std::move(lines_.front());
        lines_.pop_front();
        boost::asio::post(io_, [handler, line]() { handler({}, line); });
    }

    boost::asio::io_context& io_;
    std::deque<std::string> lines_;
    LineHandler pending_;
    bool closed_ = false;
};

class PeerSessionTest : public test::TempDirTest {
protected:
    PeerSessionTest()
        : transport_(io_, log_),
          exchange_(io_, log_),
          input_(io_),
          remote_(std::make_shared<test::FakeChannel>(io_)) {
        transport_.channel = std::make_shared<test::FakeChannel>(io_);
        transport_.channel->connect(*remote_);
        remote_->connect(*transport_.channel);
        remote_->set_receive_handler([this](TransportMessage message) {
            remote_units_.push_back(classify(std::move(message)));
        });

        exchange_.input = SessionDescriptor(SessionDescriptor::Type::Answer, "v=1\n").serialize();
        config_.role = Role::Initiator;
    }

    std::unique_ptr<PeerSession> make_session() {
        config_.download_dir = dir_;
        return std::make_unique<PeerSession>(io_, config_, transport_, exchange_, input_, out_);
    }

    // The session keeps a signal wait pending, so the io_context never runs dry
    template <class Done>
    bool run_until(Done done) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            io_.run_one_for(std::chrono::milliseconds(20));
            if (io_.stopped()) {
                io_.restart();
            }
        }
        return done();
    }

    std::vector<std::string> remote_chat() const {
        std::vector<std::string> texts;
        for (const auto& unit : remote_units_) {
            if (auto* chat = std::get_if<ChatUnit>(&unit)) {
                texts.push_back(chat->text);
            }
        }
        return texts;
    }

    std::size_t remote_count(std::size_t index) const {
        return static_cast<std::size_t>(std::count_if(remote_units_.begin(), remote_units_.end(),
            [index](const WireUnit& unit) { return unit.index() == index; }));
    }

    std::size_t occurrences(const std::string& needle) const {
        const std::string text = out_.str();
        std::size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
            ++n;
        }
        return n;
    }

    boost::asio::io_context io_;
    std::vector<std::string> log_;
    test::FakeTransport transport_;
    test::FakeExchange exchange_;
    FakeLineSource input_;
    std::ostringstream out_;
    std::shared_ptr<test::FakeChannel> remote_;
    std::vector<WireUnit> remote_units_;
    Config config_;
};

} // namespace

TEST_F(PeerSessionTest, WalksThroughItsLifecycleAndGreets) {
    auto session = make_session();
    EXPECT_EQ(session->state(), PeerSession::State::Created);
    EXPECT_STREQ(to_string(session->state()), "created");

    session->start();
    EXPECT_EQ(session->state(), PeerSession::State::Handshaking);

    ASSERT_TRUE(run_until([&]() { return !remote_units_.empty(); }));
    EXPECT_EQ(session->state(), PeerSession::State::Open);
    EXPECT_STREQ(to_string(session->state()), "open");
    EXPECT_NE(out_.str().find("Data channel is open"), std::string::npos);

    const std::vector<std::string> greeting = {"Test message from this peer."};
    EXPECT_EQ(remote_chat(), greeting);

    session->close();
    ASSERT_TRUE(run_until([&]() { return session->state() == PeerSession::State::Closed; }));
    EXPECT_STREQ(to_string(session->state()), "closed");
    EXPECT_FALSE(session->handshake_failed());
    EXPECT_FALSE(transport_.channel->is_open());
    EXPECT_TRUE(input_.closed());
    EXPECT_EQ(log_.back(), "close");
}

TEST_F(PeerSessionTest, SendsTheConfiguredFileOnOpen) {
    const std::string data = pattern(40000);
    config_.file_to_send = write_file("report.bin", data);
    config_.greeting.clear();

    auto session = make_session();
    session->start();

    // One announcement and three 16 KiB chunks
    ASSERT_TRUE(run_until([&]() {
        return remote_units_.size() == 4 && session->get_file_sender() && !session->get_file_sender()->busy();
    }));

    ASSERT_TRUE(std::holds_alternative<ControlMessage>(remote_units_[0]));
    EXPECT_EQ(std::get<ControlMessage>(remote_units_[0]).filename, "report.bin");
    EXPECT_EQ(std::get<ControlMessage>(remote_units_[0]).size, data.size());

    std::string received;
    for (std::size_t i = 1; i < remote_units_.size(); ++i) {
        ASSERT_TRUE(std::holds_alternative<ChunkUnit>(remote_units_[i]));
        const auto& bytes = std::get<ChunkUnit>(remote_units_[i]).bytes;
        received.append(bytes.begin(), bytes.end());
    }
    EXPECT_TRUE(received == data);
    EXPECT_TRUE(remote_chat().empty());
    EXPECT_NE(out_.str().find("File 'report.bin' sent (40000 bytes in 3 chunks)."), std::string::npos);

    session->close();
    run_until([&]() { return session->state() == PeerSession::State::Closed; });
}

TEST_F(PeerSessionTest, ByeSendsTheFarewellBeforeClosing) {
    input_.push("bye");

    auto session = make_session();
    session->start();
    ASSERT_TRUE(run_until([&]() { return session->state() == PeerSession::State::Closed; }));

    // A send on a closed FakeChannel is never delivered, so the farewell
    // arriving means it was written before the close
    const std::vector<std::string> expected = {"Test message from this peer.", FAREWELL_TEXT};
    EXPECT_EQ(remote_chat(), expected);
    EXPECT_FALSE(transport_.channel->is_open());
    EXPECT_NE(out_.str().find("Ending chat. Goodbye!"), std::string::npos);
}

TEST_F(PeerSessionTest, SendWithoutPathPrintsUsage) {
    config_.greeting.clear();
    input_.push("/send");
    input_.push("/send   ");
    input_.push("done");

    auto session = make_session();
    session->start();
    ASSERT_TRUE(run_until([&]() { return !remote_chat().empty(); }));

    EXPECT_EQ(occurrences("Usage: /send <path>"), 2u);
    EXPECT_EQ(remote_count(1), 0u);
    EXPECT_EQ(remote_chat(), std::vector<std::string>{"done"});

    session->close();
    run_until([&]() { return session->state() == PeerSession::State::Closed; });
}

TEST_F(PeerSessionTest, SecondSendIsRefusedWhileOneIsRunning) {
    config_.file_to_send = write_file("big.bin", pattern(1024 * 1024));
    config_.greeting.clear();
    const auto other = write_file("other.bin", "other");
    input_.push("/send " + other);

    auto session = make_session();
    session->start();

    ASSERT_TRUE(run_until([&]() {
        return remote_units_.size() == 1 + 64 && session->get_file_sender() && !session->get_file_sender()->busy();
    }));

    EXPECT_EQ(remote_count(1), 1u);
    EXPECT_EQ(std::get<ControlMessage>(remote_units_[0]).filename, "big.bin");
    EXPECT_NE(out_.str().find("A file is already being sent ('big.bin')"), std::string::npos) << out_.str();

    session->close();
    run_until([&]() { return session->state() == PeerSession::State::Closed; });
}

TEST_F(PeerSessionTest, LostChannelLeavesThePartialFile) {
    config_.greeting.clear();
    auto session = make_session();
    session->start();
    ASSERT_TRUE(run_until([&]() { return session->state() == PeerSession::State::Open; }));

    ControlMessage meta;
    meta.filename = "incoming.bin";
    meta.size = 100;
    remote_->send(TransportMessage::text(serialize_control(meta)), nullptr);
    remote_->send(TransportMessage::binary(std::string(10, 'z')), nullptr);

    FileReceiver& receiver = session->get_file_receiver();
    ASSERT_TRUE(run_until([&]() { return receiver.bytes_written() == 10; }));
    EXPECT_EQ(receiver.state(), FileReceiver::State::Receiving);
    EXPECT_EQ(receiver.expected_size(), 100u);

    transport_.channel->close_with(boost::asio::error::eof);
    ASSERT_TRUE(run_until([&]() { return session->state() == PeerSession::State::Closed; }));

    EXPECT_EQ(receiver.state(), FileReceiver::State::Idle);
    EXPECT_EQ(receiver.completed(), 0u);
    const auto partial = dir_ / "received_incoming.bin";
    ASSERT_TRUE(std::filesystem::exists(partial));
    EXPECT_EQ(std::filesystem::file_size(partial), 10u);
    EXPECT_NE(out_.str().find("interrupted at 10 of 100 bytes"), std::string::npos) << out_.str();
}

TEST_F(PeerSessionTest, FailedHandshakeEndsTheSession) {
    transport_.open_error = boost::asio::error::connection_refused;

    auto session = make_session();
    session->start();
    ASSERT_TRUE(run_until([&]() { return session->state() == PeerSession::State::Closed; }));

    EXPECT_TRUE(session->handshake_failed());
    EXPECT_EQ(session->get_file_sender(), nullptr);
    EXPECT_TRUE(input_.closed());
    EXPECT_EQ(log_.back(), "close");
}
