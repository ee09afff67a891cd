#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>
#include "errors.hpp"
#include "networking.hpp"
#include "test_support.hpp"
#include "transfer.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

class ConnectionManagerTest : public ::testing::Test {
protected:
    ConnectionManagerTest() : slots_(4, {{"TX1", 0}, {"TX2", 1}}) {
        cfg_.host = "127.0.0.1";
        cfg_.port = 0;
        cfg_.output_dir = (dir_.path() / "out").string();
        cfg_.accept_poll_ms = 50;
        cfg_.drain_timeout_ms = 2000;
        cfg_.keep_raw_frames = false;
    }

    std::unique_ptr<networking::ConnectionManager> start_manager(session::ReceiverCallbacks callbacks = {}) {
        auto manager = std::make_unique<networking::ConnectionManager>(
            cfg_, codec_, session::SharedState{slots_, history_}, std::move(callbacks));
        manager->start();
        return manager;
    }

    config::TransmitterConfig transmitter_config(const std::string& identity, unsigned short port) const {
        config::TransmitterConfig tx;
        tx.identity = identity;
        tx.host = "127.0.0.1";
        tx.port = port;
        tx.frame_size = 256;
        tx.columns = 7;
        return tx;
    }

    test_support::TempDir dir_;
    test_support::FakeCodec codec_;
    feed::FeedSlotTable slots_;
    history::TransferHistory history_;
    config::ReceiverConfig cfg_;
};

} // namespace

TEST_F(ConnectionManagerTest, ConcurrentTransmittersAreReassembledIndependently) {
    auto manager = start_manager();
    ASSERT_TRUE(manager->is_running());
    ASSERT_NE(manager->port(), 0);

    constexpr int senders = 10;
    std::vector<std::vector<uint8_t>> images;
    for (int i = 0; i < senders; ++i) {
        images.push_back(test_support::make_test_image("sender-" + std::to_string(i),
                                                       4000 + static_cast<std::size_t>(i) * 377));
    }

    std::atomic<int> delivered{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < senders; ++i) {
        threads.emplace_back([&, i]() {
            networking::Transmitter tx(transmitter_config("tx-" + std::to_string(i), manager->port()));
            auto state = tx.send_bytes(images[i], "img_" + std::to_string(i) + ".bin");
            if (state == transfer::TransferState::COMPLETED) ++delivered;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(delivered.load(), senders);

    ASSERT_TRUE(wait_until([&]() { return history_.size() == static_cast<std::size_t>(senders); }));

    for (int i = 0; i < senders; ++i) {
        std::string id = "tx-" + std::to_string(i);
        auto saved = read_all(dir_.path() / "out" / id / "images" / ("img_" + std::to_string(i) + ".bin"));
        const auto& sent = images[i];
        ASSERT_GE(saved.size(), sent.size()) << id;
        EXPECT_LT(saved.size() - sent.size(), 246u) << id;
        EXPECT_TRUE(std::equal(sent.begin(), sent.end(), saved.begin())) << id;
        EXPECT_TRUE(std::all_of(saved.begin() + static_cast<std::ptrdiff_t>(sent.size()), saved.end(),
                                [](uint8_t b) { return b == 0; })) << id;
    }

    // Four slots, ten identities: every slot ends up showing someone
    for (const auto& slot : slots_.snapshot()) {
        EXPECT_TRUE(slot.identity.has_value());
    }

    EXPECT_TRUE(manager->stop().empty());
    EXPECT_FALSE(manager->is_running());
}

TEST_F(ConnectionManagerTest, PreferredTransmitterLandsInItsSlot) {
    auto manager = start_manager();

    networking::Transmitter tx(transmitter_config("TX2", manager->port()));
    tx.send_bytes(test_support::make_test_image("tx2", 900), "b.jpg");

    ASSERT_TRUE(wait_until([&]() { return history_.size() == 1; }));
    EXPECT_EQ(history_.snapshot()[0].slot, 1);
    EXPECT_EQ(*slots_.snapshot()[1].identity, "TX2");
    manager->stop();
}

TEST_F(ConnectionManagerTest, FailedSessionDoesNotDisturbOthers) {
    std::mutex mutex;
    std::vector<session::FailureReason> failures;
    session::ReceiverCallbacks callbacks;
    callbacks.on_transfer_failed = [&](const std::string&, session::FailureReason reason, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back(reason);
    };
    auto manager = start_manager(std::move(callbacks));

    {
        // Handshake claiming no payload
        networking::Connection bad;
        bad.connect("127.0.0.1", manager->port(), std::chrono::seconds(2));
        auto hs = protocol::serialize_handshake({"bad", "x.jpg", 11});
        hs[protocol::HANDSHAKE_SIZE - 1] = 3;
        bad.write_all(hs.data(), hs.size());

        networking::Transmitter tx(transmitter_config("good", manager->port()));
        EXPECT_EQ(tx.send_bytes(test_support::make_test_image("good", 2000), "ok.jpg"),
                  transfer::TransferState::COMPLETED);
    }

    ASSERT_TRUE(wait_until([&]() { return history_.size() == 1; }));
    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return failures.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(failures[0], session::FailureReason::PROTOCOL_ERROR);
    }
    EXPECT_EQ(history_.snapshot()[0].identity, "good");
    EXPECT_TRUE(manager->stop().empty());
}

TEST_F(ConnectionManagerTest, IdleSessionWindsDownOnStop) {
    auto manager = start_manager();

    networking::Connection idle;
    idle.connect("127.0.0.1", manager->port(), std::chrono::seconds(2));
    ASSERT_TRUE(wait_until([&]() { return manager->active_sessions() == 1; }));

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(manager->stop().empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(cfg_.drain_timeout_ms));
    EXPECT_EQ(manager->active_sessions(), 0u);
}

TEST_F(ConnectionManagerTest, SessionStuckMidFrameIsReportedAndAborted) {
    cfg_.drain_timeout_ms = 300;

    std::atomic<int> cancelled{0};
    session::ReceiverCallbacks callbacks;
    callbacks.on_transfer_failed = [&](const std::string&, session::FailureReason reason, const std::string&) {
        if (reason == session::FailureReason::CANCELLED) ++cancelled;
    };
    auto manager = start_manager(std::move(callbacks));

    networking::Connection stuck;
    stuck.connect("127.0.0.1", manager->port(), std::chrono::seconds(2));
    transfer::FrameStreamSender::send_handshake(stuck, {"slowpoke", "s.jpg", 64});
    const std::array<uint8_t, 5> partial_frame{0, 0, 0, 0, 0};
    stuck.write_all(partial_frame.data(), partial_frame.size());

    ASSERT_TRUE(wait_until([&]() { return manager->active_sessions() == 1; }));
    // Let the session read the handshake and the start of the frame
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto stragglers = manager->stop();
    ASSERT_EQ(stragglers.size(), 1u);
    auto local = stuck.socket().local_endpoint();
    EXPECT_EQ(stragglers[0], local.address().to_string() + ":" + std::to_string(local.port()));
    EXPECT_EQ(cancelled.load(), 1);
    EXPECT_EQ(manager->active_sessions(), 0u);
    EXPECT_EQ(history_.size(), 0u);
}

TEST_F(ConnectionManagerTest, SecondListenerOnTheSamePortFails) {
    auto manager = start_manager();

    cfg_.port = manager->port();
    networking::ConnectionManager second(cfg_, codec_, session::SharedState{slots_, history_});
    EXPECT_THROW(second.start(), errors::TransportError);
    EXPECT_FALSE(second.is_running());
}

TEST_F(ConnectionManagerTest, InvalidConfigurationIsRejectedUpFront) {
    cfg_.slot_count = 0;
    EXPECT_THROW(networking::ConnectionManager(cfg_, codec_, session::SharedState{slots_, history_}),
                 errors::ConfigurationError);
}

TEST(Transmitter, UnreachableReceiverIsReportedPerFile) {
    test_support::TempDir dir;
    fs::path image = dir.path() / "a.jpg";
    {
        std::ofstream out(image, std::ios::binary);
        out << "IMG:payload";
    }

    unsigned short port;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(
            io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    config::TransmitterConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    networking::Transmitter tx(cfg);

    std::vector<std::string> errors_seen;
    networking::TransmitterCallbacks callbacks;
    callbacks.on_error = [&](const std::string& filename, const std::string&) { errors_seen.push_back(filename); };

    std::size_t delivered = tx.send_files({image.string(), (dir.path() / "missing.jpg").string()}, callbacks);
    EXPECT_EQ(delivered, 0u);
    ASSERT_EQ(errors_seen.size(), 2u);
    EXPECT_EQ(errors_seen[0], "a.jpg");
    EXPECT_EQ(errors_seen[1], "missing.jpg");
}

TEST(Transmitter, ReencodeWithoutCodecIsConfigurationError) {
    config::TransmitterConfig cfg;
    cfg.reencode = true;
    EXPECT_THROW(networking::Transmitter tx(cfg), errors::ConfigurationError);
}

TEST(Transmitter, EmptyImageIsRejectedBeforeConnecting) {
    // Nothing listens here, so reaching the connect would be a TransportError
    unsigned short port;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(
            io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    config::TransmitterConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    networking::Transmitter tx(cfg);

    bool completed = false;
    networking::TransmitterCallbacks callbacks;
    callbacks.on_complete = [&completed](const std::string&) { completed = true; };

    EXPECT_THROW(tx.send_bytes({}, "empty.jpg", callbacks), errors::ConfigurationError);
    EXPECT_FALSE(completed);
}

TEST_F(ConnectionManagerTest, EmptyFileInABatchIsReportedAndSkipped) {
    auto manager = start_manager();

    fs::path empty = dir_.path() / "empty.jpg";
    std::ofstream(empty, std::ios::binary).close();
    fs::path good = dir_.path() / "good.jpg";
    {
        auto bytes = test_support::make_test_image("good", 700);
        std::ofstream out(good, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    std::vector<std::string> errors_seen;
    networking::TransmitterCallbacks callbacks;
    callbacks.on_error = [&](const std::string& filename, const std::string&) { errors_seen.push_back(filename); };

    networking::Transmitter tx(transmitter_config("TX1", manager->port()));
    EXPECT_EQ(tx.send_files({empty.string(), good.string()}, callbacks), 1u);
    ASSERT_EQ(errors_seen.size(), 1u);
    EXPECT_EQ(errors_seen[0], "empty.jpg");

    ASSERT_TRUE(wait_until([&]() { return history_.size() == 1; }));
    EXPECT_EQ(history_.snapshot()[0].filename, "good.jpg");
    EXPECT_TRUE(manager->stop().empty());
}
