#include <gtest/gtest.h>
#include <fstream>
#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

TEST(Config, DefaultsMatchTheReferenceDeployment) {
    config::AppConfig cfg;

    EXPECT_EQ(cfg.receiver.port, config::DEFAULT_PORT);
    EXPECT_EQ(cfg.receiver.output_dir, "RX_Output");
    EXPECT_EQ(cfg.receiver.slot_count, 4u);
    EXPECT_EQ(cfg.receiver.preferred_slots.at("TX1"), 0u);
    EXPECT_EQ(cfg.receiver.preferred_slots.at("TX2"), 1u);
    EXPECT_EQ(cfg.receiver.idle_timeout_ms, 60000u);

    EXPECT_EQ(cfg.transmitter.frame_size, 1024u);
    EXPECT_EQ(cfg.transmitter.columns, 20u);
    EXPECT_EQ(cfg.transmitter.jpeg_quality, 40);

    EXPECT_NO_THROW(cfg.receiver.validate());
    EXPECT_NO_THROW(cfg.transmitter.validate());
}

TEST(Config, PartialDocumentKeepsDefaultsForMissingKeys) {
    auto cfg = config::parse(R"({
        "receiver": { "port": 5000, "slot_count": 6, "preferred_slots": { "cam-a": 5 } },
        "transmitter": { "identity": "cam-a" }
    })");

    EXPECT_EQ(cfg.receiver.port, 5000);
    EXPECT_EQ(cfg.receiver.slot_count, 6u);
    ASSERT_EQ(cfg.receiver.preferred_slots.size(), 1u);
    EXPECT_EQ(cfg.receiver.preferred_slots.at("cam-a"), 5u);
    EXPECT_EQ(cfg.receiver.output_dir, "RX_Output");

    EXPECT_EQ(cfg.transmitter.identity, "cam-a");
    EXPECT_EQ(cfg.transmitter.frame_size, 1024u);
}

TEST(Config, BlankTextYieldsDefaults) {
    auto cfg = config::parse("  \n");
    EXPECT_EQ(cfg.receiver.port, config::DEFAULT_PORT);
}

TEST(Config, MalformedDocumentIsConfigurationError) {
    EXPECT_THROW(config::parse("{ \"receiver\": "), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"receiver": {"port": "not a number"}})"), errors::ConfigurationError);
}

TEST(Config, OutOfRangeNumbersAreRejectedNotTruncated) {
    // 70000 would wrap to 4464 in an unsigned short
    EXPECT_THROW(config::parse(R"({"receiver": {"port": 70000}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"transmitter": {"port": 65536}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"receiver": {"slot_count": -1}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"receiver": {"idle_timeout_ms": 4294967296}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"receiver": {"preferred_slots": {"TX1": -2}}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"transmitter": {"frame_size": -1024}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"transmitter": {"columns": 2.5}})"), errors::ConfigurationError);
    EXPECT_THROW(config::parse(R"({"receiver": 12})"), errors::ConfigurationError);

    auto cfg = config::parse(R"({"receiver": {"port": 65535, "max_frame_size": 4294967295},
                                 "transmitter": {"jpeg_quality": -5}})");
    EXPECT_EQ(cfg.receiver.port, 65535);
    EXPECT_EQ(cfg.receiver.max_frame_size, 4294967295u);
    // In range for the type, so left for validate() to refuse
    EXPECT_EQ(cfg.transmitter.jpeg_quality, -5);
    EXPECT_THROW(cfg.transmitter.validate(), errors::ConfigurationError);
}

TEST(Config, ReceiverValidationRejectsUnusableSettings) {
    config::ReceiverConfig cfg;
    cfg.slot_count = 0;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::ReceiverConfig{};
    cfg.preferred_slots["TX3"] = 4;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::ReceiverConfig{};
    cfg.max_frame_size = 10;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::ReceiverConfig{};
    cfg.idle_timeout_ms = 0;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::ReceiverConfig{};
    cfg.output_dir.clear();
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);
}

TEST(Config, TransmitterValidationRejectsUnusableSettings) {
    config::TransmitterConfig cfg;
    cfg.frame_size = 10;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::TransmitterConfig{};
    cfg.identity = std::string(51, 'x');
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::TransmitterConfig{};
    cfg.columns = 0;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::TransmitterConfig{};
    cfg.jpeg_quality = 0;
    EXPECT_THROW(cfg.validate(), errors::ConfigurationError);

    cfg = config::TransmitterConfig{};
    cfg.frame_size = 11;
    EXPECT_NO_THROW(cfg.validate());
}

TEST(Config, SavedFileLoadsBack) {
    test_support::TempDir dir;
    std::string path = (dir.path() / "gridrelay.json").string();

    config::AppConfig cfg;
    cfg.receiver.port = 6001;
    cfg.receiver.keep_raw_frames = false;
    cfg.receiver.preferred_slots = {{"north", 2}, {"south", 3}};
    cfg.transmitter.columns = 8;
    cfg.transmitter.reencode = true;
    config::save(cfg, path);

    auto loaded = config::load(path);
    EXPECT_EQ(loaded.receiver.port, 6001);
    EXPECT_FALSE(loaded.receiver.keep_raw_frames);
    EXPECT_EQ(loaded.receiver.preferred_slots, cfg.receiver.preferred_slots);
    EXPECT_EQ(loaded.transmitter.columns, 8u);
    EXPECT_TRUE(loaded.transmitter.reencode);
}

TEST(Config, MissingFileYieldsDefaults) {
    test_support::TempDir dir;
    auto cfg = config::load((dir.path() / "absent.json").string());
    EXPECT_EQ(cfg.transmitter.identity, "TX1");
}

TEST(Config, HistoryPathFollowsOutputDir) {
    config::ReceiverConfig cfg;
    cfg.output_dir = "/srv/feeds";
    EXPECT_EQ(cfg.history_path().string(), "/srv/feeds/transfers.jsonl");

    cfg.history_file.clear();
    EXPECT_TRUE(cfg.history_path().empty());
}
