#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace config {

constexpr unsigned short DEFAULT_PORT = 49697;

struct ReceiverConfig {
    std::string host = "0.0.0.0";
    unsigned short port = DEFAULT_PORT;
    std::string output_dir = "RX_Output";
    std::size_t slot_count = 4;
    std::map<std::string, std::size_t> preferred_slots{{"TX1", 0}, {"TX2", 1}};
    uint32_t idle_timeout_ms = 60000;
    uint32_t accept_poll_ms = 1000;
    uint32_t drain_timeout_ms = 2000;
    uint32_t max_frame_size = 16 * 1024 * 1024;
    bool keep_raw_frames = true;
    std::string history_file = "transfers.jsonl"; // under output_dir, empty disables

    // Throws errors::ConfigurationError
    void validate() const;

    // output_dir/history_file, or empty when the journal is disabled
    std::filesystem::path history_path() const;
};

struct TransmitterConfig {
    std::string identity = "TX1";
    std::string host = "127.0.0.1";
    unsigned short port = DEFAULT_PORT;
    uint32_t frame_size = 1024;
    uint32_t columns = 20;
    int jpeg_quality = 40;
    bool reencode = false;
    uint32_t connect_timeout_ms = 5000;

    // Throws errors::ConfigurationError
    void validate() const;
};

struct AppConfig {
    ReceiverConfig receiver;
    TransmitterConfig transmitter;
};

void to_json(nlohmann::json& j, const ReceiverConfig& c);
void from_json(const nlohmann::json& j, ReceiverConfig& c);
void to_json(nlohmann::json& j, const TransmitterConfig& c);
void from_json(const nlohmann::json& j, TransmitterConfig& c);
void to_json(nlohmann::json& j, const AppConfig& c);
void from_json(const nlohmann::json& j, AppConfig& c);

// Missing keys keep their defaults. A missing file yields defaults; an
// unreadable or malformed one throws errors::ConfigurationError.
AppConfig load(const std::string& path);
AppConfig parse(const std::string& text);
void save(const AppConfig& cfg, const std::string& path);

} // namespace config
