#include "config.hpp"
#include "errors.hpp"
#include "protocol/frame.hpp"
#include "protocol/handshake.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace config {

void ReceiverConfig::validate() const {
    if (slot_count == 0) {
        throw errors::ConfigurationError("receiver.slot_count must be at least 1");
    }
    for (const auto& [identity, slot] : preferred_slots) {
        if (slot >= slot_count) {
            throw errors::ConfigurationError("preferred slot " + std::to_string(slot) + " for '" + identity +
                                             "' is outside the " + std::to_string(slot_count) + " feed slots");
        }
    }
    if (max_frame_size <= protocol::HEADER_SIZE) {
        throw errors::ConfigurationError("receiver.max_frame_size must exceed the frame header size");
    }
    if (idle_timeout_ms == 0 || accept_poll_ms == 0) {
        throw errors::ConfigurationError("receiver timeouts must be non-zero");
    }
    if (output_dir.empty()) {
        throw errors::ConfigurationError("receiver.output_dir must not be empty");
    }
}

std::filesystem::path ReceiverConfig::history_path() const {
    if (history_file.empty()) return {};
    return std::filesystem::path(output_dir) / history_file;
}

void TransmitterConfig::validate() const {
    if (identity.empty() || identity.size() > protocol::IDENTITY_FIELD_SIZE) {
        throw errors::ConfigurationError("transmitter.identity must be 1.." +
                                         std::to_string(protocol::IDENTITY_FIELD_SIZE) + " bytes");
    }
    if (frame_size <= protocol::HEADER_SIZE) {
        throw errors::ConfigurationError("transmitter.frame_size " + std::to_string(frame_size) +
                                         " leaves no room for payload; it must exceed " +
                                         std::to_string(protocol::HEADER_SIZE));
    }
    if (columns == 0 || columns > protocol::MAX_FIELD_VALUE) {
        throw errors::ConfigurationError("transmitter.columns must be between 1 and 65535");
    }
    if (port == 0) {
        throw errors::ConfigurationError("transmitter.port must be set");
    }
    if (jpeg_quality < 1 || jpeg_quality > 100) {
        throw errors::ConfigurationError("transmitter.jpeg_quality must be between 1 and 100");
    }
}

// ─── JSON mapping ───────────────────────────────────────────────────────────

namespace {

// JSON numbers are range-checked against T rather than narrowed
template <typename T>
T checked_integer(const nlohmann::json& value, const std::string& name) {
    constexpr uint64_t max = static_cast<uint64_t>(std::numeric_limits<T>::max());
    constexpr int64_t min = static_cast<int64_t>(std::numeric_limits<T>::min());
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v <= max) return static_cast<T>(v);
    } else if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v >= min && (v < 0 || static_cast<uint64_t>(v) <= max)) return static_cast<T>(v);
    }
    throw errors::ConfigurationError(name + " must be an integer between " + std::to_string(min) + " and " +
                                     std::to_string(max) + ", got " + value.dump());
}

template <typename T>
T integer_or(const nlohmann::json& j, const char* section, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    return checked_integer<T>(*it, std::string(section) + "." + key);
}

void require_object(const nlohmann::json& j, const char* section) {
    if (!j.is_object()) {
        throw errors::ConfigurationError(std::string(section) + " must be a JSON object");
    }
}

} // namespace

void to_json(nlohmann::json& j, const ReceiverConfig& c) {
    j = nlohmann::json{
        {"host", c.host},
        {"port", c.port},
        {"output_dir", c.output_dir},
        {"slot_count", c.slot_count},
        {"preferred_slots", c.preferred_slots},
        {"idle_timeout_ms", c.idle_timeout_ms},
        {"accept_poll_ms", c.accept_poll_ms},
        {"drain_timeout_ms", c.drain_timeout_ms},
        {"max_frame_size", c.max_frame_size},
        {"keep_raw_frames", c.keep_raw_frames},
        {"history_file", c.history_file}
    };
}

void from_json(const nlohmann::json& j, ReceiverConfig& c) {
    require_object(j, "receiver");
    c.host = j.value("host", c.host);
    c.port = integer_or(j, "receiver", "port", c.port);
    c.output_dir = j.value("output_dir", c.output_dir);
    c.slot_count = integer_or(j, "receiver", "slot_count", c.slot_count);
    if (j.contains("preferred_slots")) {
        const auto& slots = j.at("preferred_slots");
        require_object(slots, "receiver.preferred_slots");
        c.preferred_slots.clear();
        for (auto it = slots.begin(); it != slots.end(); ++it) {
            c.preferred_slots[it.key()] =
                checked_integer<std::size_t>(it.value(), "receiver.preferred_slots." + it.key());
        }
    }
    c.idle_timeout_ms = integer_or(j, "receiver", "idle_timeout_ms", c.idle_timeout_ms);
    c.accept_poll_ms = integer_or(j, "receiver", "accept_poll_ms", c.accept_poll_ms);
    c.drain_timeout_ms = integer_or(j, "receiver", "drain_timeout_ms", c.drain_timeout_ms);
    c.max_frame_size = integer_or(j, "receiver", "max_frame_size", c.max_frame_size);
    c.keep_raw_frames = j.value("keep_raw_frames", c.keep_raw_frames);
    c.history_file = j.value("history_file", c.history_file);
}

void to_json(nlohmann::json& j, const TransmitterConfig& c) {
    j = nlohmann::json{
        {"identity", c.identity},
        {"host", c.host},
        {"port", c.port},
        {"frame_size", c.frame_size},
        {"columns", c.columns},
        {"jpeg_quality", c.jpeg_quality},
        {"reencode", c.reencode},
        {"connect_timeout_ms", c.connect_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, TransmitterConfig& c) {
    require_object(j, "transmitter");
    c.identity = j.value("identity", c.identity);
    c.host = j.value("host", c.host);
    c.port = integer_or(j, "transmitter", "port", c.port);
    c.frame_size = integer_or(j, "transmitter", "frame_size", c.frame_size);
    c.columns = integer_or(j, "transmitter", "columns", c.columns);
    c.jpeg_quality = integer_or(j, "transmitter", "jpeg_quality", c.jpeg_quality);
    c.reencode = j.value("reencode", c.reencode);
    c.connect_timeout_ms = integer_or(j, "transmitter", "connect_timeout_ms", c.connect_timeout_ms);
}

void to_json(nlohmann::json& j, const AppConfig& c) {
    j = nlohmann::json{{"receiver", c.receiver}, {"transmitter", c.transmitter}};
}

void from_json(const nlohmann::json& j, AppConfig& c) {
    require_object(j, "configuration");
    if (j.contains("receiver")) c.receiver = j.at("receiver").get<ReceiverConfig>();
    if (j.contains("transmitter")) c.transmitter = j.at("transmitter").get<TransmitterConfig>();
}

// ─── Files ──────────────────────────────────────────────────────────────────

AppConfig parse(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return AppConfig{};
    }
    try {
        return nlohmann::json::parse(text).get<AppConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw errors::ConfigurationError(std::string("invalid configuration: ") + e.what());
    }
}

AppConfig load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return AppConfig{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw errors::ConfigurationError("Could not open config file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

void save(const AppConfig& cfg, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw errors::ConfigurationError("Could not open config file for writing: " + path);
    }
    nlohmann::json j = cfg;
    file << j.dump(4) << "\n";
}

} // namespace config
