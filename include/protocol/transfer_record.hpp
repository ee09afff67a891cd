#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// Metadata of one completed image transfer
struct TransferRecord {
    std::string identity;
    std::string filename;
    std::string save_path;
    std::string timestamp;   // local completion time, "YYYY-mm-dd HH:MM:SS"
    uint32_t frames = 0;
    uint64_t bytes = 0;      // reconstructed size, padding included
    std::string digest;      // BLAKE2b-256 hex of the reconstructed bytes
    int slot = -1;           // feed slot that received the image
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferRecord, identity, filename, save_path, timestamp, frames, bytes, digest, slot)

} // namespace protocol
