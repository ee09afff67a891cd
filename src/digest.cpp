#include "digest.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace digest {

std::string fingerprint(const uint8_t* data, std::size_t size) {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }

    unsigned char hash[crypto_generichash_BYTES]; // 32 bytes
    crypto_generichash(hash, sizeof(hash), data, size, nullptr, 0);

    // Convert to hex string
    std::ostringstream oss;
    for (size_t i = 0; i < sizeof(hash); ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string fingerprint(const std::vector<uint8_t>& data) {
    return fingerprint(data.data(), data.size());
}

std::string short_fingerprint(const std::string& fingerprint) {
    return fingerprint.substr(0, 12);
}

} // namespace digest
