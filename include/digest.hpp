#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace digest {

// BLAKE2b-256 of the bytes using libsodium crypto_generichash.
// Returns the 32-byte hash as a lowercase hex string.
std::string fingerprint(const uint8_t* data, std::size_t size);
std::string fingerprint(const std::vector<uint8_t>& data);

// First 12 hex characters, for log lines
std::string short_fingerprint(const std::string& fingerprint);

} // namespace digest
