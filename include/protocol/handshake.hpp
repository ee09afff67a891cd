#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace protocol {

constexpr std::size_t IDENTITY_FIELD_SIZE = 50;
constexpr std::size_t FILENAME_FIELD_SIZE = 100;
constexpr std::size_t FRAME_SIZE_FIELD_SIZE = 4;
constexpr std::size_t HANDSHAKE_SIZE = IDENTITY_FIELD_SIZE + FILENAME_FIELD_SIZE + FRAME_SIZE_FIELD_SIZE;

// Sent once per connection, before any frame
struct Handshake {
    std::string identity;
    std::string filename;
    uint32_t frame_size; // bytes per frame, header included
};

// Throws errors::ConfigurationError when a string does not fit its field
// or frame_size leaves no room for payload.
std::array<uint8_t, HANDSHAKE_SIZE> serialize_handshake(const Handshake& handshake);

// Text up to the first NUL of a fixed-width field
std::string decode_text_field(const uint8_t* data, std::size_t size);

uint32_t decode_frame_size(const uint8_t* data);

// Throws errors::ProtocolError unless HEADER_SIZE < frame_size <= max_frame_size
void validate_frame_size(uint32_t frame_size, uint32_t max_frame_size);

} // namespace protocol
