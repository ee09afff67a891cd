#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace protocol {

constexpr std::size_t HEADER_SIZE = 10;
constexpr uint32_t MAX_FIELD_VALUE = 0xFFFF;

// Fixed 10-byte frame header, all fields big-endian on the wire.
// frame_index is informational only; row/col drive placement.
struct FrameHeader {
    uint16_t frame_index;  // 2 bytes
    uint16_t row;          // 2 bytes
    uint16_t col;          // 2 bytes
    uint16_t total_frames; // 2 bytes
    uint16_t reserved;     // 2 bytes, zero on send
};

// Builds a header from wider values, throwing std::out_of_range if any
// field does not fit in 16 bits.
FrameHeader make_header(uint32_t frame_index, uint32_t row, uint32_t col, uint32_t total_frames);

std::array<uint8_t, HEADER_SIZE> serialize_header(const FrameHeader& header);
FrameHeader deserialize_header(const uint8_t* buffer);
FrameHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

} // namespace protocol
