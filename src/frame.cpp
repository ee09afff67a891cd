#include "protocol/frame.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace protocol {

namespace {

uint16_t checked_field(uint32_t value, const char* name) {
    if (value > MAX_FIELD_VALUE) {
        throw std::out_of_range(std::string("frame header field '") + name + "' out of range: " +
                                std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

} // namespace

FrameHeader make_header(uint32_t frame_index, uint32_t row, uint32_t col, uint32_t total_frames) {
    return FrameHeader{
        checked_field(frame_index, "frame_index"),
        checked_field(row, "row"),
        checked_field(col, "col"),
        checked_field(total_frames, "total_frames"),
        0
    };
}

std::array<uint8_t, HEADER_SIZE> serialize_header(const FrameHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint16_t index = htons(header.frame_index);
    uint16_t row = htons(header.row);
    uint16_t col = htons(header.col);
    uint16_t total = htons(header.total_frames);
    uint16_t res = htons(header.reserved);

    std::memcpy(buffer.data(), &index, 2);
    std::memcpy(buffer.data() + 2, &row, 2);
    std::memcpy(buffer.data() + 4, &col, 2);
    std::memcpy(buffer.data() + 6, &total, 2);
    std::memcpy(buffer.data() + 8, &res, 2);

    return buffer;
}

FrameHeader deserialize_header(const uint8_t* buffer) {
    FrameHeader header;
    uint16_t index, row, col, total, res;

    std::memcpy(&index, buffer, 2);
    std::memcpy(&row, buffer + 2, 2);
    std::memcpy(&col, buffer + 4, 2);
    std::memcpy(&total, buffer + 6, 2);
    std::memcpy(&res, buffer + 8, 2);

    header.frame_index = ntohs(index);
    header.row = ntohs(row);
    header.col = ntohs(col);
    header.total_frames = ntohs(total);
    header.reserved = ntohs(res);

    return header;
}

FrameHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    return deserialize_header(buffer.data());
}

} // namespace protocol
