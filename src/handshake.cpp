#include "protocol/handshake.hpp"
#include "protocol/frame.hpp"
#include "errors.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

namespace {

void write_text_field(uint8_t* out, std::size_t size, const std::string& value, const char* name) {
    if (value.size() > size) {
        throw errors::ConfigurationError(std::string(name) + " is " + std::to_string(value.size()) +
                                         " bytes, field holds " + std::to_string(size));
    }
    std::memset(out, 0, size);
    std::memcpy(out, value.data(), value.size());
}

} // namespace

std::array<uint8_t, HANDSHAKE_SIZE> serialize_handshake(const Handshake& handshake) {
    if (handshake.frame_size <= HEADER_SIZE) {
        throw errors::ConfigurationError("frame size " + std::to_string(handshake.frame_size) +
                                         " leaves no room for payload (header is " +
                                         std::to_string(HEADER_SIZE) + " bytes)");
    }

    std::array<uint8_t, HANDSHAKE_SIZE> buffer;
    write_text_field(buffer.data(), IDENTITY_FIELD_SIZE, handshake.identity, "identity");
    write_text_field(buffer.data() + IDENTITY_FIELD_SIZE, FILENAME_FIELD_SIZE, handshake.filename, "filename");

    uint32_t size = htonl(handshake.frame_size);
    std::memcpy(buffer.data() + IDENTITY_FIELD_SIZE + FILENAME_FIELD_SIZE, &size, 4);
    return buffer;
}

std::string decode_text_field(const uint8_t* data, std::size_t size) {
    const auto* begin = reinterpret_cast<const char*>(data);
    const void* nul = std::memchr(begin, '\0', size);
    std::size_t length = nul ? static_cast<std::size_t>(static_cast<const char*>(nul) - begin) : size;
    return std::string(begin, length);
}

uint32_t decode_frame_size(const uint8_t* data) {
    uint32_t size;
    std::memcpy(&size, data, 4);
    return ntohl(size);
}

void validate_frame_size(uint32_t frame_size, uint32_t max_frame_size) {
    if (frame_size <= HEADER_SIZE) {
        throw errors::ProtocolError("invalid frame size " + std::to_string(frame_size) +
                                    ": must exceed the " + std::to_string(HEADER_SIZE) + "-byte header");
    }
    if (frame_size > max_frame_size) {
        throw errors::ProtocolError("frame size " + std::to_string(frame_size) +
                                    " exceeds the limit of " + std::to_string(max_frame_size));
    }
}

} // namespace protocol
