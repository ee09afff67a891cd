#include <gtest/gtest.h>
#include <cstring>
#include "errors.hpp"
#include "protocol/handshake.hpp"

using namespace protocol;

TEST(Handshake, FixedLayoutWithNulPadding) {
    auto buf = serialize_handshake({"TX1", "photo.jpg", 1024});

    ASSERT_EQ(buf.size(), 154u);
    EXPECT_EQ(std::memcmp(buf.data(), "TX1", 3), 0);
    for (std::size_t i = 3; i < IDENTITY_FIELD_SIZE; ++i) EXPECT_EQ(buf[i], 0) << "identity byte " << i;

    EXPECT_EQ(std::memcmp(buf.data() + 50, "photo.jpg", 9), 0);
    for (std::size_t i = 59; i < 150; ++i) EXPECT_EQ(buf[i], 0) << "filename byte " << i;

    // 1024 big-endian
    EXPECT_EQ(buf[150], 0x00);
    EXPECT_EQ(buf[151], 0x00);
    EXPECT_EQ(buf[152], 0x04);
    EXPECT_EQ(buf[153], 0x00);
}

TEST(Handshake, FieldsDecodeBack) {
    auto buf = serialize_handshake({"camera-north", "img_0001.png", 70000});

    EXPECT_EQ(decode_text_field(buf.data(), IDENTITY_FIELD_SIZE), "camera-north");
    EXPECT_EQ(decode_text_field(buf.data() + IDENTITY_FIELD_SIZE, FILENAME_FIELD_SIZE), "img_0001.png");
    EXPECT_EQ(decode_frame_size(buf.data() + IDENTITY_FIELD_SIZE + FILENAME_FIELD_SIZE), 70000u);
}

TEST(Handshake, TextFieldWithoutNulUsesWholeField) {
    std::string full(IDENTITY_FIELD_SIZE, 'x');
    auto buf = serialize_handshake({full, "a", 11});
    EXPECT_EQ(decode_text_field(buf.data(), IDENTITY_FIELD_SIZE), full);
}

TEST(Handshake, OversizedFieldsAreConfigurationErrors) {
    EXPECT_THROW(serialize_handshake({std::string(51, 'i'), "a.jpg", 1024}), errors::ConfigurationError);
    EXPECT_THROW(serialize_handshake({"TX1", std::string(101, 'f'), 1024}), errors::ConfigurationError);
}

TEST(Handshake, FrameSizeWithoutPayloadIsRejectedBeforeSending) {
    EXPECT_THROW(serialize_handshake({"TX1", "a.jpg", 10}), errors::ConfigurationError);
    EXPECT_THROW(serialize_handshake({"TX1", "a.jpg", 0}), errors::ConfigurationError);
    EXPECT_NO_THROW(serialize_handshake({"TX1", "a.jpg", 11}));
}

TEST(Handshake, ReceiverValidatesFrameSize) {
    EXPECT_THROW(validate_frame_size(10, 1 << 20), errors::ProtocolError);
    EXPECT_THROW(validate_frame_size(0, 1 << 20), errors::ProtocolError);
    EXPECT_THROW(validate_frame_size((1 << 20) + 1, 1 << 20), errors::ProtocolError);
    EXPECT_NO_THROW(validate_frame_size(11, 1 << 20));
    EXPECT_NO_THROW(validate_frame_size(1 << 20, 1 << 20));
}
