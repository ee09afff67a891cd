#include <gtest/gtest.h>
#include <stdexcept>
#include "protocol/frame.hpp"

using namespace protocol;

TEST(FrameHeader, SerializesBigEndianInFieldOrder) {
    auto buf = serialize_header(make_header(0x0102, 0x0304, 0x0506, 0x0708));

    const std::array<uint8_t, HEADER_SIZE> expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x00, 0x00};
    EXPECT_EQ(buf, expected);
}

TEST(FrameHeader, DeserializeRecoversFields) {
    auto header = deserialize_header(serialize_header(make_header(41, 2, 7, 65535)));

    EXPECT_EQ(header.frame_index, 41);
    EXPECT_EQ(header.row, 2);
    EXPECT_EQ(header.col, 7);
    EXPECT_EQ(header.total_frames, 65535);
    EXPECT_EQ(header.reserved, 0);
}

TEST(FrameHeader, ReservedFieldIsReadButCarriesNoMeaning) {
    std::array<uint8_t, HEADER_SIZE> buf{0, 1, 0, 0, 0, 1, 0, 4, 0xAB, 0xCD};
    auto header = deserialize_header(buf);

    EXPECT_EQ(header.frame_index, 1);
    EXPECT_EQ(header.row, 0);
    EXPECT_EQ(header.col, 1);
    EXPECT_EQ(header.total_frames, 4);
}

TEST(FrameHeader, RejectsValuesBeyondSixteenBits) {
    EXPECT_THROW(make_header(65536, 0, 0, 1), std::out_of_range);
    EXPECT_THROW(make_header(0, 70000, 0, 1), std::out_of_range);
    EXPECT_THROW(make_header(0, 0, 65536, 1), std::out_of_range);
    EXPECT_THROW(make_header(0, 0, 0, 100000), std::out_of_range);
    EXPECT_NO_THROW(make_header(65535, 65535, 65535, 65535));
}
