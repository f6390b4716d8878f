#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <vector>

#include "framecast/protocol/chunk_header.hpp"
#include "framecast/protocol/frame_counter.hpp"

namespace framecast::protocol {
namespace {

using ::testing::ElementsAre;

TEST(ChunkHeaderTest, EncodesBigEndian) {
    ChunkHeader header{7, 3, 1};
    std::vector<uint8_t> payload = {0xAA, 0xBB};

    auto datagram = encode_chunk(header, payload);

    EXPECT_THAT(datagram, ElementsAre(0x00, 0x00, 0x00, 0x07, 0x00, 0x03, 0x00, 0x01, 0xAA, 0xBB));
}

TEST(ChunkHeaderTest, EncodesLargeFields) {
    ChunkHeader header{0xDEADBEEF, 0xFFFF, 0x1234};

    auto datagram = encode_chunk(header, {});

    EXPECT_THAT(datagram, ElementsAre(0xDE, 0xAD, 0xBE, 0xEF, 0xFF, 0xFF, 0x12, 0x34));
}

TEST(ChunkHeaderTest, ParseReturnsPayloadView) {
    std::vector<uint8_t> datagram = {0x00, 0x00, 0x01, 0x00, 0x00, 0x02, 0x00, 0x01, 'h', 'i'};

    ParseError error = ParseError::INVALID_HEADER;
    auto parsed = parse_chunk(datagram, &error);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(error, ParseError::SUCCESS);
    EXPECT_EQ(parsed->header.frame_id, 256u);
    EXPECT_EQ(parsed->header.total_chunks, 2u);
    EXPECT_EQ(parsed->header.chunk_index, 1u);
    ASSERT_EQ(parsed->payload.size(), 2u);
    EXPECT_EQ(parsed->payload.data(), datagram.data() + ChunkHeader::SIZE);
}

TEST(ChunkHeaderTest, HeaderOnlyDatagramHasEmptyPayload) {
    auto datagram = encode_chunk({9, 1, 0}, {});

    auto parsed = parse_chunk(datagram);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->payload.empty());
}

TEST(ChunkHeaderTest, RejectsShortDatagram) {
    for (size_t len = 0; len < ChunkHeader::SIZE; ++len) {
        std::vector<uint8_t> datagram(len, 0x01);
        ParseError error = ParseError::SUCCESS;
        EXPECT_FALSE(parse_chunk(datagram, &error).has_value()) << "length " << len;
        EXPECT_EQ(error, ParseError::PACKET_TOO_SHORT);
    }
}

TEST(ChunkHeaderTest, RejectsZeroTotalChunks) {
    auto datagram = encode_chunk({1, 0, 0}, std::vector<uint8_t>{1, 2, 3});

    ParseError error = ParseError::SUCCESS;
    EXPECT_FALSE(parse_chunk(datagram, &error).has_value());
    EXPECT_EQ(error, ParseError::INVALID_HEADER);
}

TEST(ChunkHeaderTest, RejectsIndexOutOfRange) {
    auto datagram = encode_chunk({1, 3, 3}, std::vector<uint8_t>{1});

    ParseError error = ParseError::SUCCESS;
    EXPECT_FALSE(parse_chunk(datagram, &error).has_value());
    EXPECT_EQ(error, ParseError::INVALID_HEADER);

    // read_header does not validate
    auto header = read_header(datagram);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->chunk_index, 3u);
    EXPECT_FALSE(header->is_valid());
}

TEST(ChunkHeaderTest, ErrorStrings) {
    EXPECT_STREQ(parse_error_to_string(ParseError::PACKET_TOO_SHORT), "packet too short");
    EXPECT_STREQ(parse_error_to_string(ParseError::INVALID_HEADER), "invalid header");
}

TEST(FrameCounterTest, NextIncrements) {
    EXPECT_EQ(next_frame_id(0), 1u);
    EXPECT_EQ(next_frame_id(41), 42u);
}

TEST(FrameCounterTest, Wraparound) {
    EXPECT_EQ(next_frame_id(std::numeric_limits<uint32_t>::max()), 0u);
    static_assert(next_frame_id(0xFFFFFFFFu) == 0u);
}

TEST(FrameCounterTest, CounterAdvancesAndWraps) {
    FrameCounter counter(0xFFFFFFFEu);
    EXPECT_EQ(counter.current(), 0xFFFFFFFEu);
    EXPECT_EQ(counter.advance(), 0xFFFFFFFFu);
    EXPECT_EQ(counter.advance(), 0u);
    EXPECT_EQ(counter.current(), 0u);

    counter.set(100);
    EXPECT_EQ(counter.current(), 100u);
}

}  // namespace
}  // namespace framecast::protocol
