#include <gtest/gtest.h>

#include "lz4framed/frame_header.hpp"
#include "test_util.hpp"

using namespace lz4framed;
using lz4framed::test::expect_error;

namespace {

Bytes encode(const FrameDescriptor& desc) {
    Bytes out;
    encode_header(desc, out);
    return out;
}

// Re-seals the header check byte after a test edits the descriptor.
void reseal(Bytes& header) {
    header.back() = header_checksum(header.data() + 4, header.size() - 5);
}

} // namespace

TEST(FrameHeader, MatchesReferenceEncoderBytes) {
    // What the lz4 command-line tool writes with its defaults.
    FrameDescriptor desc;
    desc.block_mode_linked = false;
    desc.content_checksum = true;
    const Bytes header = encode(desc);
    const Bytes expected{0x04, 0x22, 0x4D, 0x18, 0x64, 0x40, 0xA7};
    EXPECT_EQ(header, expected);
}

TEST(FrameHeader, MinimalAndMaximalSizes) {
    FrameDescriptor desc;
    EXPECT_EQ(encoded_header_size(desc), kMinHeaderSize);
    EXPECT_EQ(encode(desc).size(), kMinHeaderSize);

    desc.content_size = 123456789012ull;
    EXPECT_EQ(encoded_header_size(desc), kMaxHeaderSize);
    const Bytes header = encode(desc);
    ASSERT_EQ(header.size(), kMaxHeaderSize);
    EXPECT_EQ(header[4] & 0x08, 0x08);
    EXPECT_EQ(load_le64(header.data() + 6), 123456789012ull);
}

TEST(FrameHeader, DecodeRestoresDescriptor) {
    FrameDescriptor desc;
    desc.block_size_id = BlockSizeId::Max1MB;
    desc.block_mode_linked = false;
    desc.block_checksum = true;
    desc.content_checksum = true;
    desc.content_size = 42;
    const Bytes header = encode(desc);

    ASSERT_EQ(header_size_from_prefix(header.data(), header.size()), header.size());
    const FrameDescriptor got = decode_header(header.data(), header.size());
    EXPECT_EQ(got.frame_type, FrameType::Lz4Frame);
    EXPECT_EQ(got.block_size_id, BlockSizeId::Max1MB);
    EXPECT_FALSE(got.block_mode_linked);
    EXPECT_TRUE(got.block_checksum);
    EXPECT_TRUE(got.content_checksum);
    ASSERT_TRUE(got.content_size.has_value());
    EXPECT_EQ(*got.content_size, 42u);
}

TEST(FrameHeader, DefaultIdIsWrittenAsSixtyFourKilobytes) {
    FrameDescriptor desc;
    desc.block_size_id = BlockSizeId::Default;
    const Bytes header = encode(desc);
    EXPECT_EQ(header[5], 0x40);
}

TEST(FrameHeader, PrefixShorterThanFiveBytesIsIncomplete) {
    const Bytes header = encode(FrameDescriptor{});
    expect_error([&] { (void)header_size_from_prefix(header.data(), 4); }, ErrorCode::FrameHeaderIncomplete,
                 ErrorKind::Incomplete);
    expect_error([&] { (void)decode_header(header.data(), 6); }, ErrorCode::FrameHeaderIncomplete,
                 ErrorKind::Incomplete);
}

TEST(FrameHeader, UnknownMagicIsFormatError) {
    Bytes header = encode(FrameDescriptor{});
    header[0] = 0x00;
    expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::FrameTypeUnknown,
                 ErrorKind::Format);
}

TEST(FrameHeader, WrongVersionIsRejectedBeforeChecksum) {
    Bytes header = encode(FrameDescriptor{});
    header[4] = static_cast<uint8_t>((header[4] & 0x3F) | 0x80);
    expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::HeaderVersionWrong,
                 ErrorKind::Format);
}

TEST(FrameHeader, ReservedAndDictionaryBitsAreRejected) {
    for (uint8_t bit : {uint8_t{0x01}, uint8_t{0x02}}) {
        Bytes header = encode(FrameDescriptor{});
        header[4] |= bit;
        reseal(header);
        expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::ReservedFlagSet,
                     ErrorKind::Format);
    }

    Bytes header = encode(FrameDescriptor{});
    header[5] |= 0x01;
    reseal(header);
    expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::ReservedFlagSet,
                 ErrorKind::Format);
}

TEST(FrameHeader, BlockSizeIdBelowFourIsRejected) {
    Bytes header = encode(FrameDescriptor{});
    header[5] = 0x30;
    reseal(header);
    expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::MaxBlockSizeInvalid,
                 ErrorKind::Format);
}

TEST(FrameHeader, BadCheckByteIsCorruption) {
    Bytes header = encode(FrameDescriptor{});
    header.back() ^= 0xFF;
    expect_error([&] { (void)decode_header(header.data(), header.size()); }, ErrorCode::HeaderChecksumInvalid,
                 ErrorKind::Corruption);
}

TEST(FrameHeader, SkippableFrameReportsPayloadLength) {
    const Bytes header{0x5A, 0x2A, 0x4D, 0x18, 0x10, 0x00, 0x00, 0x00};
    EXPECT_EQ(header_size_from_prefix(header.data(), 5), kSkippableHeaderSize);
    const FrameDescriptor desc = decode_header(header.data(), header.size());
    EXPECT_EQ(desc.frame_type, FrameType::Skippable);
    ASSERT_TRUE(desc.content_size.has_value());
    EXPECT_EQ(*desc.content_size, 16u);
}

TEST(FrameHeader, LittleEndianHelpers) {
    Bytes out;
    append_le32(out, 0x11223344u);
    append_le64(out, 0x0102030405060708ull);
    const Bytes expected{0x44, 0x33, 0x22, 0x11, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    EXPECT_EQ(out, expected);
    EXPECT_EQ(load_le32(out.data()), 0x11223344u);
    EXPECT_EQ(load_le64(out.data() + 4), 0x0102030405060708ull);
}
