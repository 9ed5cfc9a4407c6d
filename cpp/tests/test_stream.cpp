#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <variant>

#include "lz4framed/frame.hpp"
#include "lz4framed/frame_header.hpp"
#include "lz4framed/stream.hpp"
#include "test_util.hpp"

using namespace lz4framed;
using namespace lz4framed::test;

namespace {

Bytes drain(Decompressor& d) {
    Bytes out;
    for (const auto& chunk : d) append(out, chunk);
    return out;
}

} // namespace

TEST(Compressor, HeaderArrivesWithFirstData) {
    Compressor c;
    EXPECT_FALSE(c.has_sink());
    EXPECT_TRUE(is_end_of_input(c.update(Bytes{})));
    EXPECT_FALSE(c.started());

    const Bytes input = compressible_bytes(1000);
    const Bytes first = value_of(c.update(input));
    EXPECT_TRUE(c.started());
    ASSERT_EQ(first.size(), kMinHeaderSize);
    EXPECT_EQ(load_le32(first.data()), kFrameMagic);

    Bytes frame = first;
    append(frame, c.end());
    EXPECT_TRUE(c.ended());
    EXPECT_EQ(value_of(decompress(frame)), input);
}

TEST(Compressor, UnusedCompressorReturnsEmptyFrame) {
    Compressor c;
    const Bytes frame = c.end();
    EXPECT_EQ(frame.size(), kMinHeaderSize + kEndMarkSize);
    EXPECT_TRUE(value_of(decompress(frame)).empty());
}

TEST(Compressor, UnusedCompressorWritesNothingToSink) {
    Bytes out;
    Compressor::with_sink(sink_to(out), {}, [](Compressor&) {});
    EXPECT_TRUE(out.empty());
}

TEST(Compressor, SinkReceivesWholeFrame) {
    const Bytes input = compressible_bytes(200000, 2);
    Bytes out;
    FrameOptions fo;
    fo.content_checksum = true;
    Compressor::with_sink(sink_to(out), fo, [&](Compressor& c) {
        EXPECT_TRUE(c.has_sink());
        for (size_t off = 0; off < input.size(); off += 30000) {
            const Bytes piece(input.begin() + static_cast<std::ptrdiff_t>(off),
                              input.begin() + static_cast<std::ptrdiff_t>(std::min(off + 30000, input.size())));
            EXPECT_TRUE(value_of(c.update(piece)).empty());
        }
    });
    EXPECT_EQ(value_of(decompress(out)), input);
}

TEST(Compressor, EndTwiceAndUpdateAfterEndAreUsageErrors) {
    Compressor c;
    (void)c.end();
    expect_error([&] { (void)c.end(); }, ErrorCode::Generic, ErrorKind::Usage);
    expect_error([&] { (void)c.update(to_bytes("late")); }, ErrorCode::Generic, ErrorKind::Usage);
}

TEST(Compressor, ErrorAfterSinkOutputMentionsIt) {
    Bytes out;
    Compressor c(sink_to(out));
    (void)c.update(to_bytes("some data"));
    ASSERT_FALSE(out.empty());
    try {
        (void)c.update(nullptr, 5);
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SrcPtrWrong);
        EXPECT_NE(e.detail().find("already written to sink"), std::string::npos);
    }
}

TEST(Compressor, InvalidOptionsThrowAtConstruction) {
    FrameOptions fo;
    fo.block_size_id = static_cast<BlockSizeId>(2);
    expect_error([&] { Compressor c(fo); }, ErrorCode::MaxBlockSizeInvalid, ErrorKind::Usage);
}

TEST(Decompressor, ShortReadsStillDecode) {
    const Bytes input = compressible_bytes(300000, 6);
    FrameOptions fo;
    fo.block_checksum = true;
    fo.content_checksum = true;
    const Bytes frame = value_of(compress(input, fo));

    for (size_t max_read : {size_t{1}, size_t{7}, size_t{4096}, size_t{0}}) {
        Decompressor d(source_from(frame, max_read));
        EXPECT_EQ(drain(d), input) << max_read;
        ASSERT_TRUE(d.frame_info().has_value());
        EXPECT_EQ(d.frame_info()->content_size.value_or(0), input.size());
    }
}

TEST(Decompressor, AutomaticChunksFollowBlockSize) {
    const Bytes input = compressible_bytes(200000, 8);
    Compressor c;
    Bytes frame = value_of(c.update(input));
    append(frame, c.end());

    Decompressor d(source_from(frame));
    size_t total = 0;
    for (const auto& chunk : d) {
        EXPECT_LE(chunk.size(), get_block_size(BlockSizeId::Max64KB));
        total += chunk.size();
    }
    EXPECT_EQ(total, input.size());
}

TEST(Decompressor, FixedChunkLength) {
    const Bytes input = compressible_bytes(50000, 10);
    const Bytes frame = value_of(compress(input));
    Decompressor d(source_from(frame), 777);
    Bytes out;
    for (const auto& chunk : d) {
        EXPECT_LE(chunk.size(), 777u);
        append(out, chunk);
    }
    EXPECT_EQ(out, input);
}

TEST(Decompressor, NextReportsFrameCompleteThenKeepsReportingIt) {
    const Bytes frame = value_of(compress(to_bytes("tiny")));
    Decompressor d(source_from(frame));
    DecodeStep step = d.next();
    ASSERT_TRUE(std::holds_alternative<Bytes>(step));
    EXPECT_EQ(std::get<Bytes>(step), to_bytes("tiny"));
    EXPECT_TRUE(std::holds_alternative<FrameComplete>(d.next()));
    EXPECT_TRUE(std::holds_alternative<FrameComplete>(d.next()));
}

TEST(Decompressor, StarvedSource) {
    const Bytes frame = value_of(compress(compressible_bytes(10000)));
    const Bytes truncated(frame.begin(), frame.end() - 3);

    Decompressor stepper(source_from(truncated));
    DecodeStep step = stepper.next();
    while (std::holds_alternative<Bytes>(step)) step = stepper.next();
    EXPECT_TRUE(std::holds_alternative<EndOfInput>(step));

    Decompressor iterating(source_from(truncated));
    expect_error([&] { (void)drain(iterating); }, ErrorCode::FrameIncomplete, ErrorKind::Incomplete);

    Bytes nothing;
    Decompressor empty(source_from(nothing));
    EXPECT_TRUE(std::holds_alternative<EndOfInput>(empty.next()));
}

TEST(Decompressor, SourceReturningTooMuchIsUsageError) {
    Decompressor d([](uint8_t*, size_t capacity) { return capacity + 1; });
    expect_error([&] { (void)d.next(); }, ErrorCode::SrcSizeTooLarge, ErrorKind::Usage);
}

TEST(Decompressor, CorruptionPropagates) {
    FrameOptions fo;
    fo.content_checksum = true;
    Bytes frame = value_of(compress(compressible_bytes(10000), fo));
    frame.back() ^= 0x01;
    Decompressor d(source_from(frame));
    expect_error([&] { (void)drain(d); }, ErrorCode::ContentChecksumInvalid, ErrorKind::Corruption);
}

TEST(Decompressor, LateErrorNotesYieldedBytes) {
    FrameOptions fo;
    fo.content_checksum = true;
    Bytes frame = value_of(compress(compressible_bytes(10000), fo));
    frame.back() ^= 0x01;
    Decompressor d(source_from(frame));

    size_t seen = 0;
    try {
        for (const auto& chunk : d) seen += chunk.size();
        FAIL() << "corrupt checksum was accepted";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ContentChecksumInvalid);
        EXPECT_EQ(seen, 10000u);
        EXPECT_NE(std::string(e.what()).find("10000 decoded bytes already yielded"), std::string::npos) << e.what();
    }
}

TEST(Decompressor, EarlyErrorHasNoYieldNote) {
    const Bytes junk = to_bytes("definitely not an lz4 frame");
    Decompressor d(source_from(junk));
    try {
        (void)drain(d);
        FAIL() << "junk was accepted";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::FrameTypeUnknown);
        EXPECT_EQ(std::string(e.what()).find("already yielded"), std::string::npos) << e.what();
    }
}

TEST(Stream, IostreamAdaptersRoundTrip) {
    const Bytes input = compressible_bytes(120000, 12);
    std::ostringstream compressed;
    Compressor::with_sink(sink_to(compressed), {}, [&](Compressor& c) { (void)c.update(input); });

    std::istringstream in(compressed.str());
    Decompressor d(source_from(in));
    EXPECT_EQ(drain(d), input);
}
