#include <gtest/gtest.h>

#include "lz4framed/block_codec.hpp"
#include "lz4framed/checksum.hpp"
#include "test_util.hpp"

using namespace lz4framed;
using lz4framed::test::compressible_bytes;
using lz4framed::test::expect_error;
using lz4framed::test::random_bytes;

namespace {

Bytes decode_with(IBlockDecoder& decoder, const Bytes& compressed, size_t capacity) {
    Bytes out(capacity);
    out.resize(decoder.decode_block(compressed.data(), compressed.size(), out.data(), out.size()));
    return out;
}

} // namespace

TEST(BlockCodec, FastAndHighCompressionRoundTrip) {
    const Bytes input = compressible_bytes(20000);
    for (int level : {-5, kCompressionMin, kCompressionMinHC, kCompressionMax}) {
        auto encoder = make_encoder(config_from_level(level), false, 65536);
        Bytes compressed;
        const size_t n = encoder->encode_block(input.data(), input.size(), compressed);
        ASSERT_GT(n, 0u) << encoder->name();
        EXPECT_EQ(n, compressed.size());
        EXPECT_LT(n, input.size());

        auto decoder = make_decoder(false);
        EXPECT_EQ(decode_with(*decoder, compressed, 65536), input) << encoder->name();
    }
}

TEST(BlockCodec, IncompressibleBlockIsReportedAsRaw) {
    const Bytes input = random_bytes(4096);
    auto encoder = make_encoder(config_from_level(kCompressionMin), false, 65536);
    Bytes compressed;
    EXPECT_EQ(encoder->encode_block(input.data(), input.size(), compressed), 0u);
}

TEST(BlockCodec, LinkedBlocksReferenceEarlierBlocks) {
    // The second block repeats the first, so only a linked encoder can shrink it.
    const Bytes first = random_bytes(4096, 11);
    for (int level : {kCompressionMin, kCompressionMinHC}) {
        auto encoder = make_encoder(config_from_level(level), true, 65536);
        auto decoder = make_decoder(true);

        Bytes compressed;
        ASSERT_EQ(encoder->encode_block(first.data(), first.size(), compressed), 0u);
        decoder->append_history(first.data(), first.size());

        const Bytes second = first;
        const size_t n = encoder->encode_block(second.data(), second.size(), compressed);
        ASSERT_GT(n, 0u) << encoder->name();
        EXPECT_LT(n, 64u) << encoder->name();
        EXPECT_EQ(decode_with(*decoder, compressed, 65536), second) << encoder->name();
    }
}

TEST(BlockCodec, MalformedPayloadIsCorruption) {
    const Bytes input = compressible_bytes(8000);
    auto encoder = make_encoder(config_from_level(kCompressionMin), false, 65536);
    Bytes compressed;
    ASSERT_GT(encoder->encode_block(input.data(), input.size(), compressed), 0u);

    auto decoder = make_decoder(false);
    // Output space smaller than the block cannot hold it.
    expect_error([&] { (void)decode_with(*decoder, compressed, 100); }, ErrorCode::DecompressionFailed,
                 ErrorKind::Corruption);
}

TEST(Checksum, StreamingMatchesOneShot) {
    const Bytes data = compressible_bytes(10000);
    StreamingChecksum digest;
    digest.update(data.data(), 3);
    digest.update(data.data() + 3, 0);
    digest.update(data.data() + 3, data.size() - 3);
    EXPECT_EQ(digest.digest(), checksum(data.data(), data.size()));

    digest.reset();
    EXPECT_EQ(digest.digest(), checksum(nullptr, 0));
    // XXH32 of the empty input with seed 0.
    EXPECT_EQ(checksum(nullptr, 0), 0x02CC5D05u);
}
