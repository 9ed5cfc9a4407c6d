#include "lz4framed/frame.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "lz4framed/errors.hpp"

namespace lz4framed {

namespace {

CompressionContext& as_compression(Context& ctx) {
    auto* cctx = dynamic_cast<CompressionContext*>(&ctx);
    if (!cctx) throw_usage(ErrorCode::Generic, "ctx invalid: expected a compression context");
    return *cctx;
}

DecompressionContext& as_decompression(Context& ctx) {
    auto* dctx = dynamic_cast<DecompressionContext*>(&ctx);
    if (!dctx) throw_usage(ErrorCode::Generic, "ctx invalid: expected a decompression context");
    return *dctx;
}

const DecompressionContext& as_decompression(const Context& ctx) {
    const auto* dctx = dynamic_cast<const DecompressionContext*>(&ctx);
    if (!dctx) throw_usage(ErrorCode::Generic, "ctx invalid: expected a decompression context");
    return *dctx;
}

} // namespace

std::unique_ptr<CompressionContext> create_compression_context() {
    return std::make_unique<CompressionContext>();
}

std::unique_ptr<DecompressionContext> create_decompression_context() {
    return std::make_unique<DecompressionContext>();
}

Bytes compress_begin(Context& ctx, const FrameOptions& options) {
    return as_compression(ctx).begin(options);
}

OrEndOfInput<Bytes> compress_update(Context& ctx, const uint8_t* data, size_t size) {
    return as_compression(ctx).update(data, size);
}

Bytes compress_end(Context& ctx) {
    return as_compression(ctx).end();
}

FrameInfo get_frame_info(const Context& ctx) {
    return as_decompression(ctx).frame_info();
}

OrEndOfInput<DecompressResult> decompress_update(Context& ctx, const uint8_t* data, size_t size,
                                                 size_t chunk_length) {
    return as_decompression(ctx).update(data, size, chunk_length);
}

OrEndOfInput<Bytes> compress(const uint8_t* data, size_t size, const FrameOptions& options) {
    if (size == 0) return EndOfInput{};
    options.validate();

    FrameOptions prefs = options;
    prefs.content_size = size;
    prefs.block_size_id = optimal_block_size_id(options.block_size_id, size);
    prefs.autoflush = false;

    CompressionContext ctx;
    Bytes frame = ctx.begin(prefs);
    frame.reserve(frame.size() + size + size / 255 + 64);

    auto body = ctx.update(data, size);
    Bytes& blocks = std::get<Bytes>(body);
    frame.insert(frame.end(), blocks.begin(), blocks.end());

    const Bytes tail = ctx.end();
    frame.insert(frame.end(), tail.begin(), tail.end());
    return frame;
}

OrEndOfInput<Bytes> decompress(const uint8_t* data, size_t size, size_t initial_capacity) {
    if (size == 0) return EndOfInput{};

    DecompressionContext ctx;
    // Largest block size so each call yields one chunk per block.
    auto step = ctx.update(data, size, get_block_size(BlockSizeId::Max4MB));
    DecompressResult& result = std::get<DecompressResult>(step);

    if (result.input_hint != 0) {
        if (ctx.state() == DecompressionContext::State::AwaitingHeader) {
            throw_incomplete(ErrorCode::FrameHeaderIncomplete,
                             "input ended inside the frame header (" + std::to_string(size) + " bytes)");
        }
        throw_incomplete(ErrorCode::FrameIncomplete,
                         "frame incomplete: " + std::to_string(result.input_hint) + " more bytes expected");
    }

    Bytes out;
    const FrameInfo info = ctx.frame_info();
    if (info.content_size) {
        // The header is untrusted; LZ4 cannot expand input by more than 255x.
        out.reserve(static_cast<size_t>(std::min<uint64_t>(*info.content_size, uint64_t{size} * 255)));
    } else {
        out.reserve(std::max(initial_capacity, size));
    }
    for (const Bytes& chunk : result.chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

} // namespace lz4framed
