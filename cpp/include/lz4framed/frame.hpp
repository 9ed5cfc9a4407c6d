#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "compress_context.hpp"
#include "decompress_context.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "types.hpp"

namespace lz4framed {

// Low-level surface over opaque contexts. Handing a context of the wrong kind to any of these
// raises a usage error.
std::unique_ptr<CompressionContext> create_compression_context();
std::unique_ptr<DecompressionContext> create_decompression_context();

Bytes compress_begin(Context& ctx, const FrameOptions& options = {});
OrEndOfInput<Bytes> compress_update(Context& ctx, const uint8_t* data, size_t size);
Bytes compress_end(Context& ctx);

FrameInfo get_frame_info(const Context& ctx);
OrEndOfInput<DecompressResult> decompress_update(Context& ctx, const uint8_t* data, size_t size,
                                                 size_t chunk_length = DecompressionContext::kDefaultChunkLength);

// Compress a whole buffer into one frame that declares its content size.
OrEndOfInput<Bytes> compress(const uint8_t* data, size_t size, const FrameOptions& options = {});
inline OrEndOfInput<Bytes> compress(const Bytes& data, const FrameOptions& options = {}) {
    return compress(data.data(), data.size(), options);
}

// Decode one complete frame. Throws the incompleteness condition if data ends early.
// initial_capacity sizes the output up front when the frame does not declare its content size.
OrEndOfInput<Bytes> decompress(const uint8_t* data, size_t size, size_t initial_capacity = 0);
inline OrEndOfInput<Bytes> decompress(const Bytes& data, size_t initial_capacity = 0) {
    return decompress(data.data(), data.size(), initial_capacity);
}

} // namespace lz4framed
