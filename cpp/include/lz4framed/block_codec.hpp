#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "levels.hpp"

namespace lz4framed {

// Linked mode keeps this much decoded history as the match window.
constexpr size_t kLinkedHistorySize = 64 * 1024;

struct IBlockEncoder {
    virtual ~IBlockEncoder() = default;
    // Compresses src into out (resized to the compressed length). Returns 0 when the
    // compressed form would not be smaller than the input; the caller then stores it raw.
    virtual size_t encode_block(const uint8_t* src, size_t size, std::vector<uint8_t>& out) = 0;
    virtual const char* name() const = 0;
};

struct IBlockDecoder {
    virtual ~IBlockDecoder() = default;
    // Decodes a compressed block into dst (capacity bytes). Throws a corruption error when the
    // payload is malformed. Returns the decoded length.
    virtual size_t decode_block(const uint8_t* src, size_t size, uint8_t* dst, size_t capacity) = 0;
    // Uncompressed blocks still extend the linked history.
    virtual void append_history(const uint8_t* data, size_t size) = 0;
};

std::unique_ptr<IBlockEncoder> make_encoder(const LevelConfig& config, bool linked, size_t block_size);
std::unique_ptr<IBlockDecoder> make_decoder(bool linked);

} // namespace lz4framed
