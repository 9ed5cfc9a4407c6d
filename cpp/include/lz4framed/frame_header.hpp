#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "block_size.hpp"
#include "types.hpp"

namespace lz4framed {

constexpr uint32_t kFrameMagic = 0x184D2204u;
constexpr uint32_t kSkippableMagicMin = 0x184D2A50u;
constexpr uint32_t kSkippableMagicMax = 0x184D2A5Fu;

constexpr size_t kMinHeaderSize = 7;  // magic + FLG + BD + HC
constexpr size_t kMaxHeaderSize = 15; // plus 8-byte content size
constexpr size_t kSkippableHeaderSize = 8;
constexpr size_t kBlockHeaderSize = 4;
constexpr size_t kChecksumSize = 4;
constexpr size_t kEndMarkSize = 4;

constexpr uint32_t kEndMark = 0;
constexpr uint32_t kUncompressedBlockFlag = 0x80000000u;

enum class FrameType {
    Lz4Frame,
    Skippable
};

// Fields carried by a frame header (FLG + BD + optional content size).
struct FrameDescriptor {
    FrameType frame_type = FrameType::Lz4Frame;
    BlockSizeId block_size_id = BlockSizeId::Max64KB;
    bool block_mode_linked = true;
    bool content_checksum = false;
    bool block_checksum = false;
    std::optional<uint64_t> content_size;
};

// Little-endian field access.
uint32_t load_le32(const uint8_t* p);
uint64_t load_le64(const uint8_t* p);
void append_le32(Bytes& out, uint32_t v);
void append_le64(Bytes& out, uint64_t v);

// 8-bit header check: second byte of XXH32 over the descriptor bytes.
uint8_t header_checksum(const uint8_t* descriptor, size_t size);

size_t encoded_header_size(const FrameDescriptor& desc);

// Appends magic, FLG, BD, optional content size and header check byte.
void encode_header(const FrameDescriptor& desc, Bytes& out);

// Total header length implied by the first five bytes (magic + FLG). Throws a format error for
// unknown magic. Skippable frames report kSkippableHeaderSize.
size_t header_size_from_prefix(const uint8_t* data, size_t size);

// Parses a complete header of `size` bytes (as given by header_size_from_prefix) and validates
// version, reserved bits, block size id and header checksum.
FrameDescriptor decode_header(const uint8_t* data, size_t size);

} // namespace lz4framed
