#include "lz4framed/frame_header.hpp"

#include <cstdio>
#include <string>

#include "lz4framed/checksum.hpp"
#include "lz4framed/errors.hpp"

namespace lz4framed {

namespace {

// FLG bit layout.
constexpr uint8_t kVersionShift = 6;
constexpr uint8_t kVersionMask = 0x3;
constexpr uint8_t kSupportedVersion = 1;
constexpr uint8_t kFlagBlockIndependence = 1u << 5;
constexpr uint8_t kFlagBlockChecksum = 1u << 4;
constexpr uint8_t kFlagContentSize = 1u << 3;
constexpr uint8_t kFlagContentChecksum = 1u << 2;
constexpr uint8_t kFlagReserved = 1u << 1;
constexpr uint8_t kFlagDictId = 1u << 0;

// BD bit layout.
constexpr uint8_t kBlockSizeShift = 4;
constexpr uint8_t kBlockSizeMask = 0x7;
constexpr uint8_t kBdReservedMask = 0x8F;

constexpr size_t kMagicSize = 4;
constexpr size_t kContentSizeSize = 8;

bool is_skippable(uint32_t magic) {
    return magic >= kSkippableMagicMin && magic <= kSkippableMagicMax;
}

std::string hex32(uint32_t v) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return buf;
}

} // namespace

uint32_t load_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t load_le64(const uint8_t* p) {
    return static_cast<uint64_t>(load_le32(p)) | (static_cast<uint64_t>(load_le32(p + 4)) << 32);
}

void append_le32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void append_le64(Bytes& out, uint64_t v) {
    append_le32(out, static_cast<uint32_t>(v));
    append_le32(out, static_cast<uint32_t>(v >> 32));
}

uint8_t header_checksum(const uint8_t* descriptor, size_t size) {
    return static_cast<uint8_t>((checksum(descriptor, size) >> 8) & 0xFFu);
}

size_t encoded_header_size(const FrameDescriptor& desc) {
    return kMinHeaderSize + (desc.content_size ? kContentSizeSize : 0);
}

void encode_header(const FrameDescriptor& desc, Bytes& out) {
    const size_t start = out.size();
    append_le32(out, kFrameMagic);

    uint8_t flg = static_cast<uint8_t>(kSupportedVersion << kVersionShift);
    if (!desc.block_mode_linked) flg |= kFlagBlockIndependence;
    if (desc.block_checksum) flg |= kFlagBlockChecksum;
    if (desc.content_size) flg |= kFlagContentSize;
    if (desc.content_checksum) flg |= kFlagContentChecksum;
    out.push_back(flg);

    const auto id = static_cast<uint8_t>(resolve_block_size_id(desc.block_size_id));
    out.push_back(static_cast<uint8_t>(id << kBlockSizeShift));

    if (desc.content_size) append_le64(out, *desc.content_size);

    const uint8_t* descriptor = out.data() + start + kMagicSize;
    const size_t descriptor_size = out.size() - start - kMagicSize;
    out.push_back(header_checksum(descriptor, descriptor_size));
}

size_t header_size_from_prefix(const uint8_t* data, size_t size) {
    if (size < kMagicSize + 1) {
        throw_incomplete(ErrorCode::FrameHeaderIncomplete, "need magic and FLG to size the header");
    }
    const uint32_t magic = load_le32(data);
    if (is_skippable(magic)) return kSkippableHeaderSize;
    if (magic != kFrameMagic) {
        throw_format(ErrorCode::FrameTypeUnknown, "unknown magic " + hex32(magic));
    }
    const uint8_t flg = data[kMagicSize];
    return kMinHeaderSize + ((flg & kFlagContentSize) ? kContentSizeSize : 0);
}

FrameDescriptor decode_header(const uint8_t* data, size_t size) {
    const size_t expected = header_size_from_prefix(data, size);
    if (size < expected) {
        throw_incomplete(ErrorCode::FrameHeaderIncomplete,
                         "have " + std::to_string(size) + " of " + std::to_string(expected) + " header bytes");
    }

    FrameDescriptor desc;
    if (is_skippable(load_le32(data))) {
        desc.frame_type = FrameType::Skippable;
        desc.content_size = load_le32(data + kMagicSize);
        return desc;
    }

    const uint8_t flg = data[kMagicSize];
    const uint8_t bd = data[kMagicSize + 1];

    const uint8_t version = (flg >> kVersionShift) & kVersionMask;
    if (version != kSupportedVersion) {
        throw_format(ErrorCode::HeaderVersionWrong, "frame version " + std::to_string(version));
    }
    if (flg & (kFlagReserved | kFlagDictId)) {
        throw_format(ErrorCode::ReservedFlagSet, "reserved FLG bits set (dictionary ids unsupported)");
    }
    if (bd & kBdReservedMask) {
        throw_format(ErrorCode::ReservedFlagSet, "reserved BD bits set");
    }
    const int id = (bd >> kBlockSizeShift) & kBlockSizeMask;
    if (id < static_cast<int>(BlockSizeId::Max64KB)) {
        throw_format(ErrorCode::MaxBlockSizeInvalid, "block size id " + std::to_string(id));
    }

    const size_t descriptor_size = expected - kMagicSize - 1;
    const uint8_t expected_hc = header_checksum(data + kMagicSize, descriptor_size);
    const uint8_t actual_hc = data[expected - 1];
    if (expected_hc != actual_hc) {
        throw_corruption(ErrorCode::HeaderChecksumInvalid,
                         "header checksum " + std::to_string(actual_hc) + " != " + std::to_string(expected_hc));
    }

    desc.frame_type = FrameType::Lz4Frame;
    desc.block_size_id = static_cast<BlockSizeId>(id);
    desc.block_mode_linked = !(flg & kFlagBlockIndependence);
    desc.block_checksum = (flg & kFlagBlockChecksum) != 0;
    desc.content_checksum = (flg & kFlagContentChecksum) != 0;
    if (flg & kFlagContentSize) {
        desc.content_size = load_le64(data + kMagicSize + 2);
    }
    return desc;
}

} // namespace lz4framed
