#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "block_codec.hpp"
#include "checksum.hpp"
#include "context.hpp"
#include "frame_header.hpp"
#include "types.hpp"

namespace lz4framed {

struct FrameInfo {
    FrameType frame_type = FrameType::Lz4Frame;
    BlockSizeId block_size_id = BlockSizeId::Max64KB;
    bool block_mode_linked = true;
    bool content_checksum = false;
    bool block_checksum = false;
    std::optional<uint64_t> content_size;
    size_t input_hint = 0;
};

struct DecompressResult {
    std::vector<Bytes> chunks; // each at most the requested chunk length
    size_t input_hint = 0;     // 0 once the frame is complete
};

// Decode state for exactly one incoming frame. Input may be split anywhere; bytes that do not
// yet form a whole header, block or trailer are carried over to the next call.
class DecompressionContext : public Context {
public:
    enum class State {
        AwaitingHeader,
        AwaitingBlockHeader,
        AwaitingBlock,
        AwaitingContentChecksum,
        SkippingPayload,
        Completed,
        Failed
    };

    static constexpr size_t kDefaultChunkLength = 64 * 1024;

    DecompressionContext();
    ~DecompressionContext() override;

    ContextType type() const override { return ContextType::Decompression; }

    OrEndOfInput<DecompressResult> update(const uint8_t* data, size_t size,
                                          size_t chunk_length = kDefaultChunkLength);
    OrEndOfInput<DecompressResult> update(const Bytes& data,
                                          size_t chunk_length = kDefaultChunkLength) {
        return update(data.data(), data.size(), chunk_length);
    }

    // Throws FrameHeaderIncomplete until the header has been parsed.
    FrameInfo frame_info() const;

    State state() const;
    size_t input_hint() const;
    uint64_t decoded_size() const;

private:
    class ChunkWriter;

    void consume(ChunkWriter& writer);
    bool parse_header();
    bool parse_block_header();
    bool parse_block(ChunkWriter& writer);
    bool parse_content_checksum();
    bool skip_payload();
    void finish_frame();
    size_t compute_hint() const;
    size_t available() const { return pending_.size() - pos_; }

    mutable std::mutex mutex_;
    State state_ = State::AwaitingHeader;
    FrameDescriptor desc_;
    size_t block_size_ = 0;

    Bytes pending_; // carry-over input
    size_t pos_ = 0;

    bool header_parsed_ = false;
    size_t header_size_ = 0;      // known once magic + FLG are buffered
    uint32_t block_length_ = 0;   // current block payload length
    bool block_uncompressed_ = false;
    uint64_t skip_remaining_ = 0;
    uint64_t decoded_ = 0;

    std::unique_ptr<IBlockDecoder> decoder_;
    StreamingChecksum content_digest_;
    Bytes block_out_;
};

} // namespace lz4framed
