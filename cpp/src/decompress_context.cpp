#include "lz4framed/decompress_context.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include "lz4framed/errors.hpp"

namespace lz4framed {

// Collects decoded bytes into chunks of at most chunk_length bytes.
class DecompressionContext::ChunkWriter {
public:
    explicit ChunkWriter(size_t chunk_length) : chunk_length_(chunk_length) {}

    void write(const uint8_t* data, size_t size) {
        while (size > 0) {
            if (chunks_.empty() || chunks_.back().size() == chunk_length_) {
                chunks_.emplace_back();
                chunks_.back().reserve(std::min(chunk_length_, size));
            }
            Bytes& chunk = chunks_.back();
            const size_t take = std::min(chunk_length_ - chunk.size(), size);
            chunk.insert(chunk.end(), data, data + take);
            data += take;
            size -= take;
        }
    }

    std::vector<Bytes> take() { return std::move(chunks_); }

private:
    size_t chunk_length_;
    std::vector<Bytes> chunks_;
};

DecompressionContext::DecompressionContext() = default;
DecompressionContext::~DecompressionContext() = default;

DecompressionContext::State DecompressionContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t DecompressionContext::input_hint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compute_hint();
}

uint64_t DecompressionContext::decoded_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoded_;
}

OrEndOfInput<DecompressResult> DecompressionContext::update(const uint8_t* data, size_t size,
                                                            size_t chunk_length) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunk_length == 0) {
        throw_usage(ErrorCode::Generic, "chunk length must be positive");
    }
    if (state_ == State::Completed) {
        throw_usage(ErrorCode::Generic, "decompress_update called after the frame completed");
    }
    if (state_ == State::Failed) {
        throw_usage(ErrorCode::Generic, "decompress_update called on a context that already failed");
    }
    if (size == 0) return EndOfInput{};
    if (!data) throw_usage(ErrorCode::SrcPtrWrong, "null input with non-zero size");

    pending_.insert(pending_.end(), data, data + size);

    ChunkWriter writer(chunk_length);
    try {
        consume(writer);
    } catch (const Error&) {
        state_ = State::Failed;
        throw;
    }

    // Keep only the unconsumed tail; anything past the end of a completed frame is dropped.
    if (state_ == State::Completed) {
        pending_.clear();
    } else {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pos_));
    }
    pos_ = 0;

    DecompressResult result;
    result.chunks = writer.take();
    result.input_hint = compute_hint();
    return result;
}

FrameInfo DecompressionContext::frame_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!header_parsed_) {
        throw_incomplete(ErrorCode::FrameHeaderIncomplete, "frame header not yet parsed");
    }
    FrameInfo info;
    info.frame_type = desc_.frame_type;
    info.block_size_id = desc_.block_size_id;
    info.block_mode_linked = desc_.block_mode_linked;
    info.content_checksum = desc_.content_checksum;
    info.block_checksum = desc_.block_checksum;
    info.content_size = desc_.content_size;
    info.input_hint = compute_hint();
    return info;
}

void DecompressionContext::consume(ChunkWriter& writer) {
    bool progressed = true;
    while (progressed) {
        switch (state_) {
            case State::AwaitingHeader: progressed = parse_header(); break;
            case State::AwaitingBlockHeader: progressed = parse_block_header(); break;
            case State::AwaitingBlock: progressed = parse_block(writer); break;
            case State::AwaitingContentChecksum: progressed = parse_content_checksum(); break;
            case State::SkippingPayload: progressed = skip_payload(); break;
            case State::Completed:
            case State::Failed: progressed = false; break;
        }
    }
}

bool DecompressionContext::parse_header() {
    const uint8_t* p = pending_.data() + pos_;
    if (header_size_ == 0) {
        if (available() < 5) return false;
        header_size_ = header_size_from_prefix(p, available());
    }
    if (available() < header_size_) return false;

    desc_ = decode_header(p, header_size_);
    pos_ += header_size_;
    header_parsed_ = true;

    if (desc_.frame_type == FrameType::Skippable) {
        skip_remaining_ = desc_.content_size.value_or(0);
        state_ = skip_remaining_ ? State::SkippingPayload : State::Completed;
        return true;
    }

    block_size_ = get_block_size(desc_.block_size_id);
    decoder_ = make_decoder(desc_.block_mode_linked);
    block_out_.resize(block_size_);
    content_digest_.reset();
    state_ = State::AwaitingBlockHeader;
    return true;
}

bool DecompressionContext::parse_block_header() {
    if (available() < kBlockHeaderSize) return false;
    const uint32_t field = load_le32(pending_.data() + pos_);
    pos_ += kBlockHeaderSize;

    if (field == kEndMark) {
        if (desc_.content_checksum) {
            state_ = State::AwaitingContentChecksum;
        } else {
            finish_frame();
        }
        return true;
    }

    block_length_ = field & ~kUncompressedBlockFlag;
    block_uncompressed_ = (field & kUncompressedBlockFlag) != 0;
    if (block_length_ > block_size_) {
        throw_format(ErrorCode::MaxBlockSizeInvalid, "block of " + std::to_string(block_length_) +
                                                         " bytes exceeds frame block size " +
                                                         std::to_string(block_size_));
    }
    state_ = State::AwaitingBlock;
    return true;
}

bool DecompressionContext::parse_block(ChunkWriter& writer) {
    const size_t need = block_length_ + (desc_.block_checksum ? kChecksumSize : 0);
    if (available() < need) return false;
    const uint8_t* src = pending_.data() + pos_;

    if (desc_.block_checksum) {
        const uint32_t stored = load_le32(src + block_length_);
        const uint32_t computed = checksum(src, block_length_);
        if (stored != computed) {
            throw_corruption(ErrorCode::BlockChecksumInvalid,
                             "block checksum mismatch after " + std::to_string(decoded_) + " decoded bytes");
        }
    }

    const uint8_t* out = src;
    size_t out_size = block_length_;
    if (block_uncompressed_) {
        decoder_->append_history(src, block_length_);
    } else {
        out_size = decoder_->decode_block(src, block_length_, block_out_.data(), block_out_.size());
        out = block_out_.data();
    }

    decoded_ += out_size;
    if (desc_.content_size && decoded_ > *desc_.content_size) {
        throw_format(ErrorCode::FrameSizeWrong, "decoded data exceeds declared content size " +
                                                    std::to_string(*desc_.content_size));
    }
    if (desc_.content_checksum) content_digest_.update(out, out_size);
    writer.write(out, out_size);

    pos_ += need;
    state_ = State::AwaitingBlockHeader;
    return true;
}

bool DecompressionContext::parse_content_checksum() {
    if (available() < kChecksumSize) return false;
    const uint32_t stored = load_le32(pending_.data() + pos_);
    const uint32_t computed = content_digest_.digest();
    if (stored != computed) {
        throw_corruption(ErrorCode::ContentChecksumInvalid, "content checksum mismatch");
    }
    pos_ += kChecksumSize;
    finish_frame();
    return true;
}

bool DecompressionContext::skip_payload() {
    const size_t take = static_cast<size_t>(std::min<uint64_t>(available(), skip_remaining_));
    if (take == 0) return false;
    pos_ += take;
    skip_remaining_ -= take;
    if (skip_remaining_ == 0) state_ = State::Completed;
    return true;
}

void DecompressionContext::finish_frame() {
    if (desc_.content_size && decoded_ != *desc_.content_size) {
        throw_format(ErrorCode::FrameSizeWrong, "decoded " + std::to_string(decoded_) +
                                                    " bytes but header declared " +
                                                    std::to_string(*desc_.content_size));
    }
    state_ = State::Completed;
}

size_t DecompressionContext::compute_hint() const {
    switch (state_) {
        case State::AwaitingHeader: {
            const size_t header = header_size_ ? header_size_ : kMinHeaderSize;
            // A skippable frame has no block header after its own header.
            const size_t next = header_size_ == kSkippableHeaderSize ? 0 : kBlockHeaderSize;
            return header - std::min(available(), header - 1) + next;
        }
        case State::AwaitingBlockHeader:
            return kBlockHeaderSize - available();
        case State::AwaitingBlock: {
            const size_t need = block_length_ + (desc_.block_checksum ? kChecksumSize : 0);
            return need - available() + kBlockHeaderSize;
        }
        case State::AwaitingContentChecksum:
            return kChecksumSize - available();
        case State::SkippingPayload:
            return static_cast<size_t>(skip_remaining_);
        case State::Completed:
        case State::Failed:
            return 0;
    }
    return 0;
}

} // namespace lz4framed
