#include "lz4framed/compress_context.hpp"

#include <algorithm>
#include <string>

#include "lz4framed/errors.hpp"
#include "lz4framed/frame_header.hpp"

namespace lz4framed {

CompressionContext::CompressionContext() = default;
CompressionContext::~CompressionContext() = default;

CompressionContext::State CompressionContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Bytes CompressionContext::begin(const FrameOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Idle) {
        throw_usage(ErrorCode::Generic, "compress_begin called on a context that already started a frame");
    }
    options.validate();

    options_ = options;
    block_size_ = get_block_size(options.block_size_id);
    encoder_ = make_encoder(config_from_level(options.level), options.block_mode_linked, block_size_);
    buffer_.reserve(block_size_);
    content_digest_.reset();

    FrameDescriptor desc;
    desc.block_size_id = resolve_block_size_id(options.block_size_id);
    desc.block_mode_linked = options.block_mode_linked;
    desc.content_checksum = options.content_checksum;
    desc.block_checksum = options.block_checksum;
    desc.content_size = options.content_size;

    Bytes header;
    header.reserve(kMaxHeaderSize);
    encode_header(desc, header);
    state_ = State::HeaderEmitted;
    return header;
}

OrEndOfInput<Bytes> CompressionContext::update(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Idle) {
        throw_usage(ErrorCode::Generic, "compress_update called before compress_begin");
    }
    if (state_ == State::Ended) {
        throw_usage(ErrorCode::Generic, "compress_update called after compress_end");
    }
    if (size == 0) return EndOfInput{};
    if (!data) throw_usage(ErrorCode::SrcPtrWrong, "null input with non-zero size");

    if (options_.content_checksum) content_digest_.update(data, size);
    consumed_ += size;

    Bytes out;
    size_t pos = 0;

    // Top up a partially filled block first.
    if (!buffer_.empty()) {
        const size_t take = std::min(block_size_ - buffer_.size(), size);
        buffer_.insert(buffer_.end(), data, data + take);
        pos += take;
        if (buffer_.size() == block_size_) {
            emit_block(buffer_.data(), buffer_.size(), out);
            buffer_.clear();
        }
    }
    // Whole blocks straight from the caller's memory.
    while (size - pos >= block_size_) {
        emit_block(data + pos, block_size_, out);
        pos += block_size_;
    }
    if (pos < size) {
        buffer_.insert(buffer_.end(), data + pos, data + size);
    }
    if (options_.autoflush) flush_buffer(out);

    state_ = State::Active;
    return out;
}

Bytes CompressionContext::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Idle) {
        throw_usage(ErrorCode::Generic, "compress_end called before compress_begin");
    }
    if (state_ == State::Ended) {
        throw_usage(ErrorCode::Generic, "compress_end called twice");
    }

    Bytes out;
    flush_buffer(out);
    append_le32(out, kEndMark);
    if (options_.content_checksum) append_le32(out, content_digest_.digest());
    state_ = State::Ended;

    if (options_.content_size && *options_.content_size != consumed_) {
        throw_usage(ErrorCode::FrameSizeWrong, "declared content size " + std::to_string(*options_.content_size) +
                                                   " but received " + std::to_string(consumed_) + " bytes");
    }
    return out;
}

void CompressionContext::emit_block(const uint8_t* src, size_t size, Bytes& out) {
    const size_t compressed = encoder_->encode_block(src, size, scratch_);
    const uint8_t* payload = src;
    uint32_t length_field = static_cast<uint32_t>(size) | kUncompressedBlockFlag;
    size_t payload_size = size;
    if (compressed != 0) {
        payload = scratch_.data();
        payload_size = compressed;
        length_field = static_cast<uint32_t>(compressed);
    }

    append_le32(out, length_field);
    out.insert(out.end(), payload, payload + payload_size);
    if (options_.block_checksum) append_le32(out, checksum(payload, payload_size));
}

void CompressionContext::flush_buffer(Bytes& out) {
    if (buffer_.empty()) return;
    emit_block(buffer_.data(), buffer_.size(), out);
    buffer_.clear();
}

} // namespace lz4framed
