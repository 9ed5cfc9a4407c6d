#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "block_codec.hpp"
#include "checksum.hpp"
#include "context.hpp"
#include "options.hpp"
#include "types.hpp"

namespace lz4framed {

// Encode state for exactly one outgoing frame. All public operations are serialised on an
// internal mutex.
class CompressionContext : public Context {
public:
    enum class State {
        Idle,
        HeaderEmitted,
        Active,
        Ended
    };

    CompressionContext();
    ~CompressionContext() override;

    ContextType type() const override { return ContextType::Compression; }

    // Validates options and returns the encoded frame header (7 to 15 bytes).
    Bytes begin(const FrameOptions& options = {});

    // Returns whatever whole blocks (or, with autoflush, buffered data) are ready. May be empty.
    OrEndOfInput<Bytes> update(const uint8_t* data, size_t size);
    OrEndOfInput<Bytes> update(const Bytes& data) { return update(data.data(), data.size()); }

    // Flushes the partial block, writes the end mark and the optional content checksum.
    Bytes end();

    State state() const;
    const FrameOptions& options() const { return options_; }
    size_t block_size() const { return block_size_; }

private:
    void emit_block(const uint8_t* src, size_t size, Bytes& out);
    void flush_buffer(Bytes& out);

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    FrameOptions options_;
    size_t block_size_ = 0;
    uint64_t consumed_ = 0;

    std::unique_ptr<IBlockEncoder> encoder_;
    StreamingChecksum content_digest_;
    Bytes buffer_;  // partial block awaiting more input
    Bytes scratch_; // compressed block
};

} // namespace lz4framed
