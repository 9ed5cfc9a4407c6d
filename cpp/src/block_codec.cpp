#include "lz4framed/block_codec.hpp"

#include <cstddef>
#include <new>
#include <string>
#include <vector>

#include <lz4.h>
#include <lz4hc.h>

#include "lz4framed/errors.hpp"

namespace lz4framed {

namespace {

// Shared tail of every encoder: trims out to the compressed length, or reports 0 when the block
// did not shrink.
size_t finish_block(int compressed, size_t size, std::vector<uint8_t>& out) {
    if (compressed <= 0 || static_cast<size_t>(compressed) >= size) {
        out.clear();
        return 0;
    }
    out.resize(static_cast<size_t>(compressed));
    return out.size();
}

int bound_for(size_t size) {
    return LZ4_compressBound(static_cast<int>(size));
}

class FastIndependentEncoder : public IBlockEncoder {
public:
    explicit FastIndependentEncoder(int acceleration)
        : acceleration_(acceleration), state_(static_cast<size_t>(LZ4_sizeofState())) {}

    size_t encode_block(const uint8_t* src, size_t size, std::vector<uint8_t>& out) override {
        out.resize(static_cast<size_t>(bound_for(size)));
        const int n = LZ4_compress_fast_extState(state_.data(), reinterpret_cast<const char*>(src),
                                                 reinterpret_cast<char*>(out.data()),
                                                 static_cast<int>(size), static_cast<int>(out.size()),
                                                 acceleration_);
        return finish_block(n, size, out);
    }

    const char* name() const override { return "lz4-fast"; }

private:
    int acceleration_;
    std::vector<char> state_;
};

class FastLinkedEncoder : public IBlockEncoder {
public:
    explicit FastLinkedEncoder(int acceleration)
        : acceleration_(acceleration), stream_(LZ4_createStream()), dict_(kLinkedHistorySize) {
        if (!stream_) throw std::bad_alloc();
    }
    ~FastLinkedEncoder() override { LZ4_freeStream(stream_); }

    FastLinkedEncoder(const FastLinkedEncoder&) = delete;
    FastLinkedEncoder& operator=(const FastLinkedEncoder&) = delete;

    size_t encode_block(const uint8_t* src, size_t size, std::vector<uint8_t>& out) override {
        out.resize(static_cast<size_t>(bound_for(size)));
        const int n = LZ4_compress_fast_continue(stream_, reinterpret_cast<const char*>(src),
                                                 reinterpret_cast<char*>(out.data()),
                                                 static_cast<int>(size), static_cast<int>(out.size()),
                                                 acceleration_);
        // src may go away before the next block; keep the window in our own buffer.
        LZ4_saveDict(stream_, dict_.data(), static_cast<int>(dict_.size()));
        return finish_block(n, size, out);
    }

    const char* name() const override { return "lz4-fast-linked"; }

private:
    int acceleration_;
    LZ4_stream_t* stream_;
    std::vector<char> dict_;
};

class HCIndependentEncoder : public IBlockEncoder {
public:
    explicit HCIndependentEncoder(int level)
        : level_(level), state_(static_cast<size_t>(LZ4_sizeofStateHC())) {}

    size_t encode_block(const uint8_t* src, size_t size, std::vector<uint8_t>& out) override {
        out.resize(static_cast<size_t>(bound_for(size)));
        const int n = LZ4_compress_HC_extStateHC(state_.data(), reinterpret_cast<const char*>(src),
                                                 reinterpret_cast<char*>(out.data()),
                                                 static_cast<int>(size), static_cast<int>(out.size()),
                                                 level_);
        return finish_block(n, size, out);
    }

    const char* name() const override { return "lz4-hc"; }

private:
    int level_;
    std::vector<char> state_;
};

class HCLinkedEncoder : public IBlockEncoder {
public:
    explicit HCLinkedEncoder(int level) : stream_(LZ4_createStreamHC()), dict_(kLinkedHistorySize) {
        if (!stream_) throw std::bad_alloc();
        LZ4_resetStreamHC_fast(stream_, level);
    }
    ~HCLinkedEncoder() override { LZ4_freeStreamHC(stream_); }

    HCLinkedEncoder(const HCLinkedEncoder&) = delete;
    HCLinkedEncoder& operator=(const HCLinkedEncoder&) = delete;

    size_t encode_block(const uint8_t* src, size_t size, std::vector<uint8_t>& out) override {
        out.resize(static_cast<size_t>(bound_for(size)));
        const int n = LZ4_compress_HC_continue(stream_, reinterpret_cast<const char*>(src),
                                               reinterpret_cast<char*>(out.data()),
                                               static_cast<int>(size), static_cast<int>(out.size()));
        LZ4_saveDictHC(stream_, dict_.data(), static_cast<int>(dict_.size()));
        return finish_block(n, size, out);
    }

    const char* name() const override { return "lz4-hc-linked"; }

private:
    LZ4_streamHC_t* stream_;
    std::vector<char> dict_;
};

class IndependentDecoder : public IBlockDecoder {
public:
    size_t decode_block(const uint8_t* src, size_t size, uint8_t* dst, size_t capacity) override {
        const int n = LZ4_decompress_safe(reinterpret_cast<const char*>(src), reinterpret_cast<char*>(dst),
                                          static_cast<int>(size), static_cast<int>(capacity));
        if (n < 0) {
            throw_corruption(ErrorCode::DecompressionFailed,
                             "block of " + std::to_string(size) + " bytes failed to decode");
        }
        return static_cast<size_t>(n);
    }

    void append_history(const uint8_t*, size_t) override {}
};

// Keeps the last kLinkedHistorySize decoded bytes as the dictionary for the next block.
class LinkedDecoder : public IBlockDecoder {
public:
    LinkedDecoder() { history_.reserve(2 * kLinkedHistorySize); }

    size_t decode_block(const uint8_t* src, size_t size, uint8_t* dst, size_t capacity) override {
        const int n = LZ4_decompress_safe_usingDict(
            reinterpret_cast<const char*>(src), reinterpret_cast<char*>(dst), static_cast<int>(size),
            static_cast<int>(capacity), reinterpret_cast<const char*>(history_.data()),
            static_cast<int>(history_.size()));
        if (n < 0) {
            throw_corruption(ErrorCode::DecompressionFailed,
                             "linked block of " + std::to_string(size) + " bytes failed to decode");
        }
        append_history(dst, static_cast<size_t>(n));
        return static_cast<size_t>(n);
    }

    void append_history(const uint8_t* data, size_t size) override {
        if (size >= kLinkedHistorySize) {
            history_.assign(data + size - kLinkedHistorySize, data + size);
            return;
        }
        history_.insert(history_.end(), data, data + size);
        if (history_.size() > kLinkedHistorySize) {
            history_.erase(history_.begin(),
                           history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - kLinkedHistorySize));
        }
    }

private:
    std::vector<uint8_t> history_;
};

} // namespace

std::unique_ptr<IBlockEncoder> make_encoder(const LevelConfig& config, bool linked, size_t block_size) {
    if (block_size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw_usage(ErrorCode::MaxBlockSizeInvalid, "block size exceeds LZ4 input limit");
    }
    switch (config.mode) {
        case CompressionMode::Fast:
            if (linked) return std::make_unique<FastLinkedEncoder>(config.acceleration);
            return std::make_unique<FastIndependentEncoder>(config.acceleration);
        case CompressionMode::HighCompression:
            if (linked) return std::make_unique<HCLinkedEncoder>(config.hc_level);
            return std::make_unique<HCIndependentEncoder>(config.hc_level);
    }
    throw_usage(ErrorCode::CompressionLevelInvalid, "unknown compression mode");
}

std::unique_ptr<IBlockDecoder> make_decoder(bool linked) {
    if (linked) return std::make_unique<LinkedDecoder>();
    return std::make_unique<IndependentDecoder>();
}

} // namespace lz4framed
