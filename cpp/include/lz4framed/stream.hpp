#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

#include "compress_context.hpp"
#include "decompress_context.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "types.hpp"

namespace lz4framed {

// Pull-based input: fill up to `capacity` bytes, return how many were written (0 at end).
using ByteSource = std::function<size_t(uint8_t* dst, size_t capacity)>;
// Push-based output.
using ByteSink = std::function<void(const uint8_t* data, size_t size)>;

ByteSource source_from(std::istream& in);
ByteSource source_from(const Bytes& data, size_t max_read = 0);
ByteSink sink_to(std::ostream& out);
ByteSink sink_to(Bytes& out);

// Incremental compressor over one CompressionContext. Without a sink, output is returned from
// update() and end(); with a sink it is written there and the calls return empty buffers. The
// header is held back until the first update so an unused compressor never emits one.
class Compressor {
public:
    explicit Compressor(const FrameOptions& options = {});
    Compressor(ByteSink sink, const FrameOptions& options = {});

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;

    OrEndOfInput<Bytes> update(const uint8_t* data, size_t size);
    OrEndOfInput<Bytes> update(const Bytes& data) { return update(data.data(), data.size()); }

    // Finalises the frame. Must be called exactly once.
    Bytes end();

    bool has_sink() const { return static_cast<bool>(sink_); }
    bool started() const { return stage_ == Stage::Started; }
    bool ended() const { return ended_; }

    // Scoped use with a sink: runs body, then end() on normal return. An exception from body
    // propagates without finalising the frame.
    template <typename Body>
    static void with_sink(ByteSink sink, const FrameOptions& options, Body&& body) {
        Compressor compressor(std::move(sink), options);
        body(compressor);
        compressor.end();
    }

private:
    enum class Stage {
        NotStarted,
        Started
    };

    std::mutex mutex_;
    CompressionContext ctx_;
    ByteSink sink_;
    Bytes header_;
    Stage stage_ = Stage::NotStarted;
    bool ended_ = false;
};

struct FrameComplete {};

// One step of a Decompressor: a decoded chunk, the end of the frame, or a source that ran dry
// before the frame was complete.
using DecodeStep = std::variant<Bytes, FrameComplete, EndOfInput>;

// Pulls compressed bytes from a source and yields decoded chunks. The first read covers the
// largest possible header; once the header is parsed the chunk length follows the frame's block
// size unless a fixed chunk length was requested. Single pass.
class Decompressor {
public:
    static constexpr size_t kInitialChunkLength = 32;

    explicit Decompressor(ByteSource source, size_t chunk_length = 0);

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    DecodeStep next();

    // Absent until the header has been parsed; never changes afterwards.
    const std::optional<FrameInfo>& frame_info() const { return info_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Bytes;
        using difference_type = std::ptrdiff_t;
        using pointer = const Bytes*;
        using reference = const Bytes&;

        iterator() = default;
        explicit iterator(Decompressor* owner);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) { return a.owner_ == b.owner_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        void advance();

        Decompressor* owner_ = nullptr;
        Bytes current_;
    };

    // Iterating raises FrameIncomplete when the source runs dry early. Errors raised after some
    // output was handed out note how much of it there was.
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    // Per-pull state threaded through next().
    struct PullState {
        size_t input_hint = kMaxHeaderSize;
        size_t chunk_length = kInitialChunkLength;
        bool header_read = false;
        bool finished = false;
    };

    size_t read_input(size_t want);
    bool fill(); // false when the source returned no bytes

    std::mutex mutex_;
    DecompressionContext ctx_;
    ByteSource source_;
    size_t fixed_chunk_length_;
    PullState pull_;
    std::optional<FrameInfo> info_;
    std::deque<Bytes> ready_;
    Bytes input_;
    uint64_t yielded_ = 0; // decoded bytes already handed to the caller
};

} // namespace lz4framed
