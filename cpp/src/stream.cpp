#include "lz4framed/stream.hpp"

#include <algorithm>
#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "lz4framed/block_size.hpp"
#include "lz4framed/errors.hpp"

namespace lz4framed {

ByteSource source_from(std::istream& in) {
    return [&in](uint8_t* dst, size_t capacity) -> size_t {
        in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(capacity));
        if (in.bad()) {
            throw std::runtime_error("Failed to read compressed input");
        }
        return static_cast<size_t>(in.gcount());
    };
}

ByteSource source_from(const Bytes& data, size_t max_read) {
    return [&data, max_read, offset = size_t{0}](uint8_t* dst, size_t capacity) mutable -> size_t {
        size_t n = std::min(capacity, data.size() - offset);
        if (max_read) n = std::min(n, max_read);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset),
                  data.begin() + static_cast<std::ptrdiff_t>(offset + n), dst);
        offset += n;
        return n;
    };
}

ByteSink sink_to(std::ostream& out) {
    return [&out](const uint8_t* data, size_t size) {
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out) {
            throw std::runtime_error("Failed to write compressed output");
        }
    };
}

ByteSink sink_to(Bytes& out) {
    return [&out](const uint8_t* data, size_t size) { out.insert(out.end(), data, data + size); };
}

// ---------------------------------------------------------------------------------------------

Compressor::Compressor(const FrameOptions& options) {
    header_ = ctx_.begin(options);
}

Compressor::Compressor(ByteSink sink, const FrameOptions& options) : sink_(std::move(sink)) {
    if (!sink_) throw_usage(ErrorCode::Generic, "Compressor sink is empty");
    header_ = ctx_.begin(options);
}

OrEndOfInput<Bytes> Compressor::update(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) throw_usage(ErrorCode::Generic, "Compressor::update called after end()");

    OrEndOfInput<Bytes> step = EndOfInput{};
    try {
        step = ctx_.update(data, size);
    } catch (const Error& e) {
        if (stage_ == Stage::Started && sink_) throw with_context(e, "earlier output already written to sink");
        throw;
    }
    if (is_end_of_input(step)) return step;
    Bytes& out = std::get<Bytes>(step);

    if (stage_ == Stage::NotStarted) {
        stage_ = Stage::Started;
        if (sink_) {
            sink_(header_.data(), header_.size());
        } else {
            out.insert(out.begin(), header_.begin(), header_.end());
        }
        header_.clear();
    }
    if (sink_) {
        if (!out.empty()) sink_(out.data(), out.size());
        return Bytes{};
    }
    return step;
}

Bytes Compressor::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) throw_usage(ErrorCode::Generic, "Compressor::end called twice");
    ended_ = true;

    Bytes tail = ctx_.end();
    if (stage_ == Stage::NotStarted) {
        // Nothing was compressed. A sink receives nothing at all; a caller collecting output gets
        // a complete empty frame.
        if (sink_) return Bytes{};
        header_.insert(header_.end(), tail.begin(), tail.end());
        return std::move(header_);
    }
    if (sink_) {
        sink_(tail.data(), tail.size());
        return Bytes{};
    }
    return tail;
}

// ---------------------------------------------------------------------------------------------

Decompressor::Decompressor(ByteSource source, size_t chunk_length)
    : source_(std::move(source)), fixed_chunk_length_(chunk_length) {
    if (!source_) throw_usage(ErrorCode::Generic, "Decompressor source is empty");
    if (fixed_chunk_length_) pull_.chunk_length = fixed_chunk_length_;
}

DecodeStep Decompressor::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (true) {
        if (!ready_.empty()) {
            Bytes chunk = std::move(ready_.front());
            ready_.pop_front();
            yielded_ += chunk.size();
            return chunk;
        }
        if (pull_.finished) return FrameComplete{};
        if (!fill()) return EndOfInput{};
    }
}

size_t Decompressor::read_input(size_t want) {
    input_.resize(want);
    const size_t got = source_(input_.data(), want);
    if (got > want) {
        throw_usage(ErrorCode::SrcSizeTooLarge, "source returned more bytes than requested");
    }
    return got;
}

bool Decompressor::fill() {
    const size_t got = read_input(pull_.input_hint);
    if (got == 0) return false;

    OrEndOfInput<DecompressResult> step = EndOfInput{};
    try {
        step = ctx_.update(input_.data(), got, pull_.chunk_length);
    } catch (const Error& e) {
        if (yielded_) throw with_context(e, std::to_string(yielded_) + " decoded bytes already yielded");
        throw;
    }
    DecompressResult& result = std::get<DecompressResult>(step);
    for (Bytes& chunk : result.chunks) {
        ready_.push_back(std::move(chunk));
    }

    if (!pull_.header_read) {
        try {
            info_ = ctx_.frame_info();
            pull_.header_read = true;
            if (!fixed_chunk_length_) pull_.chunk_length = get_block_size(info_->block_size_id);
        } catch (const Error& e) {
            // Header still short (only possible with a short read); retry on the next pull.
            if (e.code() != ErrorCode::FrameHeaderIncomplete) throw;
        }
    }

    pull_.input_hint = result.input_hint;
    pull_.finished = result.input_hint == 0;
    return true;
}

Decompressor::iterator::iterator(Decompressor* owner) : owner_(owner) {
    advance();
}

Decompressor::iterator& Decompressor::iterator::operator++() {
    advance();
    return *this;
}

void Decompressor::iterator::advance() {
    DecodeStep step = owner_->next();
    if (auto* chunk = std::get_if<Bytes>(&step)) {
        current_ = std::move(*chunk);
        return;
    }
    owner_ = nullptr;
    current_.clear();
    if (std::holds_alternative<EndOfInput>(step)) {
        throw_incomplete(ErrorCode::FrameIncomplete, "source exhausted before the end of the frame");
    }
}

} // namespace lz4framed
