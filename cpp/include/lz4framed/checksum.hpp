#pragma once

#include <cstddef>
#include <cstdint>

struct XXH32_state_s;

namespace lz4framed {

constexpr uint32_t kChecksumSeed = 0;

// XXH32 over a single buffer.
uint32_t checksum(const uint8_t* data, size_t size);

// Running XXH32 digest for content checksums.
class StreamingChecksum {
public:
    StreamingChecksum();
    ~StreamingChecksum();

    StreamingChecksum(const StreamingChecksum&) = delete;
    StreamingChecksum& operator=(const StreamingChecksum&) = delete;

    void reset();
    void update(const uint8_t* data, size_t size);
    uint32_t digest() const;

private:
    XXH32_state_s* state_;
};

} // namespace lz4framed
