#include "lz4framed/checksum.hpp"

#include <new>

#include <xxhash.h>

namespace lz4framed {

uint32_t checksum(const uint8_t* data, size_t size) {
    return XXH32(data, size, kChecksumSeed);
}

StreamingChecksum::StreamingChecksum() : state_(XXH32_createState()) {
    if (!state_) throw std::bad_alloc();
    reset();
}

StreamingChecksum::~StreamingChecksum() {
    XXH32_freeState(state_);
}

void StreamingChecksum::reset() {
    XXH32_reset(state_, kChecksumSeed);
}

void StreamingChecksum::update(const uint8_t* data, size_t size) {
    if (size == 0) return;
    XXH32_update(state_, data, size);
}

uint32_t StreamingChecksum::digest() const {
    return XXH32_digest(state_);
}

} // namespace lz4framed
