#pragma once

#include <cstdint>
#include <optional>

#include "block_size.hpp"
#include "levels.hpp"

namespace lz4framed {

struct FrameOptions {
    BlockSizeId block_size_id = BlockSizeId::Default;
    bool block_mode_linked = true;
    bool content_checksum = false;
    bool block_checksum = false;
    bool autoflush = false;     // emit buffered data on every update instead of whole blocks
    int level = kCompressionMin;
    std::optional<uint64_t> content_size; // declared in the header when set

    // Throws a usage error for an unknown block size id or an out-of-range level.
    void validate() const;
};

} // namespace lz4framed
