#include "lz4framed/options.hpp"

#include <string>

#include "lz4framed/errors.hpp"

namespace lz4framed {

void FrameOptions::validate() const {
    if (!is_valid_block_size_id(static_cast<int>(block_size_id))) {
        throw_usage(ErrorCode::MaxBlockSizeInvalid,
                    "block_size_id (" + std::to_string(static_cast<int>(block_size_id)) + ") invalid");
    }
    if (!is_valid_level(level)) {
        throw_usage(ErrorCode::CompressionLevelInvalid, "level (" + std::to_string(level) + ") invalid");
    }
}

} // namespace lz4framed
