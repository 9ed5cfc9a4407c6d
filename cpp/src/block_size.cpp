#include "lz4framed/block_size.hpp"

#include <string>

#include "lz4framed/errors.hpp"

namespace lz4framed {

bool is_valid_block_size_id(int id) {
    switch (id) {
        case static_cast<int>(BlockSizeId::Default):
        case static_cast<int>(BlockSizeId::Max64KB):
        case static_cast<int>(BlockSizeId::Max256KB):
        case static_cast<int>(BlockSizeId::Max1MB):
        case static_cast<int>(BlockSizeId::Max4MB):
            return true;
        default:
            return false;
    }
}

BlockSizeId resolve_block_size_id(BlockSizeId id) {
    return id == BlockSizeId::Default ? BlockSizeId::Max64KB : id;
}

size_t get_block_size(int id) {
    if (!is_valid_block_size_id(id)) {
        throw_usage(ErrorCode::MaxBlockSizeInvalid, "block size id (" + std::to_string(id) + ") invalid");
    }
    const int resolved = static_cast<int>(resolve_block_size_id(static_cast<BlockSizeId>(id)));
    return size_t{1} << (8 + 2 * resolved);
}

size_t get_block_size(BlockSizeId id) {
    return get_block_size(static_cast<int>(id));
}

BlockSizeId optimal_block_size_id(BlockSizeId requested, uint64_t src_size) {
    const BlockSizeId limit = resolve_block_size_id(requested);
    for (int id = static_cast<int>(BlockSizeId::Max64KB); id < static_cast<int>(limit); ++id) {
        if (src_size <= get_block_size(id)) {
            return static_cast<BlockSizeId>(id);
        }
    }
    return limit;
}

} // namespace lz4framed
