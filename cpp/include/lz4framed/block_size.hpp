#pragma once

#include <cstddef>
#include <cstdint>

namespace lz4framed {

// Values are the block-descriptor encoding used on the wire.
enum class BlockSizeId : uint8_t {
    Default = 0,
    Max64KB = 4,
    Max256KB = 5,
    Max1MB = 6,
    Max4MB = 7
};

bool is_valid_block_size_id(int id);

// Block size in bytes; Default resolves to Max64KB. Throws a usage error for unknown ids.
size_t get_block_size(BlockSizeId id = BlockSizeId::Default);
size_t get_block_size(int id);

// Default is replaced by Max64KB; other valid ids are returned unchanged.
BlockSizeId resolve_block_size_id(BlockSizeId id);

// Smallest id not larger than `requested` whose block still holds `src_size` bytes.
BlockSizeId optimal_block_size_id(BlockSizeId requested, uint64_t src_size);

} // namespace lz4framed
