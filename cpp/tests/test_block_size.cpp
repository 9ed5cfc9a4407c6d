#include <gtest/gtest.h>

#include "lz4framed/block_size.hpp"
#include "test_util.hpp"

using namespace lz4framed;
using lz4framed::test::expect_error;

TEST(BlockSize, SizesForEachId) {
    EXPECT_EQ(get_block_size(BlockSizeId::Max64KB), 64u * 1024);
    EXPECT_EQ(get_block_size(BlockSizeId::Max256KB), 256u * 1024);
    EXPECT_EQ(get_block_size(BlockSizeId::Max1MB), 1024u * 1024);
    EXPECT_EQ(get_block_size(BlockSizeId::Max4MB), 4u * 1024 * 1024);
}

TEST(BlockSize, DefaultIsSixtyFourKilobytes) {
    EXPECT_EQ(get_block_size(), 65536u);
    EXPECT_EQ(get_block_size(0), 65536u);
    EXPECT_EQ(resolve_block_size_id(BlockSizeId::Default), BlockSizeId::Max64KB);
    EXPECT_EQ(resolve_block_size_id(BlockSizeId::Max1MB), BlockSizeId::Max1MB);
}

TEST(BlockSize, UnknownIdIsUsageError) {
    for (int id : {-1, 1, 3, 8, 255}) {
        EXPECT_FALSE(is_valid_block_size_id(id));
        expect_error([id] { (void)get_block_size(id); }, ErrorCode::MaxBlockSizeInvalid, ErrorKind::Usage);
    }
}

TEST(BlockSize, OptimalIdShrinksToFitInput) {
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max4MB, 100), BlockSizeId::Max64KB);
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max4MB, 64 * 1024), BlockSizeId::Max64KB);
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max4MB, 64 * 1024 + 1), BlockSizeId::Max256KB);
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max4MB, 2 * 1024 * 1024), BlockSizeId::Max4MB);
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max4MB, 100u * 1024 * 1024), BlockSizeId::Max4MB);
}

TEST(BlockSize, OptimalIdNeverExceedsRequest) {
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Max256KB, 10u * 1024 * 1024), BlockSizeId::Max256KB);
    EXPECT_EQ(optimal_block_size_id(BlockSizeId::Default, 10u * 1024 * 1024), BlockSizeId::Max64KB);
}
