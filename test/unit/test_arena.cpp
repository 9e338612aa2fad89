#include "mcpgen/core/arena.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <new>
#include <string>

using namespace mcpgen;

TEST(MonotonicArena, AllocatesAligned) {
    monotonic_arena arena(256);
    for (size_t alignment : {1UL, 2UL, 8UL, 16UL, 64UL}) {
        void* p = arena.allocate(3, alignment);
        ASSERT_NE(p, nullptr);
        EXPECT_EQ(reinterpret_cast<uintptr_t>(p) % alignment, 0U);
    }
    EXPECT_EQ(arena.bytes_allocated(), 15U);
}

TEST(MonotonicArena, RejectsBadAlignment) {
    monotonic_arena arena;
    EXPECT_EQ(arena.allocate(8, 3), nullptr);
    EXPECT_EQ(arena.allocate(8, 128), nullptr);
    EXPECT_EQ(arena.block_count(), 0U);
}

TEST(MonotonicArena, GrowsAndFitsLargeRequests) {
    monotonic_arena arena(128);
    ASSERT_NE(arena.allocate(100), nullptr);
    ASSERT_NE(arena.allocate(100), nullptr);
    EXPECT_EQ(arena.block_count(), 2U);

    void* big = arena.allocate(10000);
    ASSERT_NE(big, nullptr);
    EXPECT_GE(arena.total_capacity(), 10000U);
    EXPECT_EQ(arena.bytes_allocated(), 10200U);
}

TEST(MonotonicArena, ResetReusesBlocks) {
    monotonic_arena arena(1024);
    ASSERT_NE(arena.allocate(512), nullptr);
    auto capacity = arena.total_capacity();
    arena.reset();
    EXPECT_EQ(arena.bytes_allocated(), 0U);
    ASSERT_NE(arena.allocate(512), nullptr);
    EXPECT_EQ(arena.total_capacity(), capacity);
    EXPECT_EQ(arena.block_count(), 1U);
}

TEST(MonotonicArena, MoveTransfersOwnership) {
    monotonic_arena a;
    auto* value = a.make<int>(41);
    monotonic_arena b(std::move(a));
    EXPECT_EQ(*value, 41);
    EXPECT_EQ(b.block_count(), 1U);
    EXPECT_EQ(a.block_count(), 0U);
    EXPECT_EQ(a.bytes_allocated(), 0U);
}

TEST(ArenaAllocator, BacksStringsAndVectors) {
    monotonic_arena arena;
    auto s = make_arena_string("a string long enough to leave the small buffer", &arena);
    EXPECT_EQ(std::string_view(s), "a string long enough to leave the small buffer");

    arena_vector<int> v{arena_allocator<int>(&arena)};
    for (int i = 0; i < 100; ++i) {
        v.push_back(i);
    }
    EXPECT_EQ(v.back(), 99);
    EXPECT_GT(arena.bytes_allocated(), 100 * sizeof(int));
}

TEST(ArenaAllocator, NullArenaThrows) {
    arena_allocator<int> alloc(nullptr);
    EXPECT_THROW((void)alloc.allocate(1), std::bad_alloc);
}
