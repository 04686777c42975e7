/**
 * @file test_ring_buffer.cpp
 * @brief Unit tests for RingBuffer
 *
 * Validates:
 * - Oldest-first eviction at capacity
 * - Chronological windows via last()
 * - Capacity bounds of the engine's default histories (30/60/90)
 */

#include <gtest/gtest.h>
#include <proctoreye/gaze/RingBuffer.hpp>
#include <proctoreye/gaze/EngineConfig.hpp>
#include <stdexcept>

using namespace proctoreye::gaze;

TEST(RingBufferTest, RejectsZeroCapacity) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

TEST(RingBufferTest, EvictsOldestWhenFull) {
    RingBuffer<int> buffer(3);
    for (int i = 1; i <= 5; ++i) {
        buffer.push(i);
    }

    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_TRUE(buffer.is_full());
    EXPECT_EQ(buffer.at(0), 3);
    EXPECT_EQ(buffer.newest(), 5);
}

TEST(RingBufferTest, LastReturnsChronologicalWindow) {
    RingBuffer<int> buffer(10);
    for (int i = 0; i < 6; ++i) {
        buffer.push(i);
    }

    EXPECT_EQ(buffer.last(3), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(buffer.last(0).size(), 6u);
    EXPECT_EQ(buffer.last(100).size(), 6u);
}

TEST(RingBufferTest, EmptyBufferAccess) {
    RingBuffer<float> buffer(4);
    EXPECT_TRUE(buffer.is_empty());
    EXPECT_TRUE(buffer.last(2).empty());
    EXPECT_THROW(buffer.newest(), std::out_of_range);
    EXPECT_THROW(buffer.at(0), std::out_of_range);

    buffer.push(1.0f);
    buffer.clear();
    EXPECT_TRUE(buffer.is_empty());
    EXPECT_EQ(buffer.capacity(), 4u);
}

TEST(RingBufferTest, DefaultHistoriesNeverExceedCapacity) {
    EngineConfig config;
    RingBuffer<float> ear(config.ear_history_size);
    RingBuffer<float> movement(config.movement_history_size);
    RingBuffer<int> gaze(config.gaze_history_size);

    for (int i = 0; i < 10000; ++i) {
        ear.push(static_cast<float>(i));
        movement.push(static_cast<float>(i));
        gaze.push(i);
        ASSERT_LE(ear.size(), 30u);
        ASSERT_LE(gaze.size(), 60u);
        ASSERT_LE(movement.size(), 90u);
    }

    EXPECT_EQ(ear.size(), 30u);
    EXPECT_EQ(gaze.size(), 60u);
    EXPECT_EQ(movement.size(), 90u);
    EXPECT_EQ(gaze.newest(), 9999);
}
