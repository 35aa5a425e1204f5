#include <gtest/gtest.h>
#include "buffer/BufferRegistry.hpp"
#include "TestDoubles.hpp"

class BufferRegistryTest : public ::testing::Test {
protected:
    FakeEncoder    encoder_;
    ErrorCollector errors_;
    BufferRegistry registry_;

    std::unique_ptr<SegmentBufferGenerator> make(int channel) {
        return std::make_unique<SegmentBufferGenerator>(
            encoder_, errors_, channel, 1000, 100, 0.2);
    }
};

TEST_F(BufferRegistryTest, StartsEmpty) {
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_FALSE(registry_.bufferExists(0));
    EXPECT_EQ(registry_.buffer(0), nullptr);
}

TEST_F(BufferRegistryTest, RefusesToReplaceExistingBuffer) {
    EXPECT_TRUE(registry_.setBuffer(make(0), 0));
    auto* original = registry_.buffer(0);

    EXPECT_FALSE(registry_.setBuffer(make(0), 0));
    EXPECT_EQ(registry_.buffer(0), original);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(BufferRegistryTest, RefusesNullBuffer) {
    EXPECT_FALSE(registry_.setBuffer(nullptr, 2));
    EXPECT_FALSE(registry_.bufferExists(2));
}

TEST_F(BufferRegistryTest, InitUnknownChannelThrows) {
    EXPECT_THROW(registry_.initBuffer(4), CaptureError);
}

TEST_F(BufferRegistryTest, InitArmsOnlyThatChannel) {
    registry_.setBuffer(make(0), 0);
    registry_.setBuffer(make(1), 1);

    registry_.initBuffer(1);

    EXPECT_FALSE(registry_.buffer(0)->isRunning());
    EXPECT_TRUE(registry_.buffer(1)->isRunning());
}

TEST_F(BufferRegistryTest, PushRoutesToChannel) {
    registry_.setBuffer(make(0), 0);
    registry_.setBuffer(make(1), 1);
    registry_.initBuffer(0);
    registry_.initBuffer(1);

    std::vector<float> block(100, 0.5f);
    registry_.pushSamples(1, block.data(), 100);
    registry_.pushSamples(7, block.data(), 100);

    EXPECT_EQ(registry_.buffer(0)->pendingFrames(), 0u);
    EXPECT_EQ(registry_.buffer(1)->pendingFrames(), 100u);
}

TEST_F(BufferRegistryTest, StopAllFlushesAndKeepsBuffers) {
    registry_.setBuffer(make(0), 0);
    registry_.setBuffer(make(1), 1);
    registry_.initBuffer(0);
    registry_.initBuffer(1);

    std::vector<float> block(100, 0.5f);
    registry_.pushSamples(0, block.data(), 100);

    registry_.stopAll();

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_FALSE(registry_.buffer(0)->isRunning());
    EXPECT_FALSE(registry_.buffer(1)->isRunning());
    ASSERT_EQ(encoder_.segments.size(), 1u);
    EXPECT_TRUE(encoder_.segments[0].final);
}

TEST_F(BufferRegistryTest, StopUnknownChannelIsHarmless) {
    EXPECT_NO_THROW(registry_.stopBuffer(9));
}

TEST_F(BufferRegistryTest, ChannelsAreListedInOrder) {
    registry_.setBuffer(make(2), 2);
    registry_.setBuffer(make(0), 0);
    registry_.setBuffer(make(1), 1);
    EXPECT_EQ(registry_.channels(), (std::vector<int>{0, 1, 2}));
}
