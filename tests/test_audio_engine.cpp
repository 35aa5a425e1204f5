#include <gtest/gtest.h>
#include "audio/AudioEngine.hpp"
#include "buffer/BufferRegistry.hpp"
#include "session/CaptureError.hpp"
#include "TestDoubles.hpp"

class AudioEngineTest : public ::testing::Test {
protected:
    AudioEngineTest() {
        config_.sampleRate          = 1000;
        config_.processorBufferSize = 100;
        config_.ringSeconds         = 2.0;
        engine_ = std::make_unique<AudioEngine>(buffers_, warnings_, config_);
    }

    std::shared_ptr<FakeStream> attach(int inputs = 2, int outputs = 2) {
        auto stream = std::make_shared<FakeStream>(inputs, outputs, config_.sampleRate);
        EXPECT_EQ(engine_->handleInputStream(stream).get(), inputs);
        return stream;
    }

    // Gives every channel a 200-frame buffer and arms it
    void armBuffers(int channels) {
        for (int ch = 0; ch < channels; ch++) {
            buffers_.setBuffer(std::make_unique<SegmentBufferGenerator>(
                encoder_, errors_, ch, config_.sampleRate,
                config_.processorBufferSize, 0.2), ch);
            buffers_.initBuffer(ch);
        }
    }

    AudioConfig      config_;
    FakeEncoder      encoder_;
    ErrorCollector   errors_;
    WarningCollector warnings_;
    BufferRegistry   buffers_;
    std::unique_ptr<AudioEngine> engine_;
};

TEST_F(AudioEngineTest, StartsSuspended) {
    EXPECT_TRUE(engine_->isSuspended());
    engine_->resume();
    engine_->resume();
    EXPECT_FALSE(engine_->isSuspended());
}

TEST_F(AudioEngineTest, NullStreamGivesNoChannels) {
    EXPECT_EQ(engine_->handleInputStream(nullptr).get(), 0);
    EXPECT_FALSE(engine_->hasStream());
}

TEST_F(AudioEngineTest, SampleRateMismatchIsRejected) {
    auto stream = std::make_shared<FakeStream>(2, 2, 44100);
    EXPECT_EQ(engine_->handleInputStream(stream).get(), 0);
    EXPECT_FALSE(stream->isRunning());
    ASSERT_EQ(warnings_.warnings.size(), 1u);
}

TEST_F(AudioEngineTest, AttachStartsStreamAndReportsShape) {
    auto stream = attach(4, 2);
    EXPECT_TRUE(stream->isRunning());
    EXPECT_EQ(engine_->inputChannelCount(), 4);
    EXPECT_EQ(engine_->outputChannelCount(), 2);
}

TEST_F(AudioEngineTest, SameRunningStreamIsNotRestarted) {
    auto stream = attach(2);
    EXPECT_EQ(engine_->handleInputStream(stream).get(), 2);
    EXPECT_EQ(stream->startCalls, 1);
}

TEST_F(AudioEngineTest, NewStreamReplacesOld) {
    auto first  = attach(2);
    auto second = attach(3);
    EXPECT_FALSE(first->isRunning());
    EXPECT_TRUE(second->isRunning());
    EXPECT_EQ(engine_->inputChannelCount(), 3);
}

TEST_F(AudioEngineTest, StopAllKeepsRecordingFlags) {
    auto stream = attach(2);
    engine_->recordChannel(1);

    engine_->stopAll();

    EXPECT_FALSE(stream->isRunning());
    EXPECT_FALSE(engine_->hasStream());
    EXPECT_TRUE(engine_->isRecording(1));
    EXPECT_EQ(engine_->inputChannelCount(), 2);
}

TEST_F(AudioEngineTest, RecordingUnavailableChannelThrows) {
    attach(2);
    EXPECT_THROW(engine_->recordChannel(2), CaptureError);
    EXPECT_THROW(engine_->recordChannel(-1), CaptureError);
    EXPECT_EQ(engine_->recordingChannelCount(), 0);
}

TEST_F(AudioEngineTest, RecordFlagsAreASet) {
    attach(2);
    engine_->recordChannel(0);
    engine_->recordChannel(0);
    EXPECT_EQ(engine_->recordingChannelCount(), 1);

    engine_->stopRecordChannel(0);
    engine_->stopRecordChannel(0);
    EXPECT_EQ(engine_->recordingChannelCount(), 0);
}

TEST_F(AudioEngineTest, OutputsAreSilentWhileMuted) {
    auto stream = attach(2, 2);
    auto out = stream->feed({std::vector<float>(8, 0.5f), std::vector<float>(8, 0.25f)});
    for (auto& ch : out)
        for (float s : ch) EXPECT_FLOAT_EQ(s, 0.0f);
}

TEST_F(AudioEngineTest, UnmutedRoutesAreMixedIntoOutputs) {
    auto stream = attach(2, 2);
    engine_->unmuteOutputForInput(0, 0);
    engine_->unmuteOutputForInput(1, 0);
    engine_->unmuteOutputForInput(1, 1);

    auto out = stream->feed({std::vector<float>(8, 0.5f), std::vector<float>(8, 0.25f)});
    EXPECT_FLOAT_EQ(out[0][0], 0.75f);
    EXPECT_FLOAT_EQ(out[1][0], 0.25f);

    engine_->muteOutputForInput(1, 0);
    out = stream->feed({std::vector<float>(8, 0.5f), std::vector<float>(8, 0.25f)});
    EXPECT_FLOAT_EQ(out[0][0], 0.5f);
}

TEST_F(AudioEngineTest, BadRouteWarns) {
    engine_->unmuteOutputForInput(0, RoutingMatrix::kMaxChannels);
    engine_->muteOutputForInput(-1, 0);
    ASSERT_EQ(warnings_.warnings.size(), 2u);
    EXPECT_EQ(warnings_.warnings[1], "Cannot mute route -1 -> 0");
}

TEST_F(AudioEngineTest, ProcessDoesNothingWhileSuspended) {
    auto stream = attach(1);
    armBuffers(1);
    engine_->recordChannel(0);
    stream->feedConstant(0.1f, 200);

    EXPECT_EQ(engine_->process(), 0u);
    EXPECT_TRUE(encoder_.segments.empty());
}

TEST_F(AudioEngineTest, ProcessFeedsOnlyRecordingChannels) {
    engine_->resume();
    auto stream = attach(2);
    armBuffers(2);
    engine_->recordChannel(1);

    stream->feedConstant(0.1f, 200);
    EXPECT_EQ(engine_->process(), 200u);

    ASSERT_EQ(encoder_.segments.size(), 1u);
    EXPECT_EQ(encoder_.segments[0].channel, 1);
    EXPECT_EQ(buffers_.buffer(0)->pendingFrames(), 0u);
}

TEST_F(AudioEngineTest, PartialBlockWaitsInRing) {
    engine_->resume();
    auto stream = attach(1);
    armBuffers(1);
    engine_->recordChannel(0);

    stream->feedConstant(0.1f, 150);
    EXPECT_EQ(engine_->process(), 100u);

    stream->feedConstant(0.1f, 50);
    EXPECT_EQ(engine_->process(), 100u);
    EXPECT_EQ(encoder_.segments.size(), 1u);
}

TEST_F(AudioEngineTest, SamplesOfMutedRecordChannelsAreDiscarded) {
    engine_->resume();
    auto stream = attach(1);
    armBuffers(1);

    stream->feedConstant(0.1f, 200);
    EXPECT_EQ(engine_->process(), 0u);

    // Old audio must not leak into a later take
    engine_->recordChannel(0);
    stream->feedConstant(0.9f, 200);
    engine_->process();
    ASSERT_EQ(encoder_.segments.size(), 1u);
    EXPECT_FLOAT_EQ(encoder_.segments[0].samples[0], 0.9f);
}

TEST_F(AudioEngineTest, OverrunIsReportedOnce) {
    engine_->resume();
    auto stream = attach(1);

    // Ring holds 2 s = 2000 samples
    stream->feedConstant(0.1f, 2100);
    engine_->process();
    engine_->process();

    ASSERT_EQ(warnings_.warnings.size(), 1u);
    EXPECT_EQ(warnings_.warnings[0], "Input channel 0 overran, 100 samples dropped");
}
