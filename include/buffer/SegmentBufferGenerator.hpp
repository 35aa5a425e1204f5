#pragma once
#include "Segment.hpp"
#include <cstddef>
#include <vector>

class IEncoder;
class ErrorSink;

// Per-channel accumulator. Collects processor-sized blocks of one input
// channel until a whole segment is available, then hands it to the encoder.
// Never throws out of push()/stop(); encoder trouble goes to the sink.
class SegmentBufferGenerator {
public:
    static constexpr double kDefaultSegmentSeconds = 2.0;

    enum class State { Idle, Running, Stopped };

    SegmentBufferGenerator(IEncoder& encoder,
                           ErrorSink& sink,
                           int channel,
                           double sampleRate,
                           int processorBufferSize,
                           double segmentSeconds = kDefaultSegmentSeconds);

    // Starts a new take. Throws CaptureError when misconfigured.
    void init();

    // Ignored unless running
    void push(const float* samples, int count);

    // Flushes what is pending as the take's final segment. Idempotent.
    void stop();

    State  state() const { return state_; }
    bool   isRunning() const { return state_ == State::Running; }
    int    channel() const { return channel_; }
    int    take() const { return take_; }
    int    segmentsEmitted() const { return sequence_; }
    size_t segmentFrames() const { return segmentFrames_; }
    size_t pendingFrames() const { return pending_.size(); }

private:
    void emit(bool final);

    IEncoder&  encoder_;
    ErrorSink& sink_;
    int    channel_;
    double sampleRate_;
    int    processorBufferSize_;
    double segmentSeconds_;
    size_t segmentFrames_ = 0;

    State state_    = State::Idle;
    int   take_     = 0;
    int   sequence_ = 0;
    std::vector<float> pending_;
};
