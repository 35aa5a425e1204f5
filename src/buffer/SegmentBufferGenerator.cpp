#include "buffer/SegmentBufferGenerator.hpp"
#include "encode/IEncoder.hpp"
#include "session/CaptureError.hpp"
#include "session/SessionContext.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>

SegmentBufferGenerator::SegmentBufferGenerator(IEncoder& encoder,
                                               ErrorSink& sink,
                                               int channel,
                                               double sampleRate,
                                               int processorBufferSize,
                                               double segmentSeconds)
    : encoder_(encoder)
    , sink_(sink)
    , channel_(channel)
    , sampleRate_(sampleRate)
    , processorBufferSize_(processorBufferSize)
    , segmentSeconds_(segmentSeconds)
{
    // Whole processor buffers only, so a segment boundary never splits a block
    if (sampleRate_ > 0 && processorBufferSize_ > 0 && segmentSeconds_ > 0) {
        auto wanted = static_cast<size_t>(std::ceil(sampleRate_ * segmentSeconds_));
        size_t blocks = (wanted + processorBufferSize_ - 1) / processorBufferSize_;
        segmentFrames_ = std::max<size_t>(blocks, 1) * processorBufferSize_;
    }
}

void SegmentBufferGenerator::init() {
    if (segmentFrames_ == 0)
        throw CaptureError("Buffer for channel " + std::to_string(channel_)
                           + " is misconfigured (rate " + std::to_string(sampleRate_)
                           + ", block " + std::to_string(processorBufferSize_) + ")");

    if (state_ == State::Running) return;

    take_++;
    sequence_ = 0;
    pending_.clear();
    pending_.reserve(segmentFrames_);
    state_ = State::Running;

    spdlog::debug("Channel {} buffer armed: take {}, {} frames/segment",
                  channel_, take_, segmentFrames_);
}

void SegmentBufferGenerator::push(const float* samples, int count) {
    if (state_ != State::Running || !samples || count <= 0) return;

    int offset = 0;
    while (offset < count && state_ == State::Running) {
        size_t room = segmentFrames_ - pending_.size();
        size_t n = std::min(room, static_cast<size_t>(count - offset));
        pending_.insert(pending_.end(), samples + offset, samples + offset + n);
        offset += static_cast<int>(n);

        if (pending_.size() >= segmentFrames_)
            emit(false);
    }
}

void SegmentBufferGenerator::stop() {
    if (state_ != State::Running) return;

    // Mark stopped first: a failure reported from emit() tears everything
    // down and calls back into stop()
    state_ = State::Stopped;

    if (!pending_.empty())
        emit(true);

    spdlog::debug("Channel {} buffer stopped after {} segments (take {})",
                  channel_, sequence_, take_);
}

void SegmentBufferGenerator::emit(bool final) {
    Segment seg;
    seg.channel    = channel_;
    seg.take       = take_;
    seg.sequence   = sequence_++;
    seg.sampleRate = sampleRate_;
    seg.final      = final;
    seg.samples.swap(pending_);
    pending_.reserve(segmentFrames_);

    try {
        encoder_.encode(seg);
    } catch (const std::exception& e) {
        spdlog::error("Channel {}: encoding segment {} failed: {}",
                      channel_, seg.sequence, e.what());
        sink_.onFailure(e);
    }
}
