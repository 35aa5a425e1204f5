#include "audio/AudioEngine.hpp"
#include "buffer/BufferRegistry.hpp"
#include "session/CaptureError.hpp"
#include "session/SessionContext.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>

AudioEngine::AudioEngine(BufferRegistry& buffers, WarningSink& warnings,
                         const AudioConfig& config)
    : buffers_(buffers)
    , warnings_(warnings)
    , config_(config)
    , scratch_(config.processorBufferSize > 0 ? config.processorBufferSize : 0)
{
}

AudioEngine::~AudioEngine() {
    releaseStream();
}

void AudioEngine::resume() {
    if (!suspended_) return;
    suspended_ = false;
    spdlog::debug("Audio engine resumed ({} Hz, {} frames/buffer)",
                  config_.sampleRate, config_.processorBufferSize);
}

std::future<int> AudioEngine::handleInputStream(std::shared_ptr<IInputStream> stream) {
    std::promise<int> result;

    if (!stream) {
        result.set_value(0);
        return result.get_future();
    }

    // Same stream handed back while it is still running: nothing to rewire
    if (stream == stream_ && stream_->isRunning()) {
        result.set_value(inputChannels_);
        return result.get_future();
    }

    releaseStream();

    if (std::abs(stream->sampleRate() - config_.sampleRate) > 0.5) {
        warnings_.onWarning("Stream runs at " + std::to_string(stream->sampleRate())
                            + " Hz but the engine expects "
                            + std::to_string(config_.sampleRate) + " Hz");
        result.set_value(0);
        return result.get_future();
    }

    int channels = stream->inputChannelCount();
    if (channels <= 0) {
        result.set_value(0);
        return result.get_future();
    }

    size_t ringSize = static_cast<size_t>(config_.sampleRate * config_.ringSeconds);
    ringSize = std::max(ringSize, static_cast<size_t>(config_.processorBufferSize) * 2);

    rings_.clear();
    for (int ch = 0; ch < channels; ch++)
        rings_.push_back(std::make_unique<RingBuffer>(ringSize));

    stream->setCallback([this](const float* const* in, int inCh,
                               float* const* out, int outCh, int frames) {
        render(in, inCh, out, outCh, frames);
    });

    if (!stream->start()) {
        spdlog::error("Audio engine: failed to start {} stream", stream->backendName());
        rings_.clear();
        result.set_value(0);
        return result.get_future();
    }

    stream_         = std::move(stream);
    inputChannels_  = channels;
    outputChannels_ = stream_->outputChannelCount();
    streamGeneration_++;

    spdlog::info("Audio engine attached {} stream: {} in, {} out",
                 stream_->backendName(), inputChannels_, outputChannels_);

    result.set_value(inputChannels_);
    return result.get_future();
}

void AudioEngine::stopAll() {
    if (stream_)
        spdlog::info("Audio engine stopping all channels");
    releaseStream();
}

void AudioEngine::releaseStream() {
    if (stream_) {
        stream_->stop();
        stream_->setCallback(nullptr);
        stream_.reset();
        streamGeneration_++;
    }
    rings_.clear();
}

void AudioEngine::muteOutputForInput(int input, int output) {
    if (!routing_.mute(input, output))
        warnings_.onWarning("Cannot mute route " + std::to_string(input)
                            + " -> " + std::to_string(output));
}

void AudioEngine::unmuteOutputForInput(int input, int output) {
    if (!routing_.unmute(input, output))
        warnings_.onWarning("Cannot unmute route " + std::to_string(input)
                            + " -> " + std::to_string(output));
}

void AudioEngine::recordChannel(int channel) {
    if (channel < 0 || channel >= inputChannels_)
        throw CaptureError("Input channel " + std::to_string(channel)
                           + " is not available (stream has "
                           + std::to_string(inputChannels_) + ")");
    if (recording_.insert(channel).second)
        spdlog::debug("Channel {} recording ({} active)", channel, recording_.size());
}

void AudioEngine::stopRecordChannel(int channel) {
    if (recording_.erase(channel) > 0)
        spdlog::debug("Channel {} stopped ({} active)", channel, recording_.size());
}

size_t AudioEngine::process() {
    if (suspended_ || !stream_ || scratch_.empty()) return 0;

    const unsigned generation = streamGeneration_;
    const size_t block = scratch_.size();
    size_t delivered = 0;

    for (size_t ch = 0; ch < rings_.size(); ch++) {
        size_t dropped = rings_[ch]->takeDropped();
        if (dropped > 0)
            warnings_.onWarning("Input channel " + std::to_string(ch) + " overran, "
                                + std::to_string(dropped) + " samples dropped");

        while (rings_[ch]->available() >= block) {
            if (!isRecording(static_cast<int>(ch))) {
                rings_[ch]->skip(block);
                continue;
            }

            rings_[ch]->read(scratch_.data(), block);
            buffers_.pushSamples(static_cast<int>(ch), scratch_.data(),
                                 static_cast<int>(block));
            delivered += block;

            // A failure raised while pushing may have torn the stream down
            if (generation != streamGeneration_) return delivered;
        }
    }
    return delivered;
}

void AudioEngine::render(const float* const* input, int inputChannels,
                         float* const* output, int outputChannels, int frameCount) {
    if (output) {
        for (int o = 0; o < outputChannels; o++)
            std::fill(output[o], output[o] + frameCount, 0.0f);
    }

    if (!input) return;

    int channels = std::min(inputChannels, static_cast<int>(rings_.size()));
    for (int ch = 0; ch < channels; ch++) {
        rings_[ch]->write(input[ch], static_cast<size_t>(frameCount));

        if (!output) continue;
        uint64_t mask = routing_.routes(ch);
        for (int o = 0; mask != 0 && o < outputChannels && o < RoutingMatrix::kMaxChannels; o++) {
            if (!(mask & (uint64_t(1) << o))) continue;
            for (int f = 0; f < frameCount; f++)
                output[o][f] += input[ch][f];
        }
    }
}
