#pragma once
#include "SegmentBufferGenerator.hpp"
#include "session/CaptureError.hpp"
#include <cstddef>
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Owns one SegmentBufferGenerator per channel index. Buffers are created
// at most once per session and only ever stopped, never removed.
class BufferRegistry {
public:
    bool bufferExists(int channel) const {
        return buffers_.count(channel) > 0;
    }

    // Refuses to replace an existing buffer
    bool setBuffer(std::unique_ptr<SegmentBufferGenerator> buffer, int channel) {
        if (!buffer) return false;
        if (bufferExists(channel)) {
            spdlog::warn("Buffer for channel {} already exists, keeping it", channel);
            return false;
        }
        buffers_.emplace(channel, std::move(buffer));
        return true;
    }

    // Throws CaptureError when the channel has no buffer or the buffer
    // cannot start
    void initBuffer(int channel) {
        auto it = buffers_.find(channel);
        if (it == buffers_.end())
            throw CaptureError("No buffer for input channel " + std::to_string(channel));
        it->second->init();
    }

    void stopBuffer(int channel) {
        auto it = buffers_.find(channel);
        if (it != buffers_.end())
            it->second->stop();
    }

    void stopAll() {
        for (auto& [ch, buffer] : buffers_)
            buffer->stop();
    }

    // Data path, from AudioEngine::process()
    void pushSamples(int channel, const float* samples, int count) {
        auto it = buffers_.find(channel);
        if (it != buffers_.end())
            it->second->push(samples, count);
    }

    const SegmentBufferGenerator* buffer(int channel) const {
        auto it = buffers_.find(channel);
        return it == buffers_.end() ? nullptr : it->second.get();
    }

    size_t size() const { return buffers_.size(); }

    std::vector<int> channels() const {
        std::vector<int> result;
        for (auto& [ch, buffer] : buffers_)
            result.push_back(ch);
        return result;
    }

private:
    std::map<int, std::unique_ptr<SegmentBufferGenerator>> buffers_;
};
