#pragma once
#include "IInputStream.hpp"
#include "RingBuffer.hpp"
#include "RoutingMatrix.hpp"
#include "session/SessionConfig.hpp"
#include <cstddef>
#include <future>
#include <memory>
#include <set>
#include <vector>

class BufferRegistry;
class WarningSink;

// Turns a device stream into per-channel sample flow.
//
//   stream callback (real-time thread)
//       -> per-channel RingBuffer, plus routed monitor outputs
//           -> process() on the control thread
//               -> BufferRegistry::pushSamples() for recording channels
//
// Owns the monitor routing matrix and the set of recording channels.
// Everything except the callback runs on the session's control thread.
class AudioEngine {
public:
    AudioEngine(BufferRegistry& buffers, WarningSink& warnings,
                const AudioConfig& config);
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    double sampleRate() const { return config_.sampleRate; }
    int    processorBufferSize() const { return config_.processorBufferSize; }

    // Leaves the suspended state. Idempotent.
    void resume();
    bool isSuspended() const { return suspended_; }

    // Attaches and starts the stream. Resolves to the number of input
    // channels, or 0 if the stream cannot be used.
    std::future<int> handleInputStream(std::shared_ptr<IInputStream> stream);

    // Stops and releases the stream. Recording flags are left alone:
    // only stopRecordChannel() clears them.
    void stopAll();

    // Monitor routing
    void muteOutputForInput(int input, int output);
    void unmuteOutputForInput(int input, int output);
    const RoutingMatrix& routing() const { return routing_; }

    // Recording flags. recordChannel throws CaptureError for a channel the
    // current stream does not provide.
    void recordChannel(int channel);
    void stopRecordChannel(int channel);
    bool isRecording(int channel) const { return recording_.count(channel) > 0; }
    int  recordingChannelCount() const { return static_cast<int>(recording_.size()); }
    const std::set<int>& recordingChannels() const { return recording_; }

    // Last negotiated stream shape (kept after stopAll)
    int inputChannelCount() const { return inputChannels_; }
    int outputChannelCount() const { return outputChannels_; }
    bool hasStream() const { return stream_ != nullptr; }

    // Drain the rings. Returns the number of frames handed to recording buffers.
    size_t process();

private:
    // Real-time thread
    void render(const float* const* input, int inputChannels,
                float* const* output, int outputChannels, int frameCount);

    void releaseStream();

    BufferRegistry& buffers_;
    WarningSink&    warnings_;
    AudioConfig     config_;

    std::shared_ptr<IInputStream> stream_;
    std::vector<std::unique_ptr<RingBuffer>> rings_;
    std::vector<float> scratch_;
    unsigned streamGeneration_ = 0;

    RoutingMatrix routing_;
    std::set<int> recording_;

    int  inputChannels_  = 0;
    int  outputChannels_ = 0;
    bool suspended_      = true;
};
