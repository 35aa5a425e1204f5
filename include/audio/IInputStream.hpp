#pragma once
#include <functional>
#include <string>

// An opened device stream, handed out by the device gateway and driven by
// the audio engine. Implementations: PortAudioStream, test doubles.
class IInputStream {
public:
    virtual ~IInputStream() = default;

    // Called on the real-time thread. Both sides are non-interleaved:
    // input[ch][frame], output[ch][frame]. output may be null when the
    // stream has no output channels.
    using ProcessCallback = std::function<void(const float* const* input,
                                               int inputChannels,
                                               float* const* output,
                                               int outputChannels,
                                               int frameCount)>;

    // Must be installed before start()
    virtual void setCallback(ProcessCallback cb) = 0;

    // Lifecycle
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    // Negotiated format
    virtual int    inputChannelCount() const = 0;
    virtual int    outputChannelCount() const = 0;
    virtual double sampleRate() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
