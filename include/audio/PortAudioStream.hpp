#pragma once
#include "IInputStream.hpp"
#include <atomic>
#include <memory>
#include <string>

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

// Keeps PortAudio initialised for as long as anyone holds a reference.
// Pa_Initialize/Pa_Terminate are reference counted by PortAudio itself;
// the device list is only re-enumerated once the last holder lets go.
class PortAudioLibrary {
public:
    PortAudioLibrary();
    ~PortAudioLibrary();

    PortAudioLibrary(const PortAudioLibrary&) = delete;
    PortAudioLibrary& operator=(const PortAudioLibrary&) = delete;

    bool ok() const { return initialized_; }
    const std::string& error() const { return error_; }

private:
    bool        initialized_ = false;
    std::string error_;
};

// An opened PortAudio stream (input, or duplex when monitor outputs are
// configured). Non-interleaved float32 on both sides.
// Created by PortAudioDeviceGateway, driven by AudioEngine.
class PortAudioStream : public IInputStream {
public:
    PortAudioStream(std::shared_ptr<PortAudioLibrary> library,
                    std::string deviceName);
    ~PortAudioStream() override;

    // Opens the device. outputChannels = 0 opens capture only.
    bool open(int deviceIndex, int inputChannels, int outputChannels,
              double sampleRate, int framesPerBuffer, double suggestedLatency);
    const std::string& lastError() const { return lastError_; }

    void setCallback(ProcessCallback cb) override { callback_ = std::move(cb); }

    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_; }

    int    inputChannelCount() const override { return inputChannels_; }
    int    outputChannelCount() const override { return outputChannels_; }
    double sampleRate() const override { return sampleRate_; }

    std::string backendName() const override { return "PortAudio"; }
    const std::string& deviceName() const { return deviceName_; }

    // True once the stream stopped without stop() being called,
    // which is how an unplugged device shows up.
    bool deviceLost() const;

private:
    // PortAudio stream callback (static -> forwards to instance)
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const void* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    std::shared_ptr<PortAudioLibrary> library_;
    PaStream*         stream_ = nullptr;
    int               inputChannels_  = 0;
    int               outputChannels_ = 0;
    double            sampleRate_     = 0;
    std::string       deviceName_;
    std::string       lastError_;
    ProcessCallback   callback_;
    std::atomic<bool> running_{false};
};
