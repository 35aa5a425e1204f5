#include "audio/PortAudioStream.hpp"
#include <spdlog/spdlog.h>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

PortAudioLibrary::PortAudioLibrary() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        initialized_ = true;
    } else {
        error_ = Pa_GetErrorText(err);
        spdlog::error("PortAudio init failed: {}", error_);
    }
#else
    error_ = "built without PortAudio";
#endif
}

PortAudioLibrary::~PortAudioLibrary() {
#ifdef HAS_PORTAUDIO
    if (initialized_)
        Pa_Terminate();
#endif
}

PortAudioStream::PortAudioStream(std::shared_ptr<PortAudioLibrary> library,
                                 std::string deviceName)
    : library_(std::move(library))
    , deviceName_(std::move(deviceName))
{
}

PortAudioStream::~PortAudioStream() {
    stop();
#ifdef HAS_PORTAUDIO
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
#endif
}

bool PortAudioStream::open(int deviceIndex, int inputChannels, int outputChannels,
                           double sampleRate, int framesPerBuffer,
                           double suggestedLatency) {
#ifdef HAS_PORTAUDIO
    if (!library_ || !library_->ok()) {
        lastError_ = library_ ? library_->error() : "PortAudio not initialised";
        return false;
    }

    PaStreamParameters inputParams{};
    inputParams.device = deviceIndex;
    inputParams.channelCount = inputChannels;
    inputParams.sampleFormat = paFloat32 | paNonInterleaved;
    inputParams.suggestedLatency = suggestedLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaStreamParameters outputParams{};
    if (outputChannels > 0) {
        outputParams.device = Pa_GetDefaultOutputDevice();
        outputParams.channelCount = outputChannels;
        outputParams.sampleFormat = paFloat32 | paNonInterleaved;
        outputParams.suggestedLatency = suggestedLatency;
        outputParams.hostApiSpecificStreamInfo = nullptr;
        if (outputParams.device == paNoDevice) {
            spdlog::warn("No default output device, monitoring disabled");
            outputChannels = 0;
        }
    }

    PaError err = Pa_OpenStream(
        &stream_,
        &inputParams,
        outputChannels > 0 ? &outputParams : nullptr,
        sampleRate,
        static_cast<unsigned long>(framesPerBuffer),
        paClipOff,
        &PortAudioStream::paCallback,
        this
    );

    if (err != paNoError) {
        lastError_ = Pa_GetErrorText(err);
        spdlog::error("Pa_OpenStream failed: {}", lastError_);
        stream_ = nullptr;
        return false;
    }

    inputChannels_  = inputChannels;
    outputChannels_ = outputChannels;
    sampleRate_     = sampleRate;

    spdlog::info("Opened '{}': {} in, {} out, {}Hz, {} frames/buffer",
                 deviceName_, inputChannels_, outputChannels_,
                 sampleRate_, framesPerBuffer);
    return true;
#else
    (void)deviceIndex; (void)inputChannels; (void)outputChannels;
    (void)sampleRate; (void)framesPerBuffer; (void)suggestedLatency;
    lastError_ = "built without PortAudio";
    return false;
#endif
}

bool PortAudioStream::start() {
#ifdef HAS_PORTAUDIO
    if (!stream_) return false;
    if (running_) return true;

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        spdlog::error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
        return false;
    }
    running_ = true;
    spdlog::info("Audio stream started on '{}'", deviceName_);
    return true;
#else
    return false;
#endif
}

void PortAudioStream::stop() {
#ifdef HAS_PORTAUDIO
    if (!running_) return;
    running_ = false;
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError)
            spdlog::warn("Pa_StopStream: {}", Pa_GetErrorText(err));
    }
    spdlog::info("Audio stream stopped on '{}'", deviceName_);
#endif
}

bool PortAudioStream::deviceLost() const {
#ifdef HAS_PORTAUDIO
    if (!running_ || !stream_) return false;
    return Pa_IsStreamActive(stream_) != 1;
#else
    return false;
#endif
}

int PortAudioStream::paCallback(
    const void* input, void* output,
    unsigned long frameCount,
    const void* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioStream*>(userData);
    if (self->callback_) {
        // paNonInterleaved: both buffers are arrays of per-channel pointers
        self->callback_(static_cast<const float* const*>(input),
                        self->inputChannels_,
                        static_cast<float* const*>(output),
                        self->outputChannels_,
                        static_cast<int>(frameCount));
    }
    return 0;  // paContinue
}
