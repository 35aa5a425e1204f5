#include "device/PortAudioDeviceGateway.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

PortAudioDeviceGateway::PortAudioDeviceGateway(const DeviceConfig& device,
                                               const AudioConfig& audio)
    : device_(device)
    , audio_(audio)
    , library_(std::make_shared<PortAudioLibrary>())
{
    if (!library_->ok())
        state_ = DeviceState::other(library_->error());
}

PortAudioDeviceGateway::~PortAudioDeviceGateway() {
    stop();
}

DeviceState PortAudioDeviceGateway::currentState() const {
    std::lock_guard lock(mtx_);
    return state_;
}

void PortAudioDeviceGateway::setState(DeviceState s) {
    if (s.error != state_.error)
        spdlog::debug("Device state {} -> {}", toString(state_.error), s.describe());
    state_ = std::move(s);
}

void PortAudioDeviceGateway::tryReload() {
    std::lock_guard lock(mtx_);
    spdlog::info("Reloading audio device list");

    if (stream_) {
        stream_->stop();
        stream_.reset();
    }

    // Drop our reference first so PortAudio can re-enumerate
    library_.reset();
    library_ = std::make_shared<PortAudioLibrary>();
    lossReported_ = false;

    if (!library_->ok()) {
        setState(DeviceState::other(library_->error()));
        return;
    }

    int index = resolveDevice();
    if (index < 0) {
        setState(DeviceState::notGranted("configured input device not found"));
        return;
    }
    setState(DeviceState::ok());
}

std::future<std::shared_ptr<IInputStream>> PortAudioDeviceGateway::requestAccess() {
    return std::async(std::launch::async, [this] { return openStream(); });
}

std::shared_ptr<IInputStream> PortAudioDeviceGateway::openStream() {
    std::lock_guard lock(mtx_);

    if (stream_ && stream_->isRunning() && !stream_->deviceLost())
        return stream_;

    if (!library_->ok()) {
        setState(DeviceState::other(library_->error()));
        return nullptr;
    }

#ifdef HAS_PORTAUDIO
    int index = resolveDevice();
    if (index < 0) {
        spdlog::error("No matching audio input device (id={}, name='{}')",
                      device_.deviceId, device_.deviceName);
        setState(DeviceState::notGranted("no matching input device"));
        return nullptr;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels <= 0) {
        setState(DeviceState::notGranted("device has no inputs"));
        return nullptr;
    }

    int inputs = info->maxInputChannels;
    if (device_.inputChannels > 0) {
        if (device_.inputChannels > inputs)
            spdlog::warn("Device '{}' has {} inputs, requested {} — clamping",
                         info->name, inputs, device_.inputChannels);
        inputs = std::min(inputs, device_.inputChannels);
    }

    auto stream = std::make_shared<PortAudioStream>(library_, info->name);
    if (!stream->open(index, inputs, device_.outputChannels, audio_.sampleRate,
                      audio_.processorBufferSize, device_.suggestedLatency)) {
        setState(DeviceState::other(stream->lastError()));
        return nullptr;
    }

    stream_       = stream;
    deviceIndex_  = index;
    deviceName_   = info->name;
    lossReported_ = false;
    setState(DeviceState::ok());
    return stream_;
#else
    setState(DeviceState::other("built without PortAudio"));
    return nullptr;
#endif
}

void PortAudioDeviceGateway::stop() {
    std::lock_guard lock(mtx_);
    if (stream_) {
        stream_->stop();
        stream_.reset();
        spdlog::info("Released audio device '{}'", deviceName_);
    }
    if (state_.error == DeviceError::NoError)
        setState(DeviceState::stopped());
}

std::string PortAudioDeviceGateway::id() const {
    std::lock_guard lock(mtx_);
    return deviceIndex_ >= 0 ? "portaudio:" + std::to_string(deviceIndex_) : "";
}

std::string PortAudioDeviceGateway::label() const {
    std::lock_guard lock(mtx_);
    return deviceName_;
}

void PortAudioDeviceGateway::poll() {
    {
        std::lock_guard lock(mtx_);
        if (!stream_ || lossReported_ || !stream_->deviceLost())
            return;
        lossReported_ = true;
        spdlog::error("Audio device '{}' stopped delivering audio", deviceName_);
        setState(DeviceState::notGranted("device disappeared"));
    }

    // Outside the lock: the handler usually calls stop()
    if (onPermissionsRemoved) onPermissionsRemoved();
}

int PortAudioDeviceGateway::resolveDevice() const {
#ifdef HAS_PORTAUDIO
    if (!library_ || !library_->ok()) return -1;

    int count = Pa_GetDeviceCount();
    if (count <= 0) return -1;

    if (device_.deviceId >= 0) {
        if (device_.deviceId >= count) return -1;
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device_.deviceId);
        return (info && info->maxInputChannels > 0) ? device_.deviceId : -1;
    }

    if (!device_.deviceName.empty()) {
        std::string wanted = lower(device_.deviceName);
        for (int i = 0; i < count; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->maxInputChannels > 0
                && lower(info->name).find(wanted) != std::string::npos)
                return i;
        }
        return -1;
    }

    PaDeviceIndex def = Pa_GetDefaultInputDevice();
    return def == paNoDevice ? -1 : def;
#else
    return -1;
#endif
}

std::vector<PortAudioDeviceGateway::DeviceInfo> PortAudioDeviceGateway::listDevices() const {
    std::vector<DeviceInfo> result;
#ifdef HAS_PORTAUDIO
    std::lock_guard lock(mtx_);
    if (!library_ || !library_->ok()) return result;

    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
            result.push_back({
                i,
                info->name,
                api ? api->name : "",
                info->maxInputChannels,
                info->maxOutputChannels,
                info->defaultSampleRate
            });
        }
    }
#endif
    return result;
}
