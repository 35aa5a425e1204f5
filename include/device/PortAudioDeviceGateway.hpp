#pragma once
#include "IDeviceGateway.hpp"
#include "audio/PortAudioStream.hpp"
#include "session/SessionConfig.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// PortAudio-backed device gateway. Supports ALSA/PulseAudio/JACK (Linux),
// Core Audio (macOS), WASAPI/ASIO (Windows). Link with -lportaudio.
//
// "Permission" maps onto device presence: a configured device that cannot
// be found is NotGranted, a stream that dies under us is treated as the
// permission being pulled.
class PortAudioDeviceGateway : public IDeviceGateway {
public:
    struct DeviceInfo {
        int         id;
        std::string name;
        std::string hostApi;
        int         maxInputChannels;
        int         maxOutputChannels;
        double      defaultSampleRate;
    };

    PortAudioDeviceGateway(const DeviceConfig& device, const AudioConfig& audio);
    ~PortAudioDeviceGateway() override;

    DeviceState currentState() const override;
    void tryReload() override;
    std::future<std::shared_ptr<IInputStream>> requestAccess() override;
    void stop() override;

    std::string id() const override;
    std::string label() const override;

    void poll() override;

    // Input-capable devices, for --list-devices
    std::vector<DeviceInfo> listDevices() const;

private:
    std::shared_ptr<IInputStream> openStream();

    // -1 when nothing matches the configuration
    int resolveDevice() const;

    void setState(DeviceState s);

    DeviceConfig device_;
    AudioConfig  audio_;

    std::shared_ptr<PortAudioLibrary> library_;
    std::shared_ptr<PortAudioStream>  stream_;

    DeviceState state_;
    int         deviceIndex_ = -1;
    std::string deviceName_;
    bool        lossReported_ = false;

    mutable std::mutex mtx_;
};
