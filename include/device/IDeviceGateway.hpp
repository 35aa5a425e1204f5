#pragma once
#include "DeviceState.hpp"
#include "audio/IInputStream.hpp"
#include <functional>
#include <future>
#include <memory>
#include <string>

// Abstract interface to the capture device: acquisition, permission state
// and the stream handle. Implementations: PortAudioDeviceGateway, test doubles.
class IDeviceGateway {
public:
    virtual ~IDeviceGateway() = default;

    virtual DeviceState currentState() const = 0;

    // Re-acquire the device list. The result shows up on the next
    // currentState(), not here.
    virtual void tryReload() = 0;

    // Opens the device. Resolves to null when no stream can be had;
    // currentState() then says why.
    virtual std::future<std::shared_ptr<IInputStream>> requestAccess() = 0;

    // Stops and releases the stream. Idempotent.
    virtual void stop() = 0;

    virtual std::string id() const = 0;
    virtual std::string label() const = 0;

    // Called periodically from the control thread; detects device loss
    // and fires onPermissionsRemoved from there.
    virtual void poll() = 0;

    // Callbacks
    std::function<void()> onPermissionsRemoved;
};
