#pragma once
#include <string>

enum class DeviceError {
    NoError,      // stream open or openable
    Stopped,      // never opened, or stopped by us
    NotGranted,   // device missing or access refused
    OtherError    // anything else; diagnostic carries the backend's text
};

inline const char* toString(DeviceError e) {
    switch (e) {
        case DeviceError::NoError:    return "no_error";
        case DeviceError::Stopped:    return "stopped";
        case DeviceError::NotGranted: return "not_granted";
        case DeviceError::OtherError: return "other_error";
    }
    return "unknown";
}

struct DeviceState {
    DeviceError error = DeviceError::Stopped;
    std::string diagnostic;

    static DeviceState ok()         { return {DeviceError::NoError, ""}; }
    static DeviceState stopped()    { return {DeviceError::Stopped, ""}; }
    static DeviceState notGranted(const std::string& why = "") {
        return {DeviceError::NotGranted, why};
    }
    static DeviceState other(const std::string& why) {
        return {DeviceError::OtherError, why};
    }

    // Conditions a reload may clear
    bool recoverable() const {
        return error == DeviceError::Stopped || error == DeviceError::NotGranted;
    }

    std::string describe() const {
        if (diagnostic.empty()) return toString(error);
        return std::string(toString(error)) + ": " + diagnostic;
    }
};
