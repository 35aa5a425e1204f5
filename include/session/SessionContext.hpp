#pragma once
#include "upload/UploadTypes.hpp"
#include <exception>
#include <string>

// Narrow capability interfaces. Each collaborator only sees the sink it
// reports to, so tests can stand one in without the whole context.

class WarningSink {
public:
    virtual ~WarningSink() = default;
    virtual void onWarning(const std::string& message) = 0;
};

class FailureSink {
public:
    virtual ~FailureSink() = default;
    virtual void onFailure(const std::exception& error) = 0;
};

// What buffer generators, the encoder and the uploader report into.
class ErrorSink : public WarningSink, public FailureSink {};

class UploadCompletionSink {
public:
    virtual ~UploadCompletionSink() = default;
    virtual void onUploaded(const UploadedSegment& segment) = 0;
};

enum class ChannelState { Recording, Stopped };

inline const char* toString(ChannelState s) {
    return s == ChannelState::Recording ? "recording" : "stopped";
}

class ChannelStateListener {
public:
    virtual ~ChannelStateListener() = default;
    virtual void onChannelStateChange(int channel, ChannelState state) = 0;
};

// Implemented by whoever owns a CaptureSession (the CLI, a host app, tests).
class SessionContext : public ErrorSink,
                       public UploadCompletionSink,
                       public ChannelStateListener {
public:
    virtual void onDevicePermissionRemoved() = 0;
};
