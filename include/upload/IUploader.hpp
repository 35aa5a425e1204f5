#pragma once
#include "UploadTypes.hpp"
#include <cstddef>

// Uploader handle shared by all channels of a session.
// Implementations: HttpUploader, test doubles.
class IUploader {
public:
    virtual ~IUploader() = default;

    virtual void enqueue(EncodedSegment segment) = 0;

    virtual void setChannels(int count) = 0;
    virtual int  channelCount() const = 0;

    // Goes idle: pending retries are cut short. The next enqueue()
    // picks up again.
    virtual void stopUploader() = 0;

    // Delivers completions, warnings and failures gathered since the last
    // call. Sinks are only ever invoked from inside this call.
    virtual void dispatchEvents() = 0;

    virtual size_t pendingCount() const = 0;
};
