#pragma once
#include "buffer/Segment.hpp"

// Encoder handle shared by all channels of a session.
// Implementations: WavSegmentEncoder, test doubles.
class IEncoder {
public:
    virtual ~IEncoder() = default;

    // Encodes one segment and queues the result on the uploader.
    // May throw on an unrecoverable encoder fault.
    virtual void encode(const Segment& segment) = 0;

    // Total channel count of the session; segments outside it are refused
    virtual void setChannels(int count) = 0;
    virtual int  channelCount() const = 0;

    // Goes idle. The next encode() picks up again.
    virtual void stopEncoder() = 0;
    virtual bool isActive() const = 0;
};
