#pragma once
#include "IEncoder.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

class IUploader;
class ErrorSink;

// Encodes each segment as a standalone mono RIFF/WAVE file (16-bit PCM,
// samples clamped to [-1, 1]) and queues it for upload.
class WavSegmentEncoder : public IEncoder {
public:
    static constexpr int kBitsPerSample = 16;
    static constexpr size_t kHeaderSize = 44;

    WavSegmentEncoder(IUploader& uploader, ErrorSink& sink, double sampleRate);

    void encode(const Segment& segment) override;

    void setChannels(int count) override;
    int  channelCount() const override { return channels_; }

    void stopEncoder() override;
    bool isActive() const override { return active_; }

    // Stats
    int    segmentsEncoded() const { return segmentsEncoded_; }
    size_t bytesEncoded() const { return bytesEncoded_; }

    // Exposed for tests
    static std::vector<uint8_t> encodeWav(const std::vector<float>& samples,
                                          int sampleRate);

private:
    IUploader& uploader_;
    ErrorSink& sink_;
    double     sampleRate_;
    int        channels_ = 0;
    bool       active_   = true;

    int    segmentsEncoded_ = 0;
    size_t bytesEncoded_    = 0;
};
