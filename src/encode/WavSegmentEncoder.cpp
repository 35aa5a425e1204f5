#include "encode/WavSegmentEncoder.hpp"
#include "upload/IUploader.hpp"
#include "session/CaptureError.hpp"
#include "session/SessionContext.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace {

void putFourCC(std::vector<uint8_t>& out, const char* fourcc) {
    out.insert(out.end(), fourcc, fourcc + 4);
}

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

} // namespace

WavSegmentEncoder::WavSegmentEncoder(IUploader& uploader, ErrorSink& sink,
                                     double sampleRate)
    : uploader_(uploader)
    , sink_(sink)
    , sampleRate_(sampleRate)
{
    spdlog::info("WAV encoder ready ({} Hz, {}-bit mono segments)",
                 sampleRate_, kBitsPerSample);
}

std::vector<uint8_t> WavSegmentEncoder::encodeWav(const std::vector<float>& samples,
                                                  int sampleRate) {
    const uint16_t channels   = 1;
    const uint16_t blockAlign = channels * (kBitsPerSample / 8);
    const uint32_t dataSize   = static_cast<uint32_t>(samples.size() * blockAlign);

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + dataSize);

    putFourCC(out, "RIFF");
    putU32(out, 36 + dataSize);
    putFourCC(out, "WAVE");

    putFourCC(out, "fmt ");
    putU32(out, 16);                       // PCM fmt chunk size
    putU16(out, 1);                        // WAVE_FORMAT_PCM
    putU16(out, channels);
    putU32(out, static_cast<uint32_t>(sampleRate));
    putU32(out, static_cast<uint32_t>(sampleRate) * blockAlign);
    putU16(out, blockAlign);
    putU16(out, kBitsPerSample);

    putFourCC(out, "data");
    putU32(out, dataSize);

    for (float s : samples) {
        float c = std::clamp(s, -1.0f, 1.0f);
        auto v = static_cast<int16_t>(std::lround(c * 32767.0f));
        putU16(out, static_cast<uint16_t>(v));
    }
    return out;
}

void WavSegmentEncoder::encode(const Segment& segment) {
    if (std::abs(segment.sampleRate - sampleRate_) > 0.5) {
        sink_.onFailure(CaptureError(
            "Encoder runs at " + std::to_string(sampleRate_) + " Hz, segment from channel "
            + std::to_string(segment.channel) + " is "
            + std::to_string(segment.sampleRate) + " Hz"));
        return;
    }

    if (segment.channel < 0 || segment.channel >= channels_) {
        sink_.onWarning("Encoder dropped segment for channel "
                        + std::to_string(segment.channel) + " (configured for "
                        + std::to_string(channels_) + " channels)");
        return;
    }

    if (!active_) {
        spdlog::debug("Encoder resuming for channel {}", segment.channel);
        active_ = true;
    }

    EncodedSegment out;
    out.channel     = segment.channel;
    out.take        = segment.take;
    out.sequence    = segment.sequence;
    out.final       = segment.final;
    out.contentType = "audio/wav";
    out.bytes       = encodeWav(segment.samples, static_cast<int>(std::lround(sampleRate_)));

    segmentsEncoded_++;
    bytesEncoded_ += out.bytes.size();

    spdlog::debug("Encoded ch{} take {} seg {} ({} bytes{})",
                  out.channel, out.take, out.sequence, out.bytes.size(),
                  out.final ? ", final" : "");

    uploader_.enqueue(std::move(out));
}

void WavSegmentEncoder::setChannels(int count) {
    if (count == channels_) return;
    spdlog::info("Encoder channels {} -> {}", channels_, count);
    channels_ = std::max(count, 0);
}

void WavSegmentEncoder::stopEncoder() {
    if (!active_) return;
    active_ = false;
    spdlog::info("Encoder idle after {} segments ({} bytes)",
                 segmentsEncoded_, bytesEncoded_);
}
