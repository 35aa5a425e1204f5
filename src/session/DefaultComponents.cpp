#include "session/CaptureSession.hpp"
#include "device/PortAudioDeviceGateway.hpp"
#include "encode/WavSegmentEncoder.hpp"
#include "upload/HttpUploader.hpp"

SessionComponents makeDefaultComponents(const SessionConfig& config) {
    SessionComponents c;

    c.device = std::make_unique<PortAudioDeviceGateway>(config.device, config.audio);

    UploadConfig upload = config.upload;
    c.makeUploader = [upload](ErrorSink& errors, UploadCompletionSink& completion)
        -> std::unique_ptr<IUploader> {
        return std::make_unique<HttpUploader>(completion, errors, upload);
    };

    c.makeEncoder = [](IUploader& uploader, ErrorSink& errors, double sampleRate)
        -> std::unique_ptr<IEncoder> {
        return std::make_unique<WavSegmentEncoder>(uploader, errors, sampleRate);
    };

    return c;
}
