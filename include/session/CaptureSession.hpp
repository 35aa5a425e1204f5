#pragma once
#include "SessionConfig.hpp"
#include "SessionContext.hpp"
#include "audio/AudioEngine.hpp"
#include "buffer/BufferRegistry.hpp"
#include "device/IDeviceGateway.hpp"
#include "encode/IEncoder.hpp"
#include "upload/IUploader.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

struct DeviceInformation {
    std::string id;
    std::string label;
    int         inputChannels  = 0;
    int         outputChannels = 0;
};

// Pieces a session is assembled from. The encoder and uploader are built
// through factories because they must be bound to the session itself.
struct SessionComponents {
    std::unique_ptr<IDeviceGateway> device;

    std::function<std::unique_ptr<IUploader>(ErrorSink& errors,
                                             UploadCompletionSink& completion)>
        makeUploader;

    std::function<std::unique_ptr<IEncoder>(IUploader& uploader,
                                            ErrorSink& errors,
                                            double sampleRate)>
        makeEncoder;
};

// PortAudio device, WAV encoder, HTTP uploader
SessionComponents makeDefaultComponents(const SessionConfig& config);

// Coordinates one capture session: device acquisition and recovery,
// lazy per-channel buffers, the shared encoder/uploader pair, and
// containment of per-channel and downstream failures.
//
// Single-threaded: every method, process() included, must be called from
// the same control thread. startCapture() blocks that thread while the
// device and stream are negotiated.
class CaptureSession : public ErrorSink {
public:
    // Encoder/uploader pair. Idle = created but stopped (or never engaged).
    enum class CodecState { Absent, Idle, Active };

    enum class Phase {
        Idle,
        Initializing,
        AwaitingDevice,
        AwaitingStream,
        AwaitingChannels,
        Capturing,
        Failed
    };

    CaptureSession(SessionContext& context,
                   SessionComponents components,
                   const SessionConfig& config);
    ~CaptureSession() override;

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Resumes audio and creates the encoder once. Idempotent.
    void init();

    // Returns the negotiated channel count, or 0 after reporting a warning.
    // May be called again while capturing to pick up more channels.
    int startCapture();

    // Stops audio, all buffers and the device. The encoder and uploader keep
    // running until the last recording channel is stopped.
    void stopCapture();

    void muteOutputChannelForInputChannel(int input, int output);
    void unmuteOutputChannelForInputChannel(int input, int output);

    // A failure here is rolled back for this channel only and reported as
    // a warning.
    void recordInputChannel(int input);
    void stopRecordInputChannel(int input);

    DeviceInformation inputDeviceInformation() const;

    // Pump: device health, ring drain, uploader events
    void process();

    // ErrorSink, used by buffers, encoder and uploader
    void onWarning(const std::string& message) override;
    void onFailure(const std::exception& error) override;

    // Inspection
    Phase      phase() const { return phase_; }
    CodecState codecState() const { return codecState_; }
    int  activeRecordingCount() const { return audio_.recordingChannelCount(); }
    bool isRecording(int input) const { return audio_.isRecording(input); }
    size_t pendingUploads() const { return uploader_->pendingCount(); }

    const AudioEngine&    audio() const { return audio_; }
    const BufferRegistry& buffers() const { return buffers_; }

private:
    void createBuffers(int channels);

    // Enforces: count == 0 with an engaged codec pair stops both, once
    void releaseCodecIfIdle();

    void setPhase(Phase p);

    SessionContext& context_;
    SessionConfig   config_;

    std::unique_ptr<IDeviceGateway> device_;
    BufferRegistry buffers_;
    AudioEngine    audio_;

    // The encoder holds a reference to the uploader; keep this order
    std::unique_ptr<IUploader> uploader_;
    std::unique_ptr<IEncoder>  encoder_;
    std::function<std::unique_ptr<IEncoder>(IUploader&, ErrorSink&, double)> makeEncoder_;

    CodecState codecState_ = CodecState::Absent;
    bool       failing_    = false;   // inside onFailure(); teardown may report again
    Phase      phase_      = Phase::Idle;
};

const char* toString(CaptureSession::Phase p);
const char* toString(CaptureSession::CodecState s);
