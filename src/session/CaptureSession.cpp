#include "session/CaptureSession.hpp"
#include "buffer/SegmentBufferGenerator.hpp"
#include <spdlog/spdlog.h>

const char* toString(CaptureSession::Phase p) {
    switch (p) {
        case CaptureSession::Phase::Idle:             return "idle";
        case CaptureSession::Phase::Initializing:     return "initializing";
        case CaptureSession::Phase::AwaitingDevice:   return "awaiting_device";
        case CaptureSession::Phase::AwaitingStream:   return "awaiting_stream";
        case CaptureSession::Phase::AwaitingChannels: return "awaiting_channels";
        case CaptureSession::Phase::Capturing:        return "capturing";
        case CaptureSession::Phase::Failed:           return "failed";
    }
    return "unknown";
}

const char* toString(CaptureSession::CodecState s) {
    switch (s) {
        case CaptureSession::CodecState::Absent: return "absent";
        case CaptureSession::CodecState::Idle:   return "idle";
        case CaptureSession::CodecState::Active: return "active";
    }
    return "unknown";
}

CaptureSession::CaptureSession(SessionContext& context,
                               SessionComponents components,
                               const SessionConfig& config)
    : context_(context)
    , config_(config)
    , device_(std::move(components.device))
    , audio_(buffers_, *this, config.audio)
    , makeEncoder_(std::move(components.makeEncoder))
{
    if (!device_)
        throw CaptureError("CaptureSession needs a device gateway");
    if (!components.makeUploader || !makeEncoder_)
        throw CaptureError("CaptureSession needs encoder and uploader factories");

    uploader_ = components.makeUploader(*this, context_);
    if (!uploader_)
        throw CaptureError("Uploader factory returned nothing");

    device_->onPermissionsRemoved = [this] {
        spdlog::warn("Input device permission removed, stopping capture");
        stopCapture();
        context_.onDevicePermissionRemoved();
    };
}

CaptureSession::~CaptureSession() {
    device_->onPermissionsRemoved = nullptr;
    audio_.stopAll();
    device_->stop();
}

void CaptureSession::setPhase(Phase p) {
    if (p == phase_) return;
    spdlog::debug("Session {} -> {}", toString(phase_), toString(p));
    phase_ = p;
}

void CaptureSession::init() {
    audio_.resume();

    if (!encoder_) {
        encoder_ = makeEncoder_(*uploader_, *this, audio_.sampleRate());
        if (!encoder_)
            throw CaptureError("Encoder factory returned nothing");
        codecState_ = CodecState::Idle;
        spdlog::info("Session initialised at {} Hz", audio_.sampleRate());
    }
}

int CaptureSession::startCapture() {
    const bool wasCapturing = phase_ == Phase::Capturing;
    const Phase fallback = wasCapturing ? Phase::Capturing : Phase::Idle;

    setPhase(Phase::Initializing);
    init();

    setPhase(Phase::AwaitingDevice);
    DeviceState state = device_->currentState();
    switch (state.error) {
        case DeviceError::Stopped:
        case DeviceError::NotGranted:
            spdlog::info("Device {}, reloading", toString(state.error));
            device_->tryReload();
            break;

        case DeviceError::NoError:
            break;

        default:
            onWarning(state.diagnostic.empty() ? state.describe() : state.diagnostic);
            setPhase(fallback);
            return 0;
    }

    setPhase(Phase::AwaitingStream);
    std::shared_ptr<IInputStream> stream = device_->requestAccess().get();
    if (!stream) {
        onWarning("No stream available");
        setPhase(fallback);
        return 0;
    }

    setPhase(Phase::AwaitingChannels);
    int channels = audio_.handleInputStream(std::move(stream)).get();
    if (channels <= 0) {
        onWarning("No channels available");
        setPhase(fallback);
        return 0;
    }

    createBuffers(channels);
    setPhase(Phase::Capturing);

    spdlog::info("Capturing {} channels from '{}'{}", channels, device_->label(),
                 wasCapturing ? " (re-negotiated)" : "");
    return channels;
}

void CaptureSession::createBuffers(int channels) {
    for (int i = 0; i < channels; i++) {
        if (buffers_.bufferExists(i) || !encoder_) continue;

        buffers_.setBuffer(
            std::make_unique<SegmentBufferGenerator>(
                *encoder_,
                *this,
                i,
                audio_.sampleRate(),
                audio_.processorBufferSize(),
                config_.segmentSeconds),
            i);
    }

    if (encoder_) encoder_->setChannels(channels);
    uploader_->setChannels(channels);
}

void CaptureSession::stopCapture() {
    audio_.stopAll();
    buffers_.stopAll();
    device_->stop();

    if (phase_ != Phase::Failed)
        setPhase(Phase::Idle);
}

void CaptureSession::muteOutputChannelForInputChannel(int input, int output) {
    audio_.muteOutputForInput(input, output);
}

void CaptureSession::unmuteOutputChannelForInputChannel(int input, int output) {
    audio_.unmuteOutputForInput(input, output);
}

void CaptureSession::recordInputChannel(int input) {
    try {
        buffers_.initBuffer(input);
        audio_.recordChannel(input);
    } catch (const std::exception& e) {
        stopRecordInputChannel(input);
        onWarning(e.what());
        return;
    }

    if (codecState_ == CodecState::Idle)
        codecState_ = CodecState::Active;

    context_.onChannelStateChange(input, ChannelState::Recording);
}

void CaptureSession::stopRecordInputChannel(int input) {
    const bool wasRecording = audio_.isRecording(input);

    buffers_.stopBuffer(input);
    audio_.stopRecordChannel(input);

    if (wasRecording)
        context_.onChannelStateChange(input, ChannelState::Stopped);

    releaseCodecIfIdle();
}

void CaptureSession::releaseCodecIfIdle() {
    if (audio_.recordingChannelCount() != 0 || codecState_ != CodecState::Active)
        return;

    spdlog::info("No channels recording, stopping encoder and uploader");
    encoder_->stopEncoder();
    uploader_->stopUploader();
    codecState_ = CodecState::Idle;
}

DeviceInformation CaptureSession::inputDeviceInformation() const {
    return {
        device_->id(),
        device_->label(),
        audio_.inputChannelCount(),
        audio_.outputChannelCount()
    };
}

void CaptureSession::process() {
    device_->poll();
    audio_.process();
    uploader_->dispatchEvents();
}

void CaptureSession::onWarning(const std::string& message) {
    spdlog::warn("{}", message);
    context_.onWarning(message);
}

void CaptureSession::onFailure(const std::exception& error) {
    // Flushing the other buffers during teardown can fail the same way
    if (failing_) {
        spdlog::error("Further failure during teardown: {}", error.what());
        return;
    }
    failing_ = true;

    spdlog::error("Session failure: {}", error.what());
    context_.onFailure(error);

    setPhase(Phase::Failed);
    audio_.stopAll();
    buffers_.stopAll();
    releaseCodecIfIdle();

    failing_ = false;
}
