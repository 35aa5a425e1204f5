#pragma once
#include "session/CaptureError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct DeviceConfig {
    int         deviceId         = -1;    // -1 = match by name, else default input
    std::string deviceName;                // case-insensitive substring match
    int         inputChannels    = 0;     // 0 = everything the device offers
    int         outputChannels   = 0;     // 0 = capture only, no monitoring
    double      suggestedLatency = 0.020;
};

struct AudioConfig {
    double sampleRate          = 48000;
    int    processorBufferSize = 4096;   // frames per drain, per channel
    double ringSeconds         = 2.0;    // per-channel ring capacity
};

struct UploadConfig {
    std::string endpoint        = "http://localhost:8080";
    std::string pathPrefix      = "/sessions/default";
    std::string authToken;
    int         retryIntervalMs = 3000;
    int         maxAttempts     = 5;
    int         timeoutMs       = 5000;
};

struct SessionConfig {
    DeviceConfig device;
    AudioConfig  audio;
    UploadConfig upload;

    double segmentSeconds    = 2.0;
    int    processIntervalMs = 20;

    // Channels the CLI arms after capture starts; empty = all of them
    std::vector<int> recordChannels;

    static SessionConfig fromJson(const nlohmann::json& j) {
        SessionConfig c;

        if (j.contains("device")) {
            const auto& d = j["device"];
            c.device.deviceId         = d.value("id", c.device.deviceId);
            c.device.deviceName       = d.value("name", c.device.deviceName);
            c.device.inputChannels    = d.value("input_channels", c.device.inputChannels);
            c.device.outputChannels   = d.value("output_channels", c.device.outputChannels);
            c.device.suggestedLatency = d.value("latency", c.device.suggestedLatency);
        }

        if (j.contains("audio")) {
            const auto& a = j["audio"];
            c.audio.sampleRate          = a.value("sample_rate", c.audio.sampleRate);
            c.audio.processorBufferSize = a.value("buffer_size", c.audio.processorBufferSize);
            c.audio.ringSeconds         = a.value("ring_seconds", c.audio.ringSeconds);
        }

        if (j.contains("upload")) {
            const auto& u = j["upload"];
            c.upload.endpoint        = u.value("endpoint", c.upload.endpoint);
            c.upload.pathPrefix      = u.value("path_prefix", c.upload.pathPrefix);
            c.upload.authToken       = u.value("token", c.upload.authToken);
            c.upload.retryIntervalMs = u.value("retry_interval_ms", c.upload.retryIntervalMs);
            c.upload.maxAttempts     = u.value("max_attempts", c.upload.maxAttempts);
            c.upload.timeoutMs       = u.value("timeout_ms", c.upload.timeoutMs);
        }

        c.segmentSeconds    = j.value("segment_seconds", c.segmentSeconds);
        c.processIntervalMs = j.value("process_interval_ms", c.processIntervalMs);

        if (j.contains("record_channels"))
            c.recordChannels = j["record_channels"].get<std::vector<int>>();

        c.validate();
        return c;
    }

    void validate() const {
        if (!(audio.sampleRate > 0))
            throw CaptureError("audio.sample_rate must be positive");
        if (audio.processorBufferSize <= 0)
            throw CaptureError("audio.buffer_size must be positive");
        if (!(audio.ringSeconds > 0))
            throw CaptureError("audio.ring_seconds must be positive");
        if (!(segmentSeconds > 0))
            throw CaptureError("segment_seconds must be positive");
        if (upload.maxAttempts < 1)
            throw CaptureError("upload.max_attempts must be at least 1");
        if (upload.retryIntervalMs < 0)
            throw CaptureError("upload.retry_interval_ms must not be negative");
        for (int ch : recordChannels)
            if (ch < 0)
                throw CaptureError("record_channels contains a negative index");
    }
};
