#include "session/CaptureSession.hpp"
#include "device/PortAudioDeviceGateway.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_running{true};

static void signalHandler(int /*sig*/) {
    g_running = false;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

// Owning context for the CLI: logs everything and keeps a per-channel
// tally of what the server accepted.
class ConsoleContext : public SessionContext {
public:
    void onWarning(const std::string& message) override {
        warnings_++;
        spdlog::debug("context warning: {}", message);
    }

    void onFailure(const std::exception& error) override {
        failed_ = true;
        spdlog::error("Capture failed: {}", error.what());
    }

    void onUploaded(const UploadedSegment& s) override {
        auto& tally = uploads_[s.channel];
        tally.segments++;
        tally.bytes += s.bytes;
        spdlog::info("ch{} take {} segment {} uploaded ({} bytes{}{})",
                     s.channel, s.take, s.sequence, s.bytes,
                     s.remoteId.empty() ? "" : ", id " + s.remoteId,
                     s.final ? ", final" : "");
    }

    void onChannelStateChange(int channel, ChannelState state) override {
        spdlog::info("Channel {} {}", channel, toString(state));
    }

    void onDevicePermissionRemoved() override {
        permissionLost_ = true;
        spdlog::error("Input device went away — will retry");
    }

    bool takePermissionLost() { return permissionLost_.exchange(false); }
    bool takeFailed() { return failed_.exchange(false); }

    void logSummary() const {
        for (auto& [ch, t] : uploads_)
            spdlog::info("ch{}: {} segments, {} bytes uploaded", ch, t.segments, t.bytes);
        if (warnings_ > 0)
            spdlog::info("{} warnings during session", warnings_);
    }

private:
    struct Tally {
        int    segments = 0;
        size_t bytes    = 0;
    };

    std::map<int, Tally> uploads_;
    int warnings_ = 0;
    std::atomic<bool> permissionLost_{false};
    std::atomic<bool> failed_{false};
};

static int listDevices(const SessionConfig& config) {
    PortAudioDeviceGateway gateway(config.device, config.audio);
    auto devices = gateway.listDevices();
    if (devices.empty()) {
        spdlog::error("No input devices found");
        return 1;
    }
    for (auto& d : devices) {
        spdlog::info("[{}] {} ({}) — {} in / {} out, {} Hz",
                     d.id, d.name, d.hostApi, d.maxInputChannels,
                     d.maxOutputChannels, d.defaultSampleRate);
    }
    return 0;
}

// Starts capture and arms the configured channels. Returns the channel count.
static int startAndArm(CaptureSession& session, const SessionConfig& config) {
    int channels = session.startCapture();
    if (channels == 0) return 0;

    auto info = session.inputDeviceInformation();
    spdlog::info("Device '{}' ({}): {} inputs, {} outputs",
                 info.label, info.id, info.inputChannels, info.outputChannels);

    std::vector<int> arm = config.recordChannels;
    if (arm.empty())
        for (int ch = 0; ch < channels; ch++) arm.push_back(ch);

    for (int ch : arm)
        session.recordInputChannel(ch);

    return channels;
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");

    // Setup logging
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "livetrack.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "livetrack",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("LIVETRACK_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);

    spdlog::info("LiveTrack v0.1.0 starting");

    bool wantDeviceList = false;
    std::string configPath = "config/session.json";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--list-devices") wantDeviceList = true;
        else                         configPath = arg;
    }

    SessionConfig config;
    try {
        std::ifstream f(configPath);
        if (!f.is_open()) {
            spdlog::error("Cannot open config file: {}", configPath);
            return 1;
        }
        nlohmann::json j;
        f >> j;
        config = SessionConfig::fromJson(j);
    } catch (const std::exception& e) {
        spdlog::error("Invalid config {}: {}", configPath, e.what());
        return 1;
    }

    spdlog::info("Loaded config: {}", configPath);

    // Environment wins over the file for deployment-specific values
    config.upload.endpoint  = getEnv("LIVETRACK_UPLOAD_URL", config.upload.endpoint);
    config.upload.authToken = getEnv("LIVETRACK_UPLOAD_TOKEN", config.upload.authToken);

    if (wantDeviceList)
        return listDevices(config);

    // Setup signal handlers
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    ConsoleContext context;
    std::unique_ptr<CaptureSession> session;
    try {
        session = std::make_unique<CaptureSession>(
            context, makeDefaultComponents(config), config);
    } catch (const std::exception& e) {
        spdlog::error("Failed to set up session: {}", e.what());
        return 1;
    }

    if (startAndArm(*session, config) == 0) {
        spdlog::error("Failed to start capture");
        return 1;
    }

    spdlog::info("Capturing — press Ctrl+C to stop");

    const auto interval   = std::chrono::milliseconds(config.processIntervalMs);
    const auto retryDelay = std::chrono::seconds(2);
    auto lastRetry = std::chrono::steady_clock::now();
    bool waitingForDevice = false;

    while (g_running) {
        session->process();

        if (context.takePermissionLost() || context.takeFailed()) {
            waitingForDevice = true;
            lastRetry = std::chrono::steady_clock::now();
        }

        if (waitingForDevice &&
            std::chrono::steady_clock::now() - lastRetry > retryDelay) {
            lastRetry = std::chrono::steady_clock::now();
            spdlog::info("Trying to restart capture");
            session->stopCapture();
            if (startAndArm(*session, config) > 0)
                waitingForDevice = false;
        }

        std::this_thread::sleep_for(interval);
    }

    spdlog::info("Stopping capture");
    for (int ch : std::vector<int>(session->audio().recordingChannels().begin(),
                                   session->audio().recordingChannels().end()))
        session->stopRecordInputChannel(ch);
    session->stopCapture();

    // Let the uploader finish what is already queued
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (session->pendingUploads() > 0 && std::chrono::steady_clock::now() < deadline) {
        session->process();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    session->process();
    session.reset();

    context.logSummary();
    spdlog::info("LiveTrack exited cleanly");
    return 0;
}
