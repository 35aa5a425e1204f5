#pragma once
#include "IUploader.hpp"
#include "session/SessionConfig.hpp"
#include <cstddef>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class UploadCompletionSink;
class ErrorSink;

// Posts encoded segments over HTTP from a background worker.
//
//   POST {pathPrefix}/channels/{c}/takes/{t}/segments/{s}
//
// Transient failures (no response, 408, 429, 5xx) are retried every
// retryIntervalMs, up to maxAttempts. Other 4xx responses and exhausted
// retries are reported as failures, except for the final attempt granted
// by stopUploader(), which only warns. Segments are sent strictly in order;
// a segment waiting for its retry holds back the ones behind it.
class HttpUploader : public IUploader {
public:
    struct Response {
        int         status = 0;     // 0 = no response
        std::string body;
        std::string error;
    };

    // Swappable for tests; the default goes through cpp-httplib
    using Transport = std::function<Response(const std::string& path,
                                             const EncodedSegment& segment)>;

    HttpUploader(UploadCompletionSink& completion,
                 ErrorSink& errors,
                 const UploadConfig& config,
                 Transport transport = {});
    ~HttpUploader() override;

    HttpUploader(const HttpUploader&) = delete;
    HttpUploader& operator=(const HttpUploader&) = delete;

    void enqueue(EncodedSegment segment) override;

    void setChannels(int count) override { channels_ = count; }
    int  channelCount() const override { return channels_; }

    void stopUploader() override;
    bool isActive() const;

    void dispatchEvents() override;
    size_t pendingCount() const override;

    // Stats
    int uploaded() const { return uploaded_; }
    int failed() const { return failed_; }

    static std::string segmentPath(const std::string& prefix, const EncodedSegment& s);
    static bool isTransient(int status);

private:
    struct Pending {
        EncodedSegment segment;
        int  attempts   = 0;
        bool lastChance = false;   // set by stopUploader()
        std::chrono::steady_clock::time_point due;
    };

    struct Event {
        enum class Type { Uploaded, Warning, Failure } type;
        UploadedSegment uploaded;
        std::string     message;
    };

    void workerLoop();
    Response post(const std::string& path, const EncodedSegment& segment);
    void pushEventLocked(Event e);

    UploadCompletionSink& completion_;
    ErrorSink&            errors_;
    UploadConfig          config_;
    Transport             transport_;

    std::atomic<int> channels_{0};
    std::atomic<int> uploaded_{0};
    std::atomic<int> failed_{0};

    std::deque<Pending> queue_;
    std::deque<Event>   events_;
    int  inFlight_ = 0;
    unsigned stopGeneration_ = 0;   // bumped by every stopUploader()
    bool active_   = false;
    bool shutdown_ = false;

    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::thread             worker_;
};
