#include "upload/HttpUploader.hpp"
#include "session/CaptureError.hpp"
#include "session/SessionContext.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

HttpUploader::HttpUploader(UploadCompletionSink& completion,
                           ErrorSink& errors,
                           const UploadConfig& config,
                           Transport transport)
    : completion_(completion)
    , errors_(errors)
    , config_(config)
    , transport_(std::move(transport))
{
    if (!transport_) {
        transport_ = [this](const std::string& path, const EncodedSegment& seg) {
            return post(path, seg);
        };
    }

    worker_ = std::thread(&HttpUploader::workerLoop, this);
    spdlog::info("Uploader targeting {}{} (retry every {}ms, {} attempts)",
                 config_.endpoint, config_.pathPrefix,
                 config_.retryIntervalMs, config_.maxAttempts);
}

HttpUploader::~HttpUploader() {
    {
        std::lock_guard lock(mtx_);
        shutdown_ = true;
        if (!queue_.empty())
            spdlog::warn("Uploader shutting down with {} segments unsent", queue_.size());
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::string HttpUploader::segmentPath(const std::string& prefix, const EncodedSegment& s) {
    return prefix + "/channels/" + std::to_string(s.channel)
         + "/takes/" + std::to_string(s.take)
         + "/segments/" + std::to_string(s.sequence);
}

bool HttpUploader::isTransient(int status) {
    return status == 0 || status == 408 || status == 429 || status >= 500;
}

void HttpUploader::enqueue(EncodedSegment segment) {
    std::lock_guard lock(mtx_);

    if (segment.channel < 0 || segment.channel >= channels_) {
        spdlog::warn("Uploader dropped segment for channel {} (configured for {} channels)",
                     segment.channel, channels_.load());
        pushEventLocked({Event::Type::Warning, {},
                         "Uploader dropped segment for channel "
                         + std::to_string(segment.channel)});
        return;
    }

    if (!active_) {
        active_ = true;
        spdlog::debug("Uploader active");
    }

    Pending p;
    p.segment = std::move(segment);
    p.due     = std::chrono::steady_clock::now();
    queue_.push_back(std::move(p));
    cv_.notify_all();
}

void HttpUploader::stopUploader() {
    std::lock_guard lock(mtx_);
    stopGeneration_++;
    if (!active_ && queue_.empty() && inFlight_ == 0) return;

    active_ = false;
    auto now = std::chrono::steady_clock::now();
    for (auto& p : queue_) {
        p.lastChance = true;
        p.due = now;
    }
    spdlog::info("Uploader stopping, {} segments get a final attempt", queue_.size());
    cv_.notify_all();
}

bool HttpUploader::isActive() const {
    std::lock_guard lock(mtx_);
    return active_;
}

size_t HttpUploader::pendingCount() const {
    std::lock_guard lock(mtx_);
    return queue_.size() + static_cast<size_t>(inFlight_);
}

void HttpUploader::pushEventLocked(Event e) {
    events_.push_back(std::move(e));
}

void HttpUploader::dispatchEvents() {
    std::deque<Event> events;
    {
        std::lock_guard lock(mtx_);
        events.swap(events_);
    }

    for (auto& e : events) {
        switch (e.type) {
            case Event::Type::Uploaded:
                completion_.onUploaded(e.uploaded);
                break;
            case Event::Type::Warning:
                errors_.onWarning(e.message);
                break;
            case Event::Type::Failure:
                errors_.onFailure(CaptureError(e.message));
                break;
        }
    }
}

HttpUploader::Response HttpUploader::post(const std::string& path,
                                          const EncodedSegment& segment) {
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(config_.timeoutMs / 1000,
                               (config_.timeoutMs % 1000) * 1000);
    cli.set_read_timeout(config_.timeoutMs / 1000,
                         (config_.timeoutMs % 1000) * 1000);

    httplib::Headers headers = {
        {"X-Channel",       std::to_string(segment.channel)},
        {"X-Take",          std::to_string(segment.take)},
        {"X-Segment",       std::to_string(segment.sequence)},
        {"X-Segment-Final", segment.final ? "1" : "0"}
    };
    if (!config_.authToken.empty())
        headers.emplace("Authorization", "Bearer " + config_.authToken);

    std::string body(segment.bytes.begin(), segment.bytes.end());
    auto res = cli.Post(path, headers, body, segment.contentType);

    Response r;
    if (!res) {
        r.error = httplib::to_string(res.error());
        return r;
    }
    r.status = res->status;
    r.body   = res->body;
    return r;
}

void HttpUploader::workerLoop() {
    spdlog::debug("Uploader thread started");

    std::unique_lock lock(mtx_);
    while (!shutdown_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            continue;
        }

        auto due = queue_.front().due;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Pending p = std::move(queue_.front());
        queue_.pop_front();
        inFlight_++;
        const unsigned generation = stopGeneration_;
        std::string path = segmentPath(config_.pathPrefix, p.segment);
        lock.unlock();

        Response res;
        try {
            res = transport_(path, p.segment);
        } catch (const std::exception& e) {
            res.status = 0;
            res.error  = e.what();
        }
        p.attempts++;

        lock.lock();
        inFlight_--;

        // stopUploader() ran while this one was on the wire
        if (generation != stopGeneration_)
            p.lastChance = true;

        if (res.status >= 200 && res.status < 300) {
            UploadedSegment done;
            done.channel  = p.segment.channel;
            done.take     = p.segment.take;
            done.sequence = p.segment.sequence;
            done.final    = p.segment.final;
            done.bytes    = p.segment.bytes.size();
            done.attempts = p.attempts;

            auto j = nlohmann::json::parse(res.body, nullptr, false);
            if (j.is_object() && j.contains("id")) {
                done.remoteId = j["id"].is_string() ? j["id"].get<std::string>()
                                                    : j["id"].dump();
            }

            uploaded_++;
            spdlog::debug("Uploaded {} ({} bytes, attempt {})",
                          path, done.bytes, p.attempts);
            pushEventLocked({Event::Type::Uploaded, done, ""});
            continue;
        }

        std::string reason = res.status == 0
            ? "no response" + (res.error.empty() ? "" : " (" + res.error + ")")
            : "HTTP " + std::to_string(res.status);

        if (isTransient(res.status) && !p.lastChance
            && p.attempts < config_.maxAttempts) {
            spdlog::warn("Upload of {} failed: {}, retrying in {}ms ({}/{})",
                         path, reason, config_.retryIntervalMs,
                         p.attempts, config_.maxAttempts);
            p.due = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(config_.retryIntervalMs);
            queue_.push_front(std::move(p));
            continue;
        }

        failed_++;
        if (p.lastChance) {
            pushEventLocked({Event::Type::Warning, {},
                             "Dropped " + path + " after stop: " + reason});
        } else {
            spdlog::error("Upload of {} failed after {} attempts: {}",
                          path, p.attempts, reason);
            pushEventLocked({Event::Type::Failure, {},
                             "Upload of " + path + " failed: " + reason});
        }
    }

    spdlog::debug("Uploader thread exiting");
}
