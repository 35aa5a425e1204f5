#include <gtest/gtest.h>
#include "upload/HttpUploader.hpp"
#include "TestDoubles.hpp"
#include <mutex>

namespace {

// Records every request and answers from a script
struct ScriptedServer {
    std::mutex mtx;
    std::vector<std::string> paths;
    std::function<HttpUploader::Response(int call)> reply =
        [](int) { return HttpUploader::Response{200, "{}", ""}; };

    HttpUploader::Transport transport() {
        return [this](const std::string& path, const EncodedSegment&) {
            int call;
            {
                std::lock_guard lock(mtx);
                paths.push_back(path);
                call = static_cast<int>(paths.size());
            }
            return reply(call);
        };
    }

    size_t calls() {
        std::lock_guard lock(mtx);
        return paths.size();
    }

    std::vector<std::string> seen() {
        std::lock_guard lock(mtx);
        return paths;
    }
};

EncodedSegment segment(int channel, int sequence, int take = 1) {
    EncodedSegment s;
    s.channel     = channel;
    s.take        = take;
    s.sequence    = sequence;
    s.contentType = "audio/wav";
    s.bytes.assign(64, 0x7f);
    return s;
}

} // namespace

TEST(HttpUploaderPathTest, SegmentPathCarriesIdentity) {
    EXPECT_EQ(HttpUploader::segmentPath("/sessions/gig", segment(2, 5, 3)),
              "/sessions/gig/channels/2/takes/3/segments/5");
}

TEST(HttpUploaderPathTest, TransientStatuses) {
    EXPECT_TRUE(HttpUploader::isTransient(0));
    EXPECT_TRUE(HttpUploader::isTransient(408));
    EXPECT_TRUE(HttpUploader::isTransient(429));
    EXPECT_TRUE(HttpUploader::isTransient(500));
    EXPECT_TRUE(HttpUploader::isTransient(503));
    EXPECT_FALSE(HttpUploader::isTransient(400));
    EXPECT_FALSE(HttpUploader::isTransient(401));
    EXPECT_FALSE(HttpUploader::isTransient(404));
}

class HttpUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.pathPrefix      = "/sessions/test";
        config_.retryIntervalMs = 10;
        config_.maxAttempts     = 3;
    }

    void start(int channels = 2) {
        uploader_ = std::make_unique<HttpUploader>(completion_, errors_, config_,
                                                   server_.transport());
        uploader_->setChannels(channels);
    }

    // Pumps events on this thread the way the session does
    bool pumpUntil(std::function<bool()> pred) {
        return waitFor([&] {
            uploader_->dispatchEvents();
            return pred();
        });
    }

    UploadConfig        config_;
    ScriptedServer      server_;
    ErrorCollector      errors_;
    CompletionCollector completion_;
    std::unique_ptr<HttpUploader> uploader_;
};

TEST_F(HttpUploaderTest, SuccessfulUploadIsReportedWithRemoteId) {
    server_.reply = [](int) { return HttpUploader::Response{201, R"({"id":"seg-42"})", ""}; };
    start();

    uploader_->enqueue(segment(1, 0));

    ASSERT_TRUE(pumpUntil([&] { return completion_.uploads.size() == 1; }));
    const auto& done = completion_.uploads[0];
    EXPECT_EQ(done.channel, 1);
    EXPECT_EQ(done.sequence, 0);
    EXPECT_EQ(done.bytes, 64u);
    EXPECT_EQ(done.attempts, 1);
    EXPECT_EQ(done.remoteId, "seg-42");
    EXPECT_EQ(server_.seen()[0], "/sessions/test/channels/1/takes/1/segments/0");
    EXPECT_EQ(uploader_->pendingCount(), 0u);
}

TEST_F(HttpUploaderTest, NonJsonBodyLeavesRemoteIdEmpty) {
    server_.reply = [](int) { return HttpUploader::Response{200, "OK", ""}; };
    start();
    uploader_->enqueue(segment(0, 0));

    ASSERT_TRUE(pumpUntil([&] { return completion_.uploads.size() == 1; }));
    EXPECT_TRUE(completion_.uploads[0].remoteId.empty());
}

TEST_F(HttpUploaderTest, EventsWaitForDispatch) {
    start();
    uploader_->enqueue(segment(0, 0));

    ASSERT_TRUE(waitFor([&] { return uploader_->pendingCount() == 0; }));
    EXPECT_TRUE(completion_.uploads.empty());

    uploader_->dispatchEvents();
    EXPECT_EQ(completion_.uploads.size(), 1u);
}

TEST_F(HttpUploaderTest, TransientFailureRetriesInOrder) {
    server_.reply = [](int call) {
        return call == 1 ? HttpUploader::Response{503, "", ""}
                         : HttpUploader::Response{200, "{}", ""};
    };
    start();

    uploader_->enqueue(segment(0, 0));
    uploader_->enqueue(segment(0, 1));

    ASSERT_TRUE(pumpUntil([&] { return completion_.uploads.size() == 2; }));
    auto paths = server_.seen();
    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths[0], paths[1]);
    EXPECT_EQ(paths[2], "/sessions/test/channels/0/takes/1/segments/1");

    EXPECT_EQ(completion_.uploads[0].sequence, 0);
    EXPECT_EQ(completion_.uploads[0].attempts, 2);
    EXPECT_EQ(completion_.uploads[1].sequence, 1);
    EXPECT_TRUE(errors_.failures.empty());
}

TEST_F(HttpUploaderTest, TransportExceptionCountsAsNoResponse) {
    server_.reply = [](int call) -> HttpUploader::Response {
        if (call == 1) throw std::runtime_error("connection reset");
        return {200, "{}", ""};
    };
    start();
    uploader_->enqueue(segment(0, 0));

    ASSERT_TRUE(pumpUntil([&] { return completion_.uploads.size() == 1; }));
    EXPECT_EQ(completion_.uploads[0].attempts, 2);
}

TEST_F(HttpUploaderTest, PermanentFailureIsNotRetried) {
    server_.reply = [](int) { return HttpUploader::Response{403, "", ""}; };
    start();
    uploader_->enqueue(segment(0, 0));

    ASSERT_TRUE(pumpUntil([&] { return errors_.failures.size() == 1; }));
    EXPECT_NE(errors_.failures[0].find("HTTP 403"), std::string::npos);
    EXPECT_EQ(server_.calls(), 1u);
    EXPECT_EQ(uploader_->failed(), 1);
}

TEST_F(HttpUploaderTest, ExhaustedRetriesBecomeFailure) {
    server_.reply = [](int) { return HttpUploader::Response{500, "", ""}; };
    start();
    uploader_->enqueue(segment(1, 0));

    ASSERT_TRUE(pumpUntil([&] { return errors_.failures.size() == 1; }));
    EXPECT_EQ(server_.calls(), 3u);
    EXPECT_TRUE(completion_.uploads.empty());
}

TEST_F(HttpUploaderTest, SegmentForUnknownChannelIsDropped) {
    start(1);
    uploader_->enqueue(segment(3, 0));
    uploader_->dispatchEvents();

    ASSERT_EQ(errors_.warnings.size(), 1u);
    EXPECT_EQ(uploader_->pendingCount(), 0u);
    EXPECT_EQ(server_.calls(), 0u);
}

TEST_F(HttpUploaderTest, StopGivesQueuedSegmentsOneLastAttempt) {
    config_.retryIntervalMs = 10000;

    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    server_.reply = [open](int call) {
        if (call == 1) {
            open.wait();
            return HttpUploader::Response{200, "{}", ""};
        }
        return HttpUploader::Response{503, "", ""};
    };
    start();

    uploader_->enqueue(segment(0, 0));
    ASSERT_TRUE(waitFor([&] { return server_.calls() == 1; }));
    uploader_->enqueue(segment(0, 1));

    uploader_->stopUploader();
    EXPECT_FALSE(uploader_->isActive());
    gate.set_value();

    ASSERT_TRUE(pumpUntil([&] { return errors_.warnings.size() == 1; }));
    EXPECT_NE(errors_.warnings[0].find("after stop"), std::string::npos);
    EXPECT_EQ(completion_.uploads.size(), 1u);
    EXPECT_TRUE(errors_.failures.empty());
    EXPECT_EQ(server_.calls(), 2u);
}

TEST_F(HttpUploaderTest, EnqueueAfterStopReactivates) {
    start();
    uploader_->stopUploader();
    uploader_->enqueue(segment(0, 0));
    EXPECT_TRUE(uploader_->isActive());

    ASSERT_TRUE(pumpUntil([&] { return completion_.uploads.size() == 1; }));
}

TEST_F(HttpUploaderTest, SegmentOnTheWireDuringStopIsNotRetried) {
    config_.retryIntervalMs = 10000;

    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    server_.reply = [open](int) {
        open.wait();
        return HttpUploader::Response{503, "", ""};
    };
    start();

    uploader_->enqueue(segment(0, 0));
    ASSERT_TRUE(waitFor([&] { return server_.calls() == 1; }));

    uploader_->stopUploader();
    gate.set_value();

    ASSERT_TRUE(pumpUntil([&] { return errors_.warnings.size() == 1; }));
    EXPECT_NE(errors_.warnings[0].find("after stop"), std::string::npos);
    EXPECT_TRUE(errors_.failures.empty());
    EXPECT_EQ(server_.calls(), 1u);
    EXPECT_EQ(uploader_->pendingCount(), 0u);
}
