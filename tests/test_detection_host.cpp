#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "detection_host.hpp"
#include "test_helpers.hpp"

namespace {

Frame smallFrame() {
    return makePageFrame(64, 48, cv::Rect(16, 12, 32, 24));
}

HostConfig quickTimeout(int ms) {
    HostConfig config;
    config.request_timeout_ms = ms;
    return config;
}

}  // namespace

TEST(DetectionHostTest, StateNames) {
    EXPECT_STREQ(hostStateName(HOST_UNLOADED), "unloaded");
    EXPECT_STREQ(hostStateName(HOST_LOADING), "loading");
    EXPECT_STREQ(hostStateName(HOST_READY), "ready");
    EXPECT_STREQ(hostStateName(HOST_ERROR), "error");
}

TEST(DetectionHostTest, RequestsBeforeStartAreNotReady) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host(scriptedLoader(log, 0));

    EXPECT_EQ(host.state(), HOST_UNLOADED);
    std::future<DetectionResponse> future = host.submit(DetectionRequest::detect(smallFrame()));

    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    DetectionResponse response = future.get();
    EXPECT_EQ(response.error, SCAN_NOT_READY);
    EXPECT_EQ(log->count(), 0u);
}

TEST(DetectionHostTest, RequestsWhileLoadingAreNotReady) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    EngineLoader inner = scriptedLoader(log, 0);

    std::vector<HostState> states;
    std::mutex statesMutex;

    DetectionHost host([opened, inner]() {
        opened.wait();
        return inner();
    });
    host.setStateListener([&states, &statesMutex](HostState state, const std::string&) {
        std::lock_guard<std::mutex> lk(statesMutex);
        states.push_back(state);
    });

    host.start();
    EXPECT_EQ(host.state(), HOST_LOADING);
    EXPECT_EQ(host.submit(DetectionRequest::detect(smallFrame())).get().error, SCAN_NOT_READY);

    gate.set_value();
    ASSERT_TRUE(host.waitUntilReady(5000));
    EXPECT_EQ(host.submit(DetectionRequest::detect(smallFrame())).get().error, SCAN_NO_DOCUMENT_FOUND);

    host.shutdown();
    EXPECT_EQ(host.state(), HOST_UNLOADED);

    std::lock_guard<std::mutex> lk(statesMutex);
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0], HOST_LOADING);
    EXPECT_EQ(states[1], HOST_READY);
    EXPECT_EQ(states[2], HOST_UNLOADED);
}

TEST(DetectionHostTest, LoaderFailureIsPermanent) {
    std::string reported;
    std::promise<void> errored;

    DetectionHost host([]() -> std::unique_ptr<ScanEngine> {
        throw std::runtime_error("opencv missing");
    });
    host.setStateListener([&reported, &errored](HostState state, const std::string& message) {
        if (state == HOST_ERROR) {
            reported = message;
            errored.set_value();
        }
    });

    host.start();
    EXPECT_FALSE(host.waitUntilReady(5000));
    ASSERT_EQ(errored.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    EXPECT_EQ(host.state(), HOST_ERROR);
    EXPECT_NE(host.errorMessage().find("opencv missing"), std::string::npos);
    EXPECT_EQ(reported, host.errorMessage());

    for (int i = 0; i < 3; i++) {
        DetectionResponse response = host.submit(DetectionRequest::detect(smallFrame())).get();
        EXPECT_EQ(response.error, SCAN_RUNTIME_UNAVAILABLE);
    }
}

TEST(DetectionHostTest, LoaderReturningNothingIsAnError) {
    DetectionHost host([]() { return std::unique_ptr<ScanEngine>(); });
    host.start();
    EXPECT_FALSE(host.waitUntilReady(5000));
    EXPECT_EQ(host.state(), HOST_ERROR);
}

TEST(DetectionHostTest, OneShotRequestsCompleteInIssueOrder) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host(scriptedLoader(log, 15));
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    std::mutex mutex;
    std::vector<uint64_t> completed;
    std::vector<uint64_t> submitted;
    std::atomic<int> remaining(6);

    for (int i = 0; i < 6; i++) {
        uint64_t id = host.submit(DetectionRequest::detect(smallFrame()),
            [&mutex, &completed, &remaining](const DetectionResponse& response) {
                std::lock_guard<std::mutex> lk(mutex);
                completed.push_back(response.request_id);
                --remaining;
            });
        submitted.push_back(id);
    }

    ASSERT_TRUE(waitFor([&remaining]() { return remaining.load() == 0; }, 5000));
    std::lock_guard<std::mutex> lk(mutex);
    EXPECT_EQ(completed, submitted);
    EXPECT_EQ(log->max_active.load(), 1);
}

TEST(DetectionHostTest, LiveRequestDroppedWhileAnotherIsOutstanding) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host(scriptedLoader(log, 200));
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    std::future<DetectionResponse> first = host.submit(DetectionRequest::detectLive(smallFrame()));
    EXPECT_TRUE(host.liveRequestOutstanding());
    std::future<DetectionResponse> second = host.submit(DetectionRequest::detectLive(smallFrame()));

    ASSERT_EQ(second.wait_for(std::chrono::milliseconds(50)), std::future_status::ready);
    EXPECT_EQ(second.get().error, SCAN_BUSY);

    // One-shot requests still queue behind it
    std::future<DetectionResponse> oneShot = host.submit(DetectionRequest::detect(smallFrame()));

    DetectionResponse live = first.get();
    EXPECT_EQ(live.type, RESPONSE_FOUND_LIVE);
    EXPECT_EQ(oneShot.get().error, SCAN_NO_DOCUMENT_FOUND);
    EXPECT_FALSE(host.liveRequestOutstanding());
}

TEST(DetectionHostTest, StuckRequestTimesOut) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host([log]() {
        std::unique_ptr<ScriptedEngine> engine(new ScriptedEngine(log, 400));
        engine->setSlowRequests(1);
        return std::unique_ptr<ScanEngine>(std::move(engine));
    }, quickTimeout(100));
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    std::future<DetectionResponse> stuck = host.submit(DetectionRequest::detect(smallFrame()));
    ASSERT_EQ(stuck.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    DetectionResponse response = stuck.get();
    EXPECT_EQ(response.error, SCAN_TIMEOUT);
    EXPECT_TRUE(shouldFallBackToManualCrop(response.error));
    EXPECT_EQ(host.pendingCount(), 0u);

    // The late answer is dropped and the host keeps serving
    ASSERT_TRUE(waitFor([&log]() { return log->count() == 1 && log->active.load() == 0; }, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(host.isReady());
    EXPECT_EQ(host.submit(DetectionRequest::detect(smallFrame())).get().error, SCAN_NO_DOCUMENT_FOUND);
}

TEST(DetectionHostTest, HostSurvivesFailedRequest) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host([log]() {
        std::unique_ptr<ScriptedEngine> engine(new ScriptedEngine(log, 0));
        engine->setThrowFirst(true);
        return std::unique_ptr<ScanEngine>(std::move(engine));
    });
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    DetectionResponse failed = host.submit(DetectionRequest::detect(smallFrame())).get();
    EXPECT_EQ(failed.error, SCAN_PROCESSING_FAILED);
    EXPECT_TRUE(host.isReady());

    DetectionResponse next = host.submit(DetectionRequest::detect(smallFrame())).get();
    EXPECT_EQ(next.error, SCAN_NO_DOCUMENT_FOUND);
}

TEST(DetectionHostTest, EmptyFrameRejectedWithoutDispatch) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host(scriptedLoader(log, 0));
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    EXPECT_EQ(host.submit(DetectionRequest::detect(Frame())).get().error, SCAN_INVALID_FRAME);
    EXPECT_EQ(log->count(), 0u);
}

TEST(DetectionHostTest, ShutdownCancelsPendingRequests) {
    std::shared_ptr<ScriptedEngine::Log> log = std::make_shared<ScriptedEngine::Log>();
    DetectionHost host(scriptedLoader(log, 300));
    host.start();
    ASSERT_TRUE(host.waitUntilReady(5000));

    std::vector<std::future<DetectionResponse>> futures;
    for (int i = 0; i < 3; i++) {
        futures.push_back(host.submit(DetectionRequest::detect(smallFrame())));
    }

    host.shutdown();

    for (auto& future : futures) {
        ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        EXPECT_EQ(future.get().error, SCAN_CANCELLED);
    }
    EXPECT_EQ(host.state(), HOST_UNLOADED);
    EXPECT_EQ(host.submit(DetectionRequest::detect(smallFrame())).get().error, SCAN_CANCELLED);
    EXPECT_LE(log->count(), 1u);
}

TEST(DetectionHostTest, RealRuntimeLoadsAndDetects) {
    DetectionHost host([]() { return loadScanEngine(); });
    host.start();
    ASSERT_TRUE(host.waitUntilReady(10000)) << host.errorMessage();

    DetectionResponse response = host.submit(DetectionRequest::detect(makeStandardPage())).get();
    ASSERT_EQ(response.type, RESPONSE_FOUND) << response.debug;
    EXPECT_NEAR(response.width(), 400, 2);
    EXPECT_NEAR(response.height(), 600, 2);
    EXPECT_EQ(response.raster.type(), CV_8UC4);
}
