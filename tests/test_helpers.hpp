#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "frame.hpp"
#include "scan_engine.hpp"

// Light page on a dark table; page spans the inclusive pixel rectangle
inline Frame makePageFrame(int width, int height, const cv::Rect& page,
                           uchar background = 20, uchar paper = 235) {
    Frame frame;
    frame.raster = cv::Mat(height, width, CV_8UC4, cv::Scalar(background, background, background, 255));
    frame.raster(page).setTo(cv::Scalar(paper, paper, paper, 255));
    frame.scale = 1.0f;
    frame.sourceSize = cv::Size(width, height);
    return frame;
}

// 600x800 capture with a 400x600 page at (100, 100)
inline Frame makeStandardPage() {
    return makePageFrame(600, 800, cv::Rect(100, 100, 400, 600));
}

// Horizontal and vertical gradients in distinct channels
inline cv::Mat makeGradient(int width, int height) {
    cv::Mat image(height, width, CV_8UC4);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            image.at<cv::Vec4b>(y, x) = cv::Vec4b(
                static_cast<uchar>(x % 256), static_cast<uchar>(y % 256),
                static_cast<uchar>((x + y) % 256), 255);
        }
    }
    return image;
}

inline bool waitFor(const std::function<bool()>& condition, int timeoutMs) {
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Engine with scripted answers and a processing log
class ScriptedEngine : public ScanEngine {
public:
    struct Log {
        std::mutex mutex;
        std::vector<uint64_t> processed;
        std::atomic<int> active;
        std::atomic<int> max_active;

        Log() : active(0), max_active(0) {}

        size_t count() {
            std::lock_guard<std::mutex> lk(mutex);
            return processed.size();
        }
    };

    ScriptedEngine(std::shared_ptr<Log> log, int delayMs)
        : ScanEngine(quietConfig()), log_(log), delay_ms_(delayMs), slow_requests_(-1), throw_first_(false) {}

    // Only the first n requests are delayed
    void setSlowRequests(int n) { slow_requests_ = n; }
    void setThrowFirst(bool value) { throw_first_ = value; }

    CornerSet live_corners;

    DetectionResponse process(const DetectionRequest& request) override {
        int active = ++log_->active;
        int seen = log_->max_active.load();
        while (active > seen && !log_->max_active.compare_exchange_weak(seen, active)) {
        }

        size_t index = 0;
        {
            std::lock_guard<std::mutex> lk(log_->mutex);
            index = log_->processed.size();
            log_->processed.push_back(request.id);
        }

        if (delay_ms_ > 0 && (slow_requests_ < 0 || static_cast<int>(index) < slow_requests_)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        --log_->active;

        if (throw_first_ && index == 0) {
            throw std::runtime_error("scripted failure");
        }

        if (request.type == REQUEST_DETECT_LIVE) {
            return DetectionResponse::foundLive(request.id, live_corners, 80.0f, "scripted live");
        }
        if (request.type == REQUEST_CROP_WITH_CORNERS) {
            return DetectionResponse::found(request.id, request.frame.raster, request.corners, 0.0f, "scripted crop");
        }
        return DetectionResponse::failed(request.id, SCAN_NO_DOCUMENT_FOUND, "scripted");
    }

    static ScanEngineConfig quietConfig() {
        ScanEngineConfig config;
        config.warm_up = false;
        return config;
    }

private:
    std::shared_ptr<Log> log_;
    int delay_ms_;
    int slow_requests_;
    bool throw_first_;
};

inline EngineLoader scriptedLoader(std::shared_ptr<ScriptedEngine::Log> log, int delayMs,
                                   const CornerSet& liveCorners = CornerSet()) {
    return [log, delayMs, liveCorners]() {
        std::unique_ptr<ScriptedEngine> engine(new ScriptedEngine(log, delayMs));
        engine->live_corners = liveCorners;
        return std::unique_ptr<ScanEngine>(std::move(engine));
    };
}

#endif // TEST_HELPERS_HPP
