#include "capture_session.hpp"
#include <memory>
#include <utility>

#include "scan_log.hpp"

CaptureSession::CaptureSession(const SessionConfig& config)
    : config_(config) {
    ScanEngineConfig engineConfig = config.engine;
    loader_ = [engineConfig]() { return loadScanEngine(engineConfig); };
}

CaptureSession::CaptureSession(const SessionConfig& config, EngineLoader loader)
    : config_(config), loader_(std::move(loader)) {}

CaptureSession::~CaptureSession() {
    end();
}

void CaptureSession::begin() {
    std::shared_ptr<DetectionHost> host;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (host_) {
            return;
        }
        host = std::make_shared<DetectionHost>(loader_, config_.host);
        host->setStateListener(state_listener_);
        host_ = host;
        last_quad_ = LiveQuad();
    }

    DOCSCAN_LOGI("Capture session begin");
    host->start();
}

void CaptureSession::end() {
    std::unique_ptr<LiveDetectionScheduler> scheduler;
    std::shared_ptr<DetectionHost> host;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        scheduler = std::move(scheduler_);
        host = std::move(host_);
        last_quad_ = LiveQuad();
    }

    // Listeners may call back into the session, so teardown runs unlocked
    if (scheduler) {
        scheduler->stop();
        scheduler.reset();
    }
    if (host) {
        host->shutdown();
        DOCSCAN_LOGI("Capture session end");
    }
}

bool CaptureSession::isActive() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return host_ != nullptr;
}

HostState CaptureSession::hostState() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return host_ ? host_->state() : HOST_UNLOADED;
}

std::string CaptureSession::hostError() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return host_ ? host_->errorMessage() : std::string();
}

bool CaptureSession::waitUntilReady(int timeoutMs) {
    std::shared_ptr<DetectionHost> host;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        host = host_;
    }
    return host && host->waitUntilReady(timeoutMs);
}

void CaptureSession::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    state_listener_ = std::move(listener);
}

std::future<DetectionResponse> CaptureSession::resolved(ScanError error, const std::string& debug) {
    std::promise<DetectionResponse> promise;
    promise.set_value(DetectionResponse::failed(0, error, debug));
    return promise.get_future();
}

std::future<DetectionResponse> CaptureSession::detect(Frame frame) {
    std::shared_ptr<DetectionHost> host;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        host = host_;
    }
    if (!host) {
        return resolved(SCAN_NOT_READY, "session not started");
    }
    return host->submit(DetectionRequest::detect(std::move(frame)));
}

std::future<DetectionResponse> CaptureSession::cropWithCorners(Frame frame, const CornerSet& corners) {
    std::shared_ptr<DetectionHost> host;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        host = host_;
    }
    if (!host) {
        return resolved(SCAN_NOT_READY, "session not started");
    }
    return host->submit(DetectionRequest::cropWithCorners(std::move(frame), corners));
}

std::future<DetectionResponse> CaptureSession::captureWithLiveQuad(Frame fullFrame) {
    LiveQuad quad = latestQuad();
    if (!quad.found) {
        return resolved(SCAN_NO_DOCUMENT_FOUND, "no live quad");
    }

    cv::Size size = fullFrame.sourceSize.area() > 0 ? fullFrame.sourceSize : fullFrame.raster.size();
    CornerSet corners = quad.normalized.scaled(static_cast<float>(size.width), static_cast<float>(size.height));

    return cropWithCorners(std::move(fullFrame), corners);
}

bool CaptureSession::startLive(std::shared_ptr<FrameSource> source) {
    if (!source) {
        return false;
    }

    std::unique_ptr<LiveDetectionScheduler> previous;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!host_) {
            return false;
        }
        previous = std::move(scheduler_);
    }
    if (previous) {
        previous->stop();
        previous.reset();
    }

    std::lock_guard<std::mutex> lk(mutex_);
    // end() may have run while the previous scheduler stopped
    if (!host_) {
        return false;
    }
    scheduler_ = std::make_unique<LiveDetectionScheduler>(*host_, source, config_.live);
    scheduler_->setListener(quad_listener_);
    scheduler_->start();
    return true;
}

void CaptureSession::stopLive() {
    std::unique_ptr<LiveDetectionScheduler> scheduler;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        scheduler = std::move(scheduler_);
    }
    if (!scheduler) {
        return;
    }

    scheduler->stop();
    LiveQuad quad = scheduler->latest();

    std::lock_guard<std::mutex> lk(mutex_);
    last_quad_ = quad;
}

bool CaptureSession::isLive() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return scheduler_ && scheduler_->isRunning();
}

LiveQuad CaptureSession::latestQuad() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return scheduler_ ? scheduler_->latest() : last_quad_;
}

SchedulerStats CaptureSession::liveStats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return scheduler_ ? scheduler_->stats() : SchedulerStats();
}

void CaptureSession::setQuadListener(LiveDetectionScheduler::QuadListener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    quad_listener_ = listener;
    if (scheduler_) {
        scheduler_->setListener(listener);
    }
}

CornerSet CaptureSession::defaultManualCorners(const cv::Size& size, float inset) {
    float w = static_cast<float>(size.width);
    float h = static_cast<float>(size.height);
    return CornerSet(
        cv::Point2f(w * inset, h * inset),
        cv::Point2f(w * (1.0f - inset), h * inset),
        cv::Point2f(w * (1.0f - inset), h * (1.0f - inset)),
        cv::Point2f(w * inset, h * (1.0f - inset)));
}
