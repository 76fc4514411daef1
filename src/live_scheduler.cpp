#include "live_scheduler.hpp"
#include <algorithm>
#include <utility>

#include "scan_log.hpp"

LatestFrameSource::LatestFrameSource() {}

void LatestFrameSource::push(Frame frame) {
    std::lock_guard<std::mutex> lk(mutex_);
    latest_ = std::move(frame);
}

void LatestFrameSource::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    latest_ = Frame();
}

bool LatestFrameSource::hasFrame() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return !latest_.empty();
}

cv::Size LatestFrameSource::frameSize() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return latest_.sourceSize;
}

bool LatestFrameSource::snapshot(int maxDimension, Frame& out) {
    Frame current;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        current = latest_;
    }

    if (current.empty() || current.sourceSize.width <= 0 || current.sourceSize.height <= 0) {
        return false;
    }

    // Pushed rasters are never written again, so the shallow copy is safe
    // to read here; downscaleFrame always allocates a new raster.
    return downscaleFrame(current, maxDimension, out) == SCAN_OK;
}

LiveDetectionScheduler::LiveDetectionScheduler(DetectionHost& host,
                                               std::shared_ptr<FrameSource> source,
                                               const SchedulerConfig& config)
    : host_(host),
      source_(std::move(source)),
      config_(config),
      shared_(std::make_shared<SharedState>()),
      running_(false) {}

LiveDetectionScheduler::~LiveDetectionScheduler() {
    stop();
}

void LiveDetectionScheduler::start() {
    std::lock_guard<std::mutex> lk(timer_mutex_);
    if (running_) {
        return;
    }
    running_ = true;

    {
        std::lock_guard<std::mutex> state_lk(shared_->mutex);
        shared_->latest = LiveQuad();
        shared_->has_dispatched = false;
    }

    timer_ = std::thread(&LiveDetectionScheduler::run, this);
    DOCSCAN_LOGI("Live detection started (interval %dms, %dpx)", config_.interval_ms, config_.max_dimension);
}

void LiveDetectionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(timer_mutex_);
        running_ = false;
    }
    timer_cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }

    std::lock_guard<std::mutex> lk(shared_->mutex);
    if (shared_->busy) {
        DOCSCAN_LOGD("Live detection stopped with a request in flight");
    }
    // Answers to requests issued before this point are ignored
    shared_->generation++;
    shared_->busy = false;
    shared_->in_flight = 0;
}

bool LiveDetectionScheduler::isRunning() const {
    std::lock_guard<std::mutex> lk(timer_mutex_);
    return running_;
}

void LiveDetectionScheduler::run() {
    std::unique_lock<std::mutex> lk(timer_mutex_);
    while (running_) {
        lk.unlock();
        tick();
        lk.lock();
        timer_cv_.wait_for(lk, std::chrono::milliseconds(config_.poll_ms), [this] { return !running_; });
    }
}

bool LiveDetectionScheduler::skip(SharedState& state) {
    state.stats.skipped++;
    return false;
}

bool LiveDetectionScheduler::tick() {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        if (shared_->busy) {
            return skip(*shared_);
        }
        if (shared_->has_dispatched &&
            now - shared_->last_dispatch < std::chrono::milliseconds(config_.interval_ms)) {
            return skip(*shared_);
        }
    }

    if (!host_.isReady() || !source_) {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        return skip(*shared_);
    }

    Frame frame;
    if (!source_->snapshot(config_.max_dimension, frame)) {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        return skip(*shared_);
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        // Another caller of tick() may have dispatched meanwhile
        if (shared_->busy) {
            return skip(*shared_);
        }
        shared_->busy = true;
        shared_->in_flight++;
        shared_->stats.max_in_flight = std::max(shared_->stats.max_in_flight, shared_->in_flight);
        shared_->stats.dispatched++;
        shared_->has_dispatched = true;
        shared_->last_dispatch = now;
        generation = shared_->generation;
    }

    cv::Size captureSize = frame.sourceSize;
    std::shared_ptr<SharedState> state = shared_;
    host_.submit(DetectionRequest::detectLive(std::move(frame)),
                 [state, generation, captureSize](const DetectionResponse& response) {
                     onResponse(state, generation, captureSize, response);
                 });
    return true;
}

void LiveDetectionScheduler::onResponse(const std::shared_ptr<SharedState>& state, uint64_t generation,
                                        const cv::Size& captureSize, const DetectionResponse& response) {
    QuadListener listener;
    LiveQuad quad;
    {
        std::lock_guard<std::mutex> lk(state->mutex);
        if (generation != state->generation) {
            return;
        }
        state->busy = false;
        state->in_flight--;
        state->stats.completed++;

        // Dropped or torn down: keep showing the previous result
        if (response.error == SCAN_BUSY || response.error == SCAN_CANCELLED ||
            response.error == SCAN_NOT_READY) {
            return;
        }

        if (response.type == RESPONSE_FOUND_LIVE && captureSize.width > 0 && captureSize.height > 0) {
            quad.found = true;
            quad.corners = response.corners;
            quad.normalized = response.corners.scaled(1.0f / captureSize.width, 1.0f / captureSize.height);
            quad.score = response.score;
        }
        quad.sequence = ++state->sequence;

        state->latest = quad;
        listener = state->listener;
    }

    if (listener) {
        listener(quad);
    }
}

LiveQuad LiveDetectionScheduler::latest() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->latest;
}

bool LiveDetectionScheduler::isBusy() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->busy;
}

SchedulerStats LiveDetectionScheduler::stats() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->stats;
}

void LiveDetectionScheduler::setListener(QuadListener listener) {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    shared_->listener = std::move(listener);
}
