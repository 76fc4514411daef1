#include "detection_host.hpp"
#include <cstdio>
#include <exception>
#include <utility>
#include <vector>

#include "scan_log.hpp"

const char* hostStateName(HostState state) {
    switch (state) {
        case HOST_UNLOADED: return "unloaded";
        case HOST_LOADING: return "loading";
        case HOST_READY: return "ready";
        case HOST_ERROR: return "error";
    }
    return "unknown";
}

DetectionHost::DetectionHost(EngineLoader loader, const HostConfig& config)
    : loader_(std::move(loader)),
      config_(config),
      state_(HOST_UNLOADED),
      started_(false),
      stopping_(false),
      next_id_(1) {}

DetectionHost::~DetectionHost() {
    shutdown();
}

void DetectionHost::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    state_listener_ = std::move(listener);
}

void DetectionHost::start() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (started_) {
            return;
        }
        started_ = true;
    }

    setState(HOST_LOADING, std::string());
    DOCSCAN_LOGI("Host loading runtime");

    worker_ = std::thread(&DetectionHost::workerLoop, this);
    timeout_thread_ = std::thread(&DetectionHost::timeoutLoop, this);
}

void DetectionHost::shutdown() {
    std::vector<std::pair<uint64_t, ResponseCallback>> cancelled;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
        for (auto& kv : pending_) {
            cancelled.push_back(std::make_pair(kv.first, std::move(kv.second.callback)));
        }
        pending_.clear();
        queue_.clear();
    }
    queue_cv_.notify_all();
    timeout_cv_.notify_all();
    state_cv_.notify_all();

    // Nobody is left waiting on a request that will never be answered
    for (auto& entry : cancelled) {
        if (entry.second) {
            entry.second(DetectionResponse::failed(entry.first, SCAN_CANCELLED, "session ended"));
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    if (timeout_thread_.joinable()) {
        timeout_thread_.join();
    }

    if (setState(HOST_UNLOADED, std::string()) && !cancelled.empty()) {
        DOCSCAN_LOGI("Host shut down, cancelled %zu pending request(s)", cancelled.size());
    }
}

HostState DetectionHost::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::string DetectionHost::errorMessage() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return error_message_;
}

bool DetectionHost::waitUntilReady(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mutex_);
    state_cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [this] {
        return state_ == HOST_READY || state_ == HOST_ERROR || stopping_;
    });
    return state_ == HOST_READY && !stopping_;
}

bool DetectionHost::setState(HostState state, const std::string& message) {
    StateListener listener;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        // Once stopping, the only transition left is back to Unloaded
        if (state_ == state || (stopping_ && state != HOST_UNLOADED)) {
            return false;
        }
        state_ = state;
        error_message_ = message;
        listener = state_listener_;
    }
    state_cv_.notify_all();
    DOCSCAN_LOGD("Host state -> %s", hostStateName(state));

    if (listener) {
        listener(state, message);
    }
    return true;
}

bool DetectionHost::liveOutstandingLocked() const {
    for (const auto& kv : pending_) {
        if (kv.second.type == REQUEST_DETECT_LIVE) {
            return true;
        }
    }
    return false;
}

bool DetectionHost::liveRequestOutstanding() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return liveOutstandingLocked();
}

size_t DetectionHost::pendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

uint64_t DetectionHost::submit(DetectionRequest request, ResponseCallback callback) {
    uint64_t id = 0;
    ScanError rejection = SCAN_OK;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        id = next_id_++;
        request.id = id;

        if (stopping_) {
            rejection = SCAN_CANCELLED;
        } else if (state_ == HOST_ERROR) {
            rejection = SCAN_RUNTIME_UNAVAILABLE;
        } else if (state_ != HOST_READY) {
            rejection = SCAN_NOT_READY;
        } else if (request.frame.empty()) {
            rejection = SCAN_INVALID_FRAME;
        } else if (request.type == REQUEST_DETECT_LIVE && liveOutstandingLocked()) {
            rejection = SCAN_BUSY;
        } else {
            PendingRequest pending;
            pending.type = request.type;
            pending.callback = std::move(callback);
            pending.deadline = std::chrono::steady_clock::now() +
                               std::chrono::milliseconds(config_.request_timeout_ms);
            pending_[id] = std::move(pending);
            queue_.push_back(std::move(request));
        }
    }

    if (rejection != SCAN_OK) {
        if (callback) {
            callback(DetectionResponse::failed(id, rejection, scanErrorMessage(rejection)));
        }
        return id;
    }

    queue_cv_.notify_one();
    timeout_cv_.notify_one();
    return id;
}

std::future<DetectionResponse> DetectionHost::submit(DetectionRequest request) {
    std::shared_ptr<std::promise<DetectionResponse>> promise =
        std::make_shared<std::promise<DetectionResponse>>();
    std::future<DetectionResponse> future = promise->get_future();

    submit(std::move(request), [promise](const DetectionResponse& response) {
        promise->set_value(response);
    });

    return future;
}

void DetectionHost::complete(uint64_t id, const DetectionResponse& response) {
    ResponseCallback callback;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Already timed out or cancelled
            DOCSCAN_LOGD("Dropping late response for request %llu", static_cast<unsigned long long>(id));
            return;
        }
        callback = std::move(it->second.callback);
        pending_.erase(it);
    }

    if (callback) {
        callback(response);
    }
}

void DetectionHost::workerLoop() {
    std::unique_ptr<ScanEngine> engine;
    std::string error;

    try {
        if (loader_) {
            engine = loader_();
        }
        if (!engine) {
            error = "runtime loader returned no engine";
        }
    } catch (const std::exception& e) {
        error = std::string("runtime failed to load: ") + e.what();
    }

    if (!engine) {
        DOCSCAN_LOGE("Host error: %s", error.c_str());
        setState(HOST_ERROR, error);
        return;
    }

    engine_ = std::move(engine);
    if (!setState(HOST_READY, std::string())) {
        // Shut down while loading
        engine_.reset();
        return;
    }
    DOCSCAN_LOGI("Host ready");

    for (;;) {
        DetectionRequest request;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            queue_cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }
            request = std::move(queue_.front());
            queue_.pop_front();

            // Timed out while queued
            if (pending_.find(request.id) == pending_.end()) {
                continue;
            }
        }

        DetectionResponse response;
        try {
            response = engine_->process(request);
        } catch (const std::exception& e) {
            DOCSCAN_LOGE("Request %llu failed: %s", static_cast<unsigned long long>(request.id), e.what());
            response = DetectionResponse::failed(request.id, SCAN_PROCESSING_FAILED, std::string("error: ") + e.what());
        }
        response.request_id = request.id;

        complete(request.id, response);
    }

    // Runtime state is discarded with the session
    engine_.reset();
}

void DetectionHost::timeoutLoop() {
    std::unique_lock<std::mutex> lk(mutex_);

    while (!stopping_) {
        if (pending_.empty()) {
            timeout_cv_.wait(lk);
            continue;
        }

        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        std::chrono::steady_clock::time_point earliest = pending_.begin()->second.deadline;
        std::vector<std::pair<uint64_t, ResponseCallback>> expired;

        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(std::make_pair(it->first, std::move(it->second.callback)));
                it = pending_.erase(it);
            } else {
                if (it->second.deadline < earliest) {
                    earliest = it->second.deadline;
                }
                ++it;
            }
        }

        if (expired.empty()) {
            timeout_cv_.wait_until(lk, earliest);
            continue;
        }

        lk.unlock();
        for (auto& entry : expired) {
            DOCSCAN_LOGW("Request %llu timed out", static_cast<unsigned long long>(entry.first));
            if (entry.second) {
                char buf[32];
                snprintf(buf, sizeof(buf), "timeout (%dms)", config_.request_timeout_ms);
                entry.second(DetectionResponse::failed(entry.first, SCAN_TIMEOUT, buf));
            }
        }
        lk.lock();
    }
}
