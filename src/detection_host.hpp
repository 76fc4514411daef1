#ifndef DETECTION_HOST_HPP
#define DETECTION_HOST_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "detection_protocol.hpp"
#include "scan_engine.hpp"

enum HostState {
    HOST_UNLOADED = 0,
    HOST_LOADING = 1,
    HOST_READY = 2,
    HOST_ERROR = 3    // Runtime failed to load; permanent for this host
};

const char* hostStateName(HostState state);

typedef std::function<std::unique_ptr<ScanEngine>()> EngineLoader;
typedef std::function<void(const DetectionResponse&)> ResponseCallback;
typedef std::function<void(HostState, const std::string&)> StateListener;

struct HostConfig {
    int request_timeout_ms;   // Safety window after which a pending request fails

    HostConfig() : request_timeout_ms(5000) {}
};

// Background execution host. Owns the runtime on a dedicated worker thread
// and serves requests one at a time:
//   - one-shot requests queue up and are answered in submission order,
//   - a live request is dropped (SCAN_BUSY) while another one is outstanding,
//   - every request resolves exactly once: with the runtime's answer, with
//     SCAN_TIMEOUT after request_timeout_ms, or with SCAN_CANCELLED on shutdown.
// Callbacks run on the worker, timeout or calling thread and must not call
// shutdown().
class DetectionHost {
public:
    explicit DetectionHost(EngineLoader loader, const HostConfig& config = HostConfig());
    ~DetectionHost();

    DetectionHost(const DetectionHost&) = delete;
    DetectionHost& operator=(const DetectionHost&) = delete;

    // Unloaded -> Loading; the runtime loads on the worker thread
    void start();

    // Cancels pending requests, joins the threads and releases the runtime
    void shutdown();

    HostState state() const;
    bool isReady() const { return state() == HOST_READY; }
    std::string errorMessage() const;

    // Blocks until Ready, Error or shutdown; true only for Ready
    bool waitUntilReady(int timeoutMs);

    // Set before start()
    void setStateListener(StateListener listener);

    uint64_t submit(DetectionRequest request, ResponseCallback callback);
    std::future<DetectionResponse> submit(DetectionRequest request);

    bool liveRequestOutstanding() const;
    size_t pendingCount() const;

private:
    struct PendingRequest {
        RequestType type;
        ResponseCallback callback;
        std::chrono::steady_clock::time_point deadline;
    };

    void workerLoop();
    void timeoutLoop();
    bool setState(HostState state, const std::string& message);
    void complete(uint64_t id, const DetectionResponse& response);
    bool liveOutstandingLocked() const;

    EngineLoader loader_;
    HostConfig config_;
    std::unique_ptr<ScanEngine> engine_;   // Worker thread only

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable timeout_cv_;
    std::condition_variable state_cv_;
    HostState state_;
    std::string error_message_;
    bool started_;
    bool stopping_;
    uint64_t next_id_;
    std::deque<DetectionRequest> queue_;
    std::map<uint64_t, PendingRequest> pending_;
    StateListener state_listener_;

    std::thread worker_;
    std::thread timeout_thread_;
};

#endif // DETECTION_HOST_HPP
