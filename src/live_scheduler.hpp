#ifndef LIVE_SCHEDULER_HPP
#define LIVE_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "detection_host.hpp"
#include "frame.hpp"
#include "quad_geometry.hpp"

// Capture source collaborator
class FrameSource {
public:
    virtual ~FrameSource() {}

    // Current capture downscaled to maxDimension. Returns false while the
    // source has no frame with valid dimensions.
    virtual bool snapshot(int maxDimension, Frame& out) = 0;
};

// Holds the newest frame pushed by the camera callback
class LatestFrameSource : public FrameSource {
public:
    LatestFrameSource();

    void push(Frame frame);
    void clear();
    bool hasFrame() const;
    cv::Size frameSize() const;

    bool snapshot(int maxDimension, Frame& out) override;

private:
    mutable std::mutex mutex_;
    Frame latest_;
};

// Published result of the latest completed live detection
struct LiveQuad {
    bool found;
    CornerSet corners;      // Capture coordinates
    CornerSet normalized;   // 0..1 of the capture size, for the overlay
    float score;
    uint64_t sequence;

    LiveQuad() : found(false), score(0.0f), sequence(0) {}
};

struct SchedulerConfig {
    int interval_ms;      // Minimum spacing between dispatches, 200..400
    int poll_ms;          // Timer thread wake-up period
    int max_dimension;    // Live snapshot long edge

    SchedulerConfig() : interval_ms(300), poll_ms(50), max_dimension(480) {}
};

struct SchedulerStats {
    uint64_t dispatched;
    uint64_t skipped;
    uint64_t completed;
    int max_in_flight;

    SchedulerStats() : dispatched(0), skipped(0), completed(0), max_in_flight(0) {}
};

// Throttled live detection. At most one live request is outstanding; ticks
// while busy or inside the interval are skipped.
class LiveDetectionScheduler {
public:
    typedef std::function<void(const LiveQuad&)> QuadListener;

    LiveDetectionScheduler(DetectionHost& host,
                           std::shared_ptr<FrameSource> source,
                           const SchedulerConfig& config = SchedulerConfig());
    ~LiveDetectionScheduler();

    LiveDetectionScheduler(const LiveDetectionScheduler&) = delete;
    LiveDetectionScheduler& operator=(const LiveDetectionScheduler&) = delete;

    // Own timer thread calling tick() every poll_ms
    void start();

    // Stops the timer and invalidates the outstanding request, if any
    void stop();
    bool isRunning() const;

    // One scheduling decision; true when a request was dispatched.
    // Callable from an external UI-frame timer instead of start().
    bool tick();

    LiveQuad latest() const;
    bool isBusy() const;
    SchedulerStats stats() const;

    // Invoked on the host's threads after each published result
    void setListener(QuadListener listener);

private:
    struct SharedState {
        std::mutex mutex;
        LiveQuad latest;
        QuadListener listener;
        bool busy;
        uint64_t generation;
        uint64_t sequence;
        int in_flight;
        bool has_dispatched;
        std::chrono::steady_clock::time_point last_dispatch;
        SchedulerStats stats;

        SharedState()
            : busy(false), generation(0), sequence(0), in_flight(0), has_dispatched(false) {}
    };

    void run();
    bool skip(SharedState& state);
    static void onResponse(const std::shared_ptr<SharedState>& state, uint64_t generation,
                           const cv::Size& captureSize, const DetectionResponse& response);

    DetectionHost& host_;
    std::shared_ptr<FrameSource> source_;
    SchedulerConfig config_;

    // Outlives the scheduler inside pending host callbacks
    std::shared_ptr<SharedState> shared_;

    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool running_;
    std::thread timer_;
};

#endif // LIVE_SCHEDULER_HPP
