#ifndef CAPTURE_SESSION_HPP
#define CAPTURE_SESSION_HPP

#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "detection_host.hpp"
#include "live_scheduler.hpp"
#include "scan_engine.hpp"

struct SessionConfig {
    ScanEngineConfig engine;
    HostConfig host;
    SchedulerConfig live;
    float manual_inset;   // Fallback crop region inset, fraction of each edge

    SessionConfig() : manual_inset(0.1f) {}
};

// One capture screen's lifetime: owns the background host and the live
// scheduler. Every returned future resolves, at the latest after the host's
// request timeout or when end() cancels it.
class CaptureSession {
public:
    explicit CaptureSession(const SessionConfig& config = SessionConfig());

    // Custom runtime loader, e.g. an engine with different detector settings
    CaptureSession(const SessionConfig& config, EngineLoader loader);

    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Create the host and start loading the runtime
    void begin();

    // Stop live detection, cancel pending requests, tear the host down
    void end();

    bool isActive() const;
    HostState hostState() const;
    std::string hostError() const;
    bool waitUntilReady(int timeoutMs);

    // Takes effect at the next begin()
    void setStateListener(StateListener listener);

    std::future<DetectionResponse> detect(Frame frame);
    std::future<DetectionResponse> cropWithCorners(Frame frame, const CornerSet& corners);

    // Crop the full-resolution frame with the latest live quad, scaled from
    // normalized coordinates. Without a published quad this resolves
    // immediately with SCAN_NO_DOCUMENT_FOUND.
    std::future<DetectionResponse> captureWithLiveQuad(Frame fullFrame);

    bool startLive(std::shared_ptr<FrameSource> source);
    void stopLive();
    bool isLive() const;
    LiveQuad latestQuad() const;
    SchedulerStats liveStats() const;
    void setQuadListener(LiveDetectionScheduler::QuadListener listener);

    // Manual crop starting region
    static CornerSet defaultManualCorners(const cv::Size& size, float inset = 0.1f);

    const SessionConfig& config() const { return config_; }

private:
    static std::future<DetectionResponse> resolved(ScanError error, const std::string& debug);

    SessionConfig config_;
    EngineLoader loader_;
    StateListener state_listener_;
    LiveDetectionScheduler::QuadListener quad_listener_;

    mutable std::mutex mutex_;
    std::shared_ptr<DetectionHost> host_;
    std::unique_ptr<LiveDetectionScheduler> scheduler_;
    LiveQuad last_quad_;   // Kept after stopLive() for the capture button
};

#endif // CAPTURE_SESSION_HPP
