#ifndef SCAN_ENGINE_HPP
#define SCAN_ENGINE_HPP

#include <opencv2/opencv.hpp>
#include <memory>

#include "detection_protocol.hpp"
#include "document_detector.hpp"
#include "perspective_corrector.hpp"

struct ScanEngineConfig {
    DetectorConfig detector;        // One-shot: collect-all at 640px
    DetectorConfig live_detector;   // Live: fail-fast at 480px
    int min_output_size;            // Rectified pages below this are rejected
    int cv_threads;                 // 0 keeps OpenCV's default
    bool warm_up;                   // Run one detection while loading

    ScanEngineConfig() {
        live_detector.working_max_dimension = 480;
        live_detector.fail_fast = true;
        min_output_size = 50;
        cv_threads = 0;
        warm_up = true;
    }
};

// The image-processing runtime owned by the background host. Handles one
// request at a time; never throws across process().
class ScanEngine {
public:
    explicit ScanEngine(const ScanEngineConfig& config = ScanEngineConfig());
    virtual ~ScanEngine();

    virtual DetectionResponse process(const DetectionRequest& request);

    const ScanEngineConfig& config() const { return config_; }

protected:
    DetectionResponse detectAndCrop(const DetectionRequest& request);
    DetectionResponse detectLive(const DetectionRequest& request);
    DetectionResponse cropWithCorners(const DetectionRequest& request);

private:
    ScanEngineConfig config_;
    std::unique_ptr<DocumentDetector> detector_;
    std::unique_ptr<DocumentDetector> live_detector_;
    std::unique_ptr<PerspectiveCorrector> corrector_;
};

// Default runtime loader used by the host: configures OpenCV and warms the
// pipeline up. Throws on failure; the host turns that into its error state.
std::unique_ptr<ScanEngine> loadScanEngine(const ScanEngineConfig& config = ScanEngineConfig());

#endif // SCAN_ENGINE_HPP
