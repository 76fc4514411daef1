#include "scan_engine.hpp"
#include <cstdio>
#include <stdexcept>

#include "scan_log.hpp"

ScanEngine::ScanEngine(const ScanEngineConfig& config) : config_(config) {
    detector_ = std::make_unique<DocumentDetector>(config_.detector);
    live_detector_ = std::make_unique<DocumentDetector>(config_.live_detector);
    corrector_ = std::make_unique<PerspectiveCorrector>(config_.min_output_size);
}

ScanEngine::~ScanEngine() {}

DetectionResponse ScanEngine::process(const DetectionRequest& request) {
    if (request.frame.empty()) {
        return DetectionResponse::failed(request.id, SCAN_INVALID_FRAME, "empty frame");
    }

    try {
        switch (request.type) {
            case REQUEST_DETECT:
                return detectAndCrop(request);
            case REQUEST_DETECT_LIVE:
                return detectLive(request);
            case REQUEST_CROP_WITH_CORNERS:
                return cropWithCorners(request);
        }
    } catch (const cv::Exception& e) {
        DOCSCAN_LOGE("OpenCV error in %s: %s", requestTypeName(request.type), e.what());
        return DetectionResponse::failed(request.id, SCAN_PROCESSING_FAILED, std::string("error: ") + e.what());
    }

    return DetectionResponse::failed(request.id, SCAN_INVALID_FRAME, "unknown request type");
}

DetectionResponse ScanEngine::detectAndCrop(const DetectionRequest& request) {
    const Frame& frame = request.frame;

    DetectionResult detection = detector_->detect(frame);
    if (!detection.found) {
        return DetectionResponse::failed(request.id, SCAN_NO_DOCUMENT_FOUND, detection.debug);
    }

    // Capture coordinates -> this frame's raster
    CornerSet frameCorners = detection.corners.scaled(frame.scale);
    CorrectionResult correction = corrector_->correct(frame.raster, frameCorners);
    if (!correction.success) {
        char buf[64];
        snprintf(buf, sizeof(buf), " output=%dx%d", correction.width, correction.height);
        return DetectionResponse::failed(request.id, correction.error, detection.debug + buf);
    }

    DOCSCAN_LOGI("Detect: found=1, frame=%dx%d, page=%dx%d, %s",
        frame.width(), frame.height(), correction.width, correction.height, detection.strategy.c_str());

    return DetectionResponse::found(request.id, correction.image, detection.corners,
                                    detection.score, detection.debug);
}

DetectionResponse ScanEngine::detectLive(const DetectionRequest& request) {
    DetectionResult detection = live_detector_->detect(request.frame);
    if (!detection.found) {
        return DetectionResponse::failed(request.id, SCAN_NO_DOCUMENT_FOUND, detection.debug);
    }
    return DetectionResponse::foundLive(request.id, detection.corners, detection.score, detection.debug);
}

DetectionResponse ScanEngine::cropWithCorners(const DetectionRequest& request) {
    const Frame& frame = request.frame;

    CornerSet frameCorners = request.corners.scaled(frame.scale);
    CorrectionResult correction = corrector_->correct(frame.raster, frameCorners);
    if (!correction.success) {
        char buf[64];
        snprintf(buf, sizeof(buf), "crop output=%dx%d", correction.width, correction.height);
        return DetectionResponse::failed(request.id, correction.error, buf);
    }

    return DetectionResponse::found(request.id, correction.image, request.corners, 0.0f, "crop with corners");
}

std::unique_ptr<ScanEngine> loadScanEngine(const ScanEngineConfig& config) {
    if (config.cv_threads > 0) {
        cv::setNumThreads(config.cv_threads);
    }

    std::unique_ptr<ScanEngine> engine = std::make_unique<ScanEngine>(config);

    if (config.warm_up) {
        // A light page on a dark table touches every strategy once
        Frame frame;
        frame.raster = cv::Mat(240, 320, CV_8UC4, cv::Scalar(30, 30, 30, 255));
        cv::rectangle(frame.raster, cv::Point(80, 40), cv::Point(239, 199), cv::Scalar(235, 235, 235, 255), cv::FILLED);
        frame.sourceSize = frame.raster.size();

        DetectionResponse response = engine->process(DetectionRequest::detect(frame));
        if (response.error == SCAN_PROCESSING_FAILED) {
            throw std::runtime_error("warm-up detection failed: " + response.debug);
        }
        DOCSCAN_LOGI("Runtime loaded, warm-up detected=%d", response.detected() ? 1 : 0);
    }

    return engine;
}
