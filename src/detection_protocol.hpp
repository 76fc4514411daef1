#ifndef DETECTION_PROTOCOL_HPP
#define DETECTION_PROTOCOL_HPP

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <string>

#include "frame.hpp"
#include "quad_geometry.hpp"
#include "scan_error.hpp"

enum RequestType {
    REQUEST_DETECT = 0,             // Detect + rectify
    REQUEST_DETECT_LIVE = 1,        // Detect only, corners for the overlay
    REQUEST_CROP_WITH_CORNERS = 2   // Rectify caller-supplied corners
};

// Caller -> host. The frame is owned by the request; callers move it in.
struct DetectionRequest {
    uint64_t id;           // Assigned by the host on submit
    RequestType type;
    Frame frame;
    CornerSet corners;     // REQUEST_CROP_WITH_CORNERS only, capture coordinates

    DetectionRequest() : id(0), type(REQUEST_DETECT) {}

    static DetectionRequest detect(Frame frame);
    static DetectionRequest detectLive(Frame frame);
    static DetectionRequest cropWithCorners(Frame frame, const CornerSet& corners);
};

enum ResponseType {
    RESPONSE_READY = 0,
    RESPONSE_FAILED = 1,
    RESPONSE_FOUND = 2,        // Corrected raster
    RESPONSE_FOUND_LIVE = 3    // Corners only
};

// Host -> caller
struct DetectionResponse {
    uint64_t request_id;
    ResponseType type;
    ScanError error;
    std::string message;       // Failure reason
    cv::Mat raster;            // RESPONSE_FOUND: corrected page, RGBA
    CornerSet corners;         // Capture coordinates
    float score;
    std::string debug;

    DetectionResponse()
        : request_id(0), type(RESPONSE_FAILED), error(SCAN_OK), score(0.0f) {}

    bool detected() const { return type == RESPONSE_FOUND || type == RESPONSE_FOUND_LIVE; }
    int width() const { return raster.cols; }
    int height() const { return raster.rows; }

    static DetectionResponse ready();
    static DetectionResponse failed(uint64_t id, ScanError error, const std::string& debug = std::string());
    static DetectionResponse found(uint64_t id, const cv::Mat& raster, const CornerSet& corners,
                                   float score, const std::string& debug);
    static DetectionResponse foundLive(uint64_t id, const CornerSet& corners,
                                       float score, const std::string& debug);
};

const char* requestTypeName(RequestType type);

// JSON shapes exchanged with the host application
std::string cornersToJson(const CornerSet& corners);
std::string responseToJson(const DetectionResponse& response);
std::string errorEventJson(const std::string& message);

#endif // DETECTION_PROTOCOL_HPP
