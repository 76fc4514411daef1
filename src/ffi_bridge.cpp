#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ffi_bridge.h"
#include "capture_session.hpp"
#include "image_enhancer.hpp"
#include "scan_log.hpp"

namespace {

// Session handle passed to the host application
struct FfiSession {
    CaptureSession session;
    std::shared_ptr<LatestFrameSource> live_source;

    std::mutex mutex;
    std::map<int64_t, std::future<DetectionResponse>> pending;
    int64_t next_handle;

    explicit FfiSession(const SessionConfig& config)
        : session(config),
          live_source(std::make_shared<LatestFrameSource>()),
          next_handle(1) {}

    int64_t track(std::future<DetectionResponse> future) {
        std::lock_guard<std::mutex> lk(mutex);
        int64_t handle = next_handle++;
        pending[handle] = std::move(future);
        return handle;
    }

    int64_t trackFailure(ScanError error, const char* debug) {
        std::promise<DetectionResponse> promise;
        promise.set_value(DetectionResponse::failed(0, error, debug));
        return track(promise.get_future());
    }
};

// Result handle: response plus buffers owned for the caller
struct FfiResult {
    DetectionResponse response;
    std::string json;
    std::vector<uint8_t> jpeg;

    explicit FfiResult(const DetectionResponse& r)
        : response(r), json(responseToJson(r)) {}
};

// Helper to append formatted string
void append_fmt(std::string& s, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    s += buf;
}

void corners_to_array(const CornerSet& corners, float* out) {
    std::vector<cv::Point2f> pts = corners.toVector();
    for (size_t i = 0; i < pts.size(); i++) {
        out[i * 2] = pts[i].x;
        out[i * 2 + 1] = pts[i].y;
    }
}

}  // namespace

extern "C" {

// Create a capture session and start loading the runtime
DOCSCAN_EXPORT
void* docscan_session_create(int request_timeout_ms, int live_interval_ms) {
    SessionConfig config;
    if (request_timeout_ms > 0) {
        config.host.request_timeout_ms = request_timeout_ms;
    }
    if (live_interval_ms > 0) {
        config.live.interval_ms = live_interval_ms;
    }

    DOCSCAN_LOGI("Creating capture session");
    FfiSession* s = new FfiSession(config);
    s->session.begin();
    return s;
}

// Destroy session; pending handles resolve with cancelled
DOCSCAN_EXPORT
void docscan_session_destroy(void* session) {
    if (session) {
        DOCSCAN_LOGI("Destroying capture session");
        FfiSession* s = static_cast<FfiSession*>(session);
        s->session.end();
        delete s;
    }
}

// {"type":"ready"}, {"type":"loading"} or {"type":"error","message":...}
DOCSCAN_EXPORT
char* docscan_session_status(void* session) {
    if (!session) {
        return strdup(errorEventJson("Invalid session").c_str());
    }

    FfiSession* s = static_cast<FfiSession*>(session);
    HostState state = s->session.hostState();
    switch (state) {
        case HOST_READY:
            return strdup(responseToJson(DetectionResponse::ready()).c_str());
        case HOST_ERROR:
            return strdup(errorEventJson(s->session.hostError()).c_str());
        case HOST_LOADING:
        case HOST_UNLOADED:
        default: {
            std::string json;
            append_fmt(json, "{\"type\":\"%s\"}", hostStateName(state));
            return strdup(json.c_str());
        }
    }
}

DOCSCAN_EXPORT
int docscan_session_wait_ready(void* session, int timeout_ms) {
    if (!session) return 0;
    return static_cast<FfiSession*>(session)->session.waitUntilReady(timeout_ms) ? 1 : 0;
}

// Replace the frame the live scheduler samples from; returns ScanError
DOCSCAN_EXPORT
int docscan_push_frame(void* session, const uint8_t* image_data, size_t length,
                       int width, int height, int format) {
    if (!session) return SCAN_INVALID_FRAME;

    Frame frame;
    ScanError error = bufferToFrame(image_data, length, width, height, format, frame);
    if (error != SCAN_OK) {
        return error;
    }

    static_cast<FfiSession*>(session)->live_source->push(std::move(frame));
    return SCAN_OK;
}

DOCSCAN_EXPORT
int docscan_live_start(void* session) {
    if (!session) return 0;
    FfiSession* s = static_cast<FfiSession*>(session);
    return s->session.startLive(s->live_source) ? 1 : 0;
}

DOCSCAN_EXPORT
void docscan_live_stop(void* session) {
    if (session) {
        FfiSession* s = static_cast<FfiSession*>(session);
        s->session.stopLive();
        s->live_source->clear();
    }
}

// Latest live quad for the overlay
DOCSCAN_EXPORT
char* docscan_live_quad(void* session) {
    if (!session) {
        return strdup("{\"found\":false}");
    }

    LiveQuad quad = static_cast<FfiSession*>(session)->session.latestQuad();

    std::string json;
    json.reserve(512);
    json += quad.found ? "{\"found\":true," : "{\"found\":false,";
    if (quad.found) {
        json += "\"quad\":";
        json += cornersToJson(quad.corners);
        json += ",\"normalized\":{";
        append_fmt(json, "\"tl\":[%.4f,%.4f],", quad.normalized.topLeft.x, quad.normalized.topLeft.y);
        append_fmt(json, "\"tr\":[%.4f,%.4f],", quad.normalized.topRight.x, quad.normalized.topRight.y);
        append_fmt(json, "\"br\":[%.4f,%.4f],", quad.normalized.bottomRight.x, quad.normalized.bottomRight.y);
        append_fmt(json, "\"bl\":[%.4f,%.4f]},", quad.normalized.bottomLeft.x, quad.normalized.bottomLeft.y);
        append_fmt(json, "\"score\":%.2f,", quad.score);
    }
    append_fmt(json, "\"sequence\":%llu}", static_cast<unsigned long long>(quad.sequence));

    return strdup(json.c_str());
}

DOCSCAN_EXPORT
int64_t docscan_detect(void* session, const uint8_t* image_data, size_t length,
                       int width, int height, int format) {
    if (!session) return 0;
    FfiSession* s = static_cast<FfiSession*>(session);

    Frame frame;
    ScanError error = bufferToFrame(image_data, length, width, height, format, frame);
    if (error != SCAN_OK) {
        return s->trackFailure(error, "invalid buffer");
    }
    return s->track(s->session.detect(std::move(frame)));
}

DOCSCAN_EXPORT
int64_t docscan_crop(void* session, const uint8_t* image_data, size_t length,
                     int width, int height, int format, const float* corners) {
    if (!session) return 0;
    FfiSession* s = static_cast<FfiSession*>(session);

    if (!corners) {
        return s->trackFailure(SCAN_INVALID_FRAME, "missing corners");
    }

    Frame frame;
    ScanError error = bufferToFrame(image_data, length, width, height, format, frame);
    if (error != SCAN_OK) {
        return s->trackFailure(error, "invalid buffer");
    }

    CornerSet quad(cv::Point2f(corners[0], corners[1]), cv::Point2f(corners[2], corners[3]),
                   cv::Point2f(corners[4], corners[5]), cv::Point2f(corners[6], corners[7]));
    return s->track(s->session.cropWithCorners(std::move(frame), quad));
}

// Full-resolution capture cropped with the latest live quad
DOCSCAN_EXPORT
int64_t docscan_capture(void* session, const uint8_t* image_data, size_t length,
                        int width, int height, int format) {
    if (!session) return 0;
    FfiSession* s = static_cast<FfiSession*>(session);

    Frame frame;
    ScanError error = bufferToFrame(image_data, length, width, height, format, frame);
    if (error != SCAN_OK) {
        return s->trackFailure(error, "invalid buffer");
    }
    return s->track(s->session.captureWithLiveQuad(std::move(frame)));
}

DOCSCAN_EXPORT
void docscan_manual_corners(void* session, int width, int height, float* corners_out) {
    if (!corners_out) return;

    float inset = 0.1f;
    if (session) {
        inset = static_cast<FfiSession*>(session)->session.config().manual_inset;
    }
    corners_to_array(CaptureSession::defaultManualCorners(cv::Size(width, height), inset), corners_out);
}

DOCSCAN_EXPORT
void* docscan_take_result(void* session, int64_t handle, int wait_ms) {
    if (!session) return nullptr;
    FfiSession* s = static_cast<FfiSession*>(session);

    std::future<DetectionResponse> future;
    {
        std::lock_guard<std::mutex> lk(s->mutex);
        auto it = s->pending.find(handle);
        if (it == s->pending.end()) {
            return nullptr;
        }
        future = std::move(it->second);
        s->pending.erase(it);
    }

    if (future.wait_for(std::chrono::milliseconds(wait_ms > 0 ? wait_ms : 0)) != std::future_status::ready) {
        std::lock_guard<std::mutex> lk(s->mutex);
        s->pending[handle] = std::move(future);
        return nullptr;
    }

    return new FfiResult(future.get());
}

// Forget a handle whose result is no longer wanted
DOCSCAN_EXPORT
int docscan_discard_result(void* session, int64_t handle) {
    if (!session) return 0;
    FfiSession* s = static_cast<FfiSession*>(session);

    std::lock_guard<std::mutex> lk(s->mutex);
    return s->pending.erase(handle) > 0 ? 1 : 0;
}

DOCSCAN_EXPORT
int docscan_result_detected(void* result) {
    if (!result) return 0;
    return static_cast<FfiResult*>(result)->response.detected() ? 1 : 0;
}

DOCSCAN_EXPORT
uint8_t* docscan_result_image_data(void* result) {
    if (!result) return nullptr;
    cv::Mat& raster = static_cast<FfiResult*>(result)->response.raster;
    return raster.empty() ? nullptr : raster.data;
}

DOCSCAN_EXPORT
int docscan_result_width(void* result) {
    if (!result) return 0;
    return static_cast<FfiResult*>(result)->response.width();
}

DOCSCAN_EXPORT
int docscan_result_height(void* result) {
    if (!result) return 0;
    return static_cast<FfiResult*>(result)->response.height();
}

DOCSCAN_EXPORT
int docscan_result_channels(void* result) {
    if (!result) return 0;
    const cv::Mat& raster = static_cast<FfiResult*>(result)->response.raster;
    return raster.empty() ? 0 : raster.channels();
}

DOCSCAN_EXPORT
int docscan_result_stride(void* result) {
    if (!result) return 0;
    const cv::Mat& raster = static_cast<FfiResult*>(result)->response.raster;
    return raster.empty() ? 0 : static_cast<int>(raster.step);
}

DOCSCAN_EXPORT
int docscan_result_error_code(void* result) {
    if (!result) return SCAN_INVALID_FRAME;
    return static_cast<FfiResult*>(result)->response.error;
}

DOCSCAN_EXPORT
const char* docscan_result_error(void* result) {
    if (!result) return "Invalid result pointer";
    return static_cast<FfiResult*>(result)->response.message.c_str();
}

DOCSCAN_EXPORT
const char* docscan_result_json(void* result) {
    if (!result) return "{}";
    return static_cast<FfiResult*>(result)->json.c_str();
}

// Returns 1 and fills 8 floats when the result carries corners
DOCSCAN_EXPORT
int docscan_result_corners(void* result, float* corners_out) {
    if (!result || !corners_out) return 0;
    const DetectionResponse& response = static_cast<FfiResult*>(result)->response;
    if (!response.detected()) return 0;
    corners_to_array(response.corners, corners_out);
    return 1;
}

DOCSCAN_EXPORT
void* docscan_apply_filter(void* result, int filter, int brightness, int contrast, int sharpness) {
    if (!result || filter < FILTER_NONE || filter > FILTER_BLACK_WHITE) return nullptr;
    const DetectionResponse& source = static_cast<FfiResult*>(result)->response;
    if (source.raster.empty()) return nullptr;

    ImageEnhancer enhancer;
    DetectionResponse finished = source;
    finished.raster = enhancer.finishPage(source.raster, static_cast<PageFilter>(filter),
                                          FilterAdjustments(brightness, contrast, sharpness));
    return new FfiResult(finished);
}

DOCSCAN_EXPORT
int docscan_result_encode_jpeg(void* result, int quality) {
    if (!result) return 0;
    FfiResult* r = static_cast<FfiResult*>(result);
    if (!encodeJpeg(r->response.raster, quality > 0 ? quality : 92, r->jpeg)) {
        r->jpeg.clear();
        return 0;
    }
    return static_cast<int>(r->jpeg.size());
}

DOCSCAN_EXPORT
const uint8_t* docscan_result_jpeg_data(void* result) {
    if (!result) return nullptr;
    FfiResult* r = static_cast<FfiResult*>(result);
    return r->jpeg.empty() ? nullptr : r->jpeg.data();
}

DOCSCAN_EXPORT
void docscan_free_result(void* result) {
    if (result) {
        delete static_cast<FfiResult*>(result);
    }
}

// Free string returned by the JSON functions
DOCSCAN_EXPORT
void docscan_free_string(char* str) {
    if (str) {
        free(str);
    }
}

// Get library version
DOCSCAN_EXPORT
const char* docscan_get_version(void) {
    return "1.0.0";
}

}  // extern "C"
