#include "detection_protocol.hpp"
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace {

// Helper to append formatted string
void appendFmt(std::string& s, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    s += buf;
}

void appendJsonString(std::string& s, const std::string& value) {
    s += "\"";
    for (char c : value) {
        switch (c) {
            case '"': s += "\\\""; break;
            case '\\': s += "\\\\"; break;
            case '\n': s += "\\n"; break;
            case '\r': s += "\\r"; break;
            case '\t': s += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    appendFmt(s, "\\u%04x", static_cast<unsigned char>(c));
                } else {
                    s += c;
                }
                break;
        }
    }
    s += "\"";
}

}  // namespace

DetectionRequest DetectionRequest::detect(Frame frame) {
    DetectionRequest request;
    request.type = REQUEST_DETECT;
    request.frame = std::move(frame);
    return request;
}

DetectionRequest DetectionRequest::detectLive(Frame frame) {
    DetectionRequest request;
    request.type = REQUEST_DETECT_LIVE;
    request.frame = std::move(frame);
    return request;
}

DetectionRequest DetectionRequest::cropWithCorners(Frame frame, const CornerSet& corners) {
    DetectionRequest request;
    request.type = REQUEST_CROP_WITH_CORNERS;
    request.frame = std::move(frame);
    request.corners = corners;
    return request;
}

DetectionResponse DetectionResponse::ready() {
    DetectionResponse response;
    response.type = RESPONSE_READY;
    return response;
}

DetectionResponse DetectionResponse::failed(uint64_t id, ScanError error, const std::string& debug) {
    DetectionResponse response;
    response.request_id = id;
    response.type = RESPONSE_FAILED;
    response.error = error;
    response.message = scanErrorMessage(error);
    response.debug = debug;
    return response;
}

DetectionResponse DetectionResponse::found(uint64_t id, const cv::Mat& raster, const CornerSet& corners,
                                           float score, const std::string& debug) {
    DetectionResponse response;
    response.request_id = id;
    response.type = RESPONSE_FOUND;
    response.raster = raster;
    response.corners = corners;
    response.score = score;
    response.debug = debug;
    return response;
}

DetectionResponse DetectionResponse::foundLive(uint64_t id, const CornerSet& corners,
                                               float score, const std::string& debug) {
    DetectionResponse response;
    response.request_id = id;
    response.type = RESPONSE_FOUND_LIVE;
    response.corners = corners;
    response.score = score;
    response.debug = debug;
    return response;
}

const char* requestTypeName(RequestType type) {
    switch (type) {
        case REQUEST_DETECT: return "detect";
        case REQUEST_DETECT_LIVE: return "detect_live";
        case REQUEST_CROP_WITH_CORNERS: return "crop_with_corners";
    }
    return "unknown";
}

std::string cornersToJson(const CornerSet& corners) {
    std::string json;
    json.reserve(160);
    appendFmt(json, "{\"tl\":[%.2f,%.2f],", corners.topLeft.x, corners.topLeft.y);
    appendFmt(json, "\"tr\":[%.2f,%.2f],", corners.topRight.x, corners.topRight.y);
    appendFmt(json, "\"br\":[%.2f,%.2f],", corners.bottomRight.x, corners.bottomRight.y);
    appendFmt(json, "\"bl\":[%.2f,%.2f]}", corners.bottomLeft.x, corners.bottomLeft.y);
    return json;
}

std::string responseToJson(const DetectionResponse& response) {
    if (response.type == RESPONSE_READY) {
        return "{\"type\":\"ready\"}";
    }

    std::string json;
    json.reserve(512);

    json += "{\"type\":\"result\",";
    appendFmt(json, "\"id\":%llu,", static_cast<unsigned long long>(response.request_id));
    json += response.detected() ? "\"detected\":true," : "\"detected\":false,";

    if (response.type == RESPONSE_FOUND) {
        appendFmt(json, "\"width\":%d,\"height\":%d,", response.width(), response.height());
    }
    if (response.detected()) {
        json += "\"quad\":";
        json += cornersToJson(response.corners);
        json += ",";
        appendFmt(json, "\"score\":%.2f,", response.score);
    } else {
        json += "\"error\":";
        appendJsonString(json, scanErrorName(response.error));
        json += ",\"message\":";
        appendJsonString(json, response.message);
        json += ",";
    }

    json += "\"debug\":";
    appendJsonString(json, response.debug);
    json += "}";

    return json;
}

std::string errorEventJson(const std::string& message) {
    std::string json = "{\"type\":\"error\",\"message\":";
    appendJsonString(json, message);
    json += "}";
    return json;
}
