#include "document_detector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

#include "scan_log.hpp"

namespace {

std::string formatTag(const char* fmt, double a, double b) {
    char buf[64];
    snprintf(buf, sizeof(buf), fmt, a, b);
    return std::string(buf);
}

struct ContourInfo {
    size_t index;
    double area;
};

}  // namespace

DocumentDetector::DocumentDetector() {}

DocumentDetector::DocumentDetector(const DetectorConfig& config) : config_(config) {}

DocumentDetector::~DocumentDetector() {}

DetectionResult DocumentDetector::detect(const Frame& frame) {
    DetectionResult result;

    if (frame.empty()) {
        result.debug = "empty frame";
        return result;
    }

    // Resize for faster processing
    Frame working;
    if (downscaleFrame(frame, config_.working_max_dimension, working) != SCAN_OK) {
        result.debug = "downscale failed";
        return result;
    }
    float workingScale = frame.scale > 0.0f ? working.scale / frame.scale : 1.0f;
    result.working_scale = workingScale;

    cv::Mat gray = toGray(working.raster);
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);

    std::vector<QuadCandidate> candidates = generateCandidates(gray, blurred);
    result.candidate_count = static_cast<int>(candidates.size());

    ScoredCandidate best;
    if (!scorer_.selectBest(candidates, blurred.size(), best)) {
        result.debug = "no quad found";
        DOCSCAN_LOGD("Detection: no quad in %dx%d working frame", working.width(), working.height());
        return result;
    }

    // Working copy -> analysed frame
    CornerSet frameCorners = best.corners.scaled(1.0f / workingScale);
    if (config_.refine_corners) {
        frameCorners = refineCorners(frame, frameCorners, workingScale);
    }

    // Analysed frame -> original capture
    result.corners = frameCorners.scaled(frame.scale > 0.0f ? 1.0f / frame.scale : 1.0f);
    result.found = true;
    result.score = static_cast<float>(best.score);
    result.strategy = best.candidate.strategy;

    char buf[160];
    snprintf(buf, sizeof(buf), " score=%.1f (center=%.1f size=%.1f aspect=%.1f) area=%d candidates=%d",
             best.score, best.centerScore, best.sizeScore, best.aspectScore,
             static_cast<int>(std::lround(best.candidate.area)), result.candidate_count);
    result.debug = best.candidate.strategy + buf;

    DOCSCAN_LOGD("Detection: %s", result.debug.c_str());
    return result;
}

cv::Mat DocumentDetector::toGray(const cv::Mat& input) {
    cv::Mat gray;
    if (input.channels() == 4) {
        cv::cvtColor(input, gray, cv::COLOR_RGBA2GRAY);
    } else if (input.channels() == 3) {
        cv::cvtColor(input, gray, cv::COLOR_RGB2GRAY);
    } else {
        gray = input.clone();
    }
    return gray;
}

std::vector<QuadCandidate> DocumentDetector::generateCandidates(const cv::Mat& gray, const cv::Mat& blurred) {
    std::vector<QuadCandidate> all;

    // Returns true when fail-fast mode should stop here
    auto collect = [this, &all](const cv::Mat& binary, const std::string& tag) {
        std::vector<QuadCandidate> quads = findQuads(binary, tag);
        all.insert(all.end(), quads.begin(), quads.end());
        return config_.fail_fast && !quads.empty();
    };

    // Strategy 1: Canny edges at several threshold pairs
    for (const auto& pair : config_.canny_thresholds) {
        cv::Mat edges = cannyStrategy(blurred, pair, 3);
        if (collect(edges, formatTag("canny[%.0f,%.0f]", pair.low, pair.high))) {
            return all;
        }
    }

    // Strategy 2: Adaptive threshold (local contrast)
    for (const auto& params : config_.adaptive_params) {
        cv::Mat thresh = adaptiveStrategy(blurred, params);
        if (collect(thresh, formatTag("adaptive[b=%.0f,C=%.0f]", params.blockSize, params.C))) {
            return all;
        }
    }

    // Strategy 3: Otsu global threshold, light-on-dark and dark-on-light
    if (collect(otsuStrategy(blurred, true), "otsu_inv")) {
        return all;
    }
    if (collect(otsuStrategy(blurred, false), "otsu")) {
        return all;
    }

    // Strategy 4: Strong blur + Canny for textured backgrounds
    cv::Mat heavyBlur;
    cv::GaussianBlur(gray, heavyBlur, cv::Size(11, 11), 0);
    cv::Mat edges = cannyStrategy(heavyBlur, config_.heavy_blur_canny, 5);
    collect(edges, formatTag("heavy_blur_canny[%.0f,%.0f]", config_.heavy_blur_canny.low, config_.heavy_blur_canny.high));

    return all;
}

cv::Mat DocumentDetector::cannyStrategy(const cv::Mat& blurred, const CannyPair& thresholds, int kernelSize) {
    cv::Mat edges;
    cv::Canny(blurred, edges, thresholds.low, thresholds.high);

    // Close to bridge broken edges, then dilate to fill remaining gaps
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernelSize, kernelSize));
    cv::morphologyEx(edges, edges, cv::MORPH_CLOSE, kernel);
    cv::dilate(edges, edges, kernel);

    return edges;
}

cv::Mat DocumentDetector::adaptiveStrategy(const cv::Mat& blurred, const AdaptiveParams& params) {
    int blockSize = std::max(3, params.blockSize);
    if (blockSize % 2 == 0) {
        blockSize++;
    }

    cv::Mat thresh;
    cv::adaptiveThreshold(blurred, thresh, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY_INV, blockSize, params.C);

    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
    cv::morphologyEx(thresh, thresh, cv::MORPH_CLOSE, kernel);
    cv::dilate(thresh, thresh, kernel);

    return thresh;
}

cv::Mat DocumentDetector::otsuStrategy(const cv::Mat& blurred, bool inverted) {
    cv::Mat otsu;
    int type = (inverted ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY) | cv::THRESH_OTSU;
    cv::threshold(blurred, otsu, 0, 255, type);

    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
    cv::morphologyEx(otsu, otsu, cv::MORPH_CLOSE, kernel);

    return otsu;
}

std::vector<QuadCandidate> DocumentDetector::findQuads(const cv::Mat& binary, const std::string& strategy) {
    std::vector<QuadCandidate> quads;

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours.empty()) {
        return quads;
    }

    double minArea = static_cast<double>(binary.cols) * binary.rows * config_.min_area_ratio;

    std::vector<ContourInfo> infos;
    for (size_t i = 0; i < contours.size(); i++) {
        double area = cv::contourArea(contours[i]);
        if (area >= minArea) {
            infos.push_back({i, area});
        }
    }

    // Largest first; stable so equal areas keep contour order
    std::stable_sort(infos.begin(), infos.end(), [](const ContourInfo& a, const ContourInfo& b) {
        return a.area > b.area;
    });
    if (infos.size() > config_.max_contours) {
        infos.resize(config_.max_contours);
    }

    for (const auto& info : infos) {
        const std::vector<cv::Point>& contour = contours[info.index];
        double perimeter = cv::arcLength(contour, true);

        for (double eps : config_.epsilons) {
            std::vector<cv::Point> approx;
            cv::approxPolyDP(contour, approx, eps * perimeter, true);

            if (approx.size() != 4 || !cv::isContourConvex(approx)) {
                continue;
            }

            std::vector<cv::Point2f> pts;
            pts.reserve(4);
            for (const auto& pt : approx) {
                pts.push_back(cv::Point2f(static_cast<float>(pt.x), static_cast<float>(pt.y)));
            }

            // Rejects slivers that pass the vertex count and convexity checks
            if (!hasReasonableAngles(pts, config_.min_angle, config_.max_angle)) {
                continue;
            }

            char epsTag[32];
            snprintf(epsTag, sizeof(epsTag), " eps=%.2f", eps);

            QuadCandidate candidate;
            candidate.points = pts;
            candidate.area = info.area;
            candidate.strategy = strategy + epsTag;
            quads.push_back(candidate);
            break;
        }
    }

    return quads;
}

CornerSet DocumentDetector::refineCorners(const Frame& frame, const CornerSet& corners, float workingScale) {
    cv::Mat gray = toGray(frame.raster);

    // Search radius covers a couple of working pixels at full resolution
    float scale = workingScale > 0.0f ? workingScale : 1.0f;
    int half = static_cast<int>(std::ceil(3.0f / scale));
    half = std::max(5, std::min(15, half));

    std::vector<cv::Point2f> pts = corners.toVector();
    for (const auto& pt : pts) {
        if (pt.x < 0 || pt.y < 0 || pt.x > gray.cols - 1 || pt.y > gray.rows - 1) {
            return corners;
        }
    }

    std::vector<cv::Point2f> refined = pts;
    cv::cornerSubPix(gray, refined, cv::Size(half, half), cv::Size(-1, -1),
                     cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, 30, 0.01));

    float maxShift = static_cast<float>(half) * 1.5f;
    for (size_t i = 0; i < refined.size(); i++) {
        if (!std::isfinite(refined[i].x) || !std::isfinite(refined[i].y) ||
            pointDistance(refined[i], pts[i]) > maxShift) {
            return corners;
        }
    }

    CornerSet result(refined[0], refined[1], refined[2], refined[3]);
    if (!isConvexQuad(result) ||
        !hasReasonableAngles(result.toVector(), config_.min_angle, config_.max_angle)) {
        return corners;
    }

    return result;
}
