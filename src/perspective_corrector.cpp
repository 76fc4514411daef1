#include "perspective_corrector.hpp"
#include <algorithm>
#include <cmath>

PerspectiveCorrector::PerspectiveCorrector() {}

PerspectiveCorrector::PerspectiveCorrector(int minOutputSize) : min_output_size_(minOutputSize) {}

PerspectiveCorrector::~PerspectiveCorrector() {}

CorrectionResult PerspectiveCorrector::correct(
    const cv::Mat& image,
    const CornerSet& corners,
    cv::Size outputSize
) {
    CorrectionResult result;

    if (image.empty()) {
        result.error = SCAN_INVALID_FRAME;
        return result;
    }

    std::vector<cv::Point2f> src = corners.toVector();
    for (const auto& pt : src) {
        if (!std::isfinite(pt.x) || !std::isfinite(pt.y)) {
            result.error = SCAN_INVALID_FRAME;
            return result;
        }
    }

    // Calculate output size if not specified
    if (outputSize.width <= 0 || outputSize.height <= 0) {
        outputSize = calculateOutputSize(corners);
    }

    if (outputSize.width < min_output_size_ || outputSize.height < min_output_size_) {
        result.error = SCAN_FRAME_TOO_SMALL;
        result.width = outputSize.width;
        result.height = outputSize.height;
        return result;
    }

    // Destination corners: TL, TR, BR, BL
    float w = static_cast<float>(outputSize.width);
    float h = static_cast<float>(outputSize.height);
    std::vector<cv::Point2f> dst = {
        cv::Point2f(0, 0),
        cv::Point2f(w, 0),
        cv::Point2f(w, h),
        cv::Point2f(0, h)
    };

    // Calculate perspective transform matrix
    cv::Mat M = cv::getPerspectiveTransform(src, dst);

    // Apply transformation
    cv::warpPerspective(image, result.image, M, outputSize,
                        cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));

    result.success = true;
    result.width = outputSize.width;
    result.height = outputSize.height;

    return result;
}

cv::Size PerspectiveCorrector::calculateOutputSize(const CornerSet& corners) {
    EdgeLengths edges = measureEdges(corners);

    // Longest opposite edges keep the full resolution of the nearer side
    float width = std::max(edges.top, edges.bottom);
    float height = std::max(edges.left, edges.right);

    return cv::Size(static_cast<int>(std::lround(width)), static_cast<int>(std::lround(height)));
}
