#ifndef PERSPECTIVE_CORRECTOR_HPP
#define PERSPECTIVE_CORRECTOR_HPP

#include <opencv2/opencv.hpp>
#include <vector>

#include "quad_geometry.hpp"
#include "scan_error.hpp"

struct CorrectionResult {
    cv::Mat image;
    bool success;
    ScanError error;
    int width;
    int height;

    CorrectionResult() : success(false), error(SCAN_OK), width(0), height(0) {}
};

class PerspectiveCorrector {
public:
    PerspectiveCorrector();
    explicit PerspectiveCorrector(int minOutputSize);
    ~PerspectiveCorrector();

    // Warp the quad described by corners (source pixel coordinates) onto an
    // axis-aligned rectangle. outputSize (0,0) derives the size from the
    // longest opposite edges.
    CorrectionResult correct(
        const cv::Mat& image,
        const CornerSet& corners,
        cv::Size outputSize = cv::Size(0, 0)
    );

    // round(max(top, bottom)) x round(max(left, right))
    static cv::Size calculateOutputSize(const CornerSet& corners);

    void setMinOutputSize(int size) { min_output_size_ = size; }

private:
    int min_output_size_ = 50;
};

#endif // PERSPECTIVE_CORRECTOR_HPP
