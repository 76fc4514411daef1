#ifndef DOCUMENT_DETECTOR_HPP
#define DOCUMENT_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "candidate_scorer.hpp"
#include "frame.hpp"
#include "quad_geometry.hpp"

struct CannyPair {
    double low;
    double high;
};

struct AdaptiveParams {
    int blockSize;
    double C;
};

struct DetectorConfig {
    int working_max_dimension;        // Long edge of the analysis copy
    float min_area_ratio;             // Contours below this share of the frame are ignored
    size_t max_contours;              // Largest contours examined per strategy
    bool fail_fast;                   // Stop after the first strategy that yields a candidate
    bool refine_corners;              // Sub-pixel refinement on the full resolution frame
    std::vector<CannyPair> canny_thresholds;
    std::vector<AdaptiveParams> adaptive_params;
    std::vector<double> epsilons;     // approxPolyDP tolerance as a fraction of perimeter
    CannyPair heavy_blur_canny;
    double min_angle;
    double max_angle;

    DetectorConfig() {
        working_max_dimension = 640;
        min_area_ratio = 0.04f;
        max_contours = 10;
        fail_fast = false;
        refine_corners = true;
        canny_thresholds = { {50, 150}, {30, 100}, {75, 200} };
        adaptive_params = { {15, 5}, {25, 8}, {11, 3} };
        epsilons = { 0.02, 0.03, 0.04, 0.05, 0.06, 0.08 };
        heavy_blur_canny = {40, 120};
        min_angle = 45.0;
        max_angle = 135.0;
    }
};

struct DetectionResult {
    bool found;
    CornerSet corners;        // Full resolution of the analysed frame's capture
    float score;
    std::string strategy;
    int candidate_count;
    float working_scale;      // Working copy size / analysed frame size
    std::string debug;

    DetectionResult() : found(false), score(0.0f), candidate_count(0), working_scale(1.0f) {}
};

class DocumentDetector {
public:
    DocumentDetector();
    explicit DocumentDetector(const DetectorConfig& config);
    ~DocumentDetector();

    // Downscale, generate, score, canonicalize. Corners are reported in the
    // coordinates of the frame's original capture.
    DetectionResult detect(const Frame& frame);

    // All candidates over a blurred grayscale working raster
    std::vector<QuadCandidate> generateCandidates(const cv::Mat& gray, const cv::Mat& blurred);

    // Contours -> 4-vertex convex candidates passing the angle filter
    std::vector<QuadCandidate> findQuads(const cv::Mat& binary, const std::string& strategy);

    const DetectorConfig& config() const { return config_; }

private:
    cv::Mat toGray(const cv::Mat& rgba);
    cv::Mat cannyStrategy(const cv::Mat& blurred, const CannyPair& thresholds, int kernelSize);
    cv::Mat adaptiveStrategy(const cv::Mat& blurred, const AdaptiveParams& params);
    cv::Mat otsuStrategy(const cv::Mat& blurred, bool inverted);
    CornerSet refineCorners(const Frame& frame, const CornerSet& corners, float workingScale);

    DetectorConfig config_;
    CandidateScorer scorer_;
};

#endif // DOCUMENT_DETECTOR_HPP
