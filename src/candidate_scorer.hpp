#ifndef CANDIDATE_SCORER_HPP
#define CANDIDATE_SCORER_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "quad_geometry.hpp"

// One 4-vertex approximation produced by a binarization strategy.
// Points are in working-resolution coordinates, in contour order.
struct QuadCandidate {
    std::vector<cv::Point2f> points;
    double area;            // Source contour area in working pixels
    std::string strategy;   // Diagnostics only, e.g. "canny[50,150] eps=0.02"

    QuadCandidate() : area(0.0) {}
};

struct ScoredCandidate {
    QuadCandidate candidate;
    CornerSet corners;      // Canonical, working resolution
    double score;           // [0, 100]
    double centerScore;     // [0, 40]
    double sizeScore;       // [0, 35]
    double aspectScore;     // [0, 25]
    size_t index;           // First-seen position, breaks ties

    ScoredCandidate()
        : score(0), centerScore(0), sizeScore(0), aspectScore(0), index(0) {}
};

class CandidateScorer {
public:
    CandidateScorer();
    ~CandidateScorer();

    ScoredCandidate score(const QuadCandidate& candidate, const cv::Size& imageSize) const;

    // Highest total wins, equal totals keep the earlier candidate.
    // Returns false when there is nothing to choose from.
    bool selectBest(
        const std::vector<QuadCandidate>& candidates,
        const cv::Size& imageSize,
        ScoredCandidate& best
    ) const;

    // Individual rubric terms
    static double centerProximityScore(const cv::Point2f& centroid, const cv::Size& imageSize);
    static double sizeScore(double areaRatio);
    static double aspectScore(const CornerSet& corners);

    static const double kCenterWeight;
    static const double kSizeWeight;
    static const double kAspectWeight;
};

#endif // CANDIDATE_SCORER_HPP
