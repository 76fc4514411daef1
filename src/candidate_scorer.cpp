#include "candidate_scorer.hpp"
#include <algorithm>
#include <cmath>

const double CandidateScorer::kCenterWeight = 40.0;
const double CandidateScorer::kSizeWeight = 35.0;
const double CandidateScorer::kAspectWeight = 25.0;

namespace {

// A4/ISO (sqrt 2), US Letter (11 / 8.5) and square
const double kPaperAspects[] = { 1.414, 1.294, 1.0 };

const double kSweetSpotLow = 0.10;
const double kSweetSpotHigh = 0.70;
const double kSweetSpotPeak = 0.35;
const double kAspectTolerance = 0.8;

double clampScore(double value, double maxValue) {
    if (!(value > 0.0)) {
        return 0.0;
    }
    return std::min(value, maxValue);
}

}  // namespace

CandidateScorer::CandidateScorer() {}

CandidateScorer::~CandidateScorer() {}

double CandidateScorer::centerProximityScore(const cv::Point2f& centroid, const cv::Size& imageSize) {
    double cx = imageSize.width / 2.0;
    double cy = imageSize.height / 2.0;
    double halfDiagonal = std::sqrt(cx * cx + cy * cy);
    if (halfDiagonal <= 0.0) {
        return 0.0;
    }

    double dx = centroid.x - cx;
    double dy = centroid.y - cy;
    double d = std::sqrt(dx * dx + dy * dy);

    return clampScore(std::max(0.0, 1.0 - d / halfDiagonal) * kCenterWeight, kCenterWeight);
}

double CandidateScorer::sizeScore(double areaRatio) {
    double r = std::max(0.0, areaRatio);

    if (r >= kSweetSpotLow && r <= kSweetSpotHigh) {
        // Peak at 35% of the frame
        return clampScore((1.0 - std::abs(r - kSweetSpotPeak) / kSweetSpotPeak) * kSizeWeight, kSizeWeight);
    }
    if (r > kSweetSpotHigh) {
        // Near whole-frame blobs are usually the table or the frame border
        return clampScore(std::max(0.0, 1.0 - (r - kSweetSpotHigh) / 0.30) * 10.0, 10.0);
    }
    return clampScore((r / kSweetSpotLow) * 15.0, 15.0);
}

double CandidateScorer::aspectScore(const CornerSet& corners) {
    EdgeLengths edges = measureEdges(corners);
    double w = std::max(edges.top, edges.bottom);
    double h = std::max(edges.left, edges.right);
    if (w <= 0.0 || h <= 0.0) {
        return 0.0;
    }

    double aspect = std::max(w, h) / std::min(w, h);
    double delta = std::abs(aspect - kPaperAspects[0]);
    for (double target : kPaperAspects) {
        delta = std::min(delta, std::abs(aspect - target));
    }

    return clampScore(std::max(0.0, 1.0 - delta / kAspectTolerance) * kAspectWeight, kAspectWeight);
}

ScoredCandidate CandidateScorer::score(const QuadCandidate& candidate, const cv::Size& imageSize) const {
    ScoredCandidate scored;
    scored.candidate = candidate;

    if (candidate.points.size() != 4 || imageSize.area() <= 0) {
        return scored;
    }

    scored.corners = orderCorners(candidate.points);

    double imageArea = static_cast<double>(imageSize.width) * imageSize.height;
    scored.centerScore = centerProximityScore(quadCentroid(candidate.points), imageSize);
    scored.sizeScore = sizeScore(candidate.area / imageArea);
    scored.aspectScore = aspectScore(scored.corners);
    scored.score = scored.centerScore + scored.sizeScore + scored.aspectScore;

    return scored;
}

bool CandidateScorer::selectBest(
    const std::vector<QuadCandidate>& candidates,
    const cv::Size& imageSize,
    ScoredCandidate& best
) const {
    bool found = false;

    for (size_t i = 0; i < candidates.size(); i++) {
        ScoredCandidate scored = score(candidates[i], imageSize);
        scored.index = i;

        if (candidates[i].points.size() != 4) {
            continue;
        }

        // Strictly greater: the first-seen candidate keeps ties
        if (!found || scored.score > best.score) {
            best = scored;
            found = true;
        }
    }

    return found;
}
