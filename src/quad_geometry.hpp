#ifndef QUAD_GEOMETRY_HPP
#define QUAD_GEOMETRY_HPP

#include <opencv2/opencv.hpp>
#include <vector>

// Canonical document corners. In TL, TR, BR, BL order the points form a
// simple convex polygon.
struct CornerSet {
    cv::Point2f topLeft;
    cv::Point2f topRight;
    cv::Point2f bottomRight;
    cv::Point2f bottomLeft;

    CornerSet() {}
    CornerSet(const cv::Point2f& tl, const cv::Point2f& tr,
              const cv::Point2f& br, const cv::Point2f& bl)
        : topLeft(tl), topRight(tr), bottomRight(br), bottomLeft(bl) {}

    // TL, TR, BR, BL
    std::vector<cv::Point2f> toVector() const;

    // Multiply every coordinate (e.g. 1/scale to reach full resolution)
    CornerSet scaled(float fx, float fy) const;
    CornerSet scaled(float factor) const { return scaled(factor, factor); }

    bool operator==(const CornerSet& other) const;
    bool operator!=(const CornerSet& other) const { return !(*this == other); }
};

struct EdgeLengths {
    float top;
    float bottom;
    float left;
    float right;

    EdgeLengths() : top(0), bottom(0), left(0), right(0) {}
};

// Sum/difference labeling: min(x+y) = TL, max(x+y) = BR, min(x-y) = BL,
// max(x-y) = TR. When that labeling collapses two corners onto one point or
// yields a non-convex ordering (rotations around 45 degrees), falls back to
// clockwise order about the centroid starting at min(x+y).
// Requires exactly 4 points; returns a default CornerSet otherwise.
CornerSet orderCorners(const std::vector<cv::Point2f>& points);

// Angle at vertex between edges to prev and next, in degrees.
// Returns -1 when either edge is shorter than 1px.
double interiorAngle(const cv::Point2f& prev, const cv::Point2f& vertex, const cv::Point2f& next);

// All four vertex angles inside [minDegrees, maxDegrees]; points taken in
// polygon order.
bool hasReasonableAngles(const std::vector<cv::Point2f>& quad,
                         double minDegrees = 45.0, double maxDegrees = 135.0);

bool isConvexQuad(const CornerSet& corners);

EdgeLengths measureEdges(const CornerSet& corners);

cv::Point2f quadCentroid(const std::vector<cv::Point2f>& points);

double quadArea(const CornerSet& corners);

float pointDistance(const cv::Point2f& a, const cv::Point2f& b);

#endif // QUAD_GEOMETRY_HPP
