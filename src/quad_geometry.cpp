#include "quad_geometry.hpp"
#include <algorithm>
#include <cmath>

std::vector<cv::Point2f> CornerSet::toVector() const {
    std::vector<cv::Point2f> pts(4);
    pts[0] = topLeft;
    pts[1] = topRight;
    pts[2] = bottomRight;
    pts[3] = bottomLeft;
    return pts;
}

CornerSet CornerSet::scaled(float fx, float fy) const {
    return CornerSet(
        cv::Point2f(topLeft.x * fx, topLeft.y * fy),
        cv::Point2f(topRight.x * fx, topRight.y * fy),
        cv::Point2f(bottomRight.x * fx, bottomRight.y * fy),
        cv::Point2f(bottomLeft.x * fx, bottomLeft.y * fy)
    );
}

bool CornerSet::operator==(const CornerSet& other) const {
    return topLeft == other.topLeft && topRight == other.topRight &&
           bottomRight == other.bottomRight && bottomLeft == other.bottomLeft;
}

float pointDistance(const cv::Point2f& a, const cv::Point2f& b) {
    return static_cast<float>(cv::norm(a - b));
}

cv::Point2f quadCentroid(const std::vector<cv::Point2f>& points) {
    cv::Point2f center(0, 0);
    if (points.empty()) {
        return center;
    }
    for (const auto& pt : points) {
        center += pt;
    }
    center *= 1.0f / static_cast<float>(points.size());
    return center;
}

namespace {

// Strict ordering on (key, y, x) so labeling never depends on input order
struct KeyedPoint {
    float key;
    cv::Point2f pt;
};

bool keyedLess(const KeyedPoint& a, const KeyedPoint& b) {
    if (a.key != b.key) return a.key < b.key;
    if (a.pt.y != b.pt.y) return a.pt.y < b.pt.y;
    return a.pt.x < b.pt.x;
}

std::vector<KeyedPoint> sortedBy(const std::vector<cv::Point2f>& points, bool bySum) {
    std::vector<KeyedPoint> keyed;
    keyed.reserve(points.size());
    for (const auto& pt : points) {
        KeyedPoint kp;
        kp.key = bySum ? (pt.x + pt.y) : (pt.x - pt.y);
        kp.pt = pt;
        keyed.push_back(kp);
    }
    std::sort(keyed.begin(), keyed.end(), keyedLess);
    return keyed;
}

CornerSet orderByAngle(const std::vector<cv::Point2f>& points) {
    cv::Point2f center = quadCentroid(points);

    std::vector<cv::Point2f> sorted = points;
    // Image y axis points down, so increasing atan2 walks clockwise on screen
    std::sort(sorted.begin(), sorted.end(), [&center](const cv::Point2f& a, const cv::Point2f& b) {
        double angA = std::atan2(a.y - center.y, a.x - center.x);
        double angB = std::atan2(b.y - center.y, b.x - center.x);
        if (angA != angB) return angA < angB;
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });

    // Rotate so the point closest to the top-left (min x+y) comes first
    size_t start = 0;
    KeyedPoint best;
    best.key = sorted[0].x + sorted[0].y;
    best.pt = sorted[0];
    for (size_t i = 1; i < sorted.size(); i++) {
        KeyedPoint kp;
        kp.key = sorted[i].x + sorted[i].y;
        kp.pt = sorted[i];
        if (keyedLess(kp, best)) {
            best = kp;
            start = i;
        }
    }

    return CornerSet(sorted[start], sorted[(start + 1) % 4],
                     sorted[(start + 2) % 4], sorted[(start + 3) % 4]);
}

}  // namespace

CornerSet orderCorners(const std::vector<cv::Point2f>& points) {
    if (points.size() != 4) {
        return CornerSet();
    }

    std::vector<KeyedPoint> bySum = sortedBy(points, true);
    std::vector<KeyedPoint> byDiff = sortedBy(points, false);

    CornerSet ordered(bySum[0].pt, byDiff[3].pt, bySum[3].pt, byDiff[0].pt);

    // Every input point must be used exactly once
    std::vector<cv::Point2f> labeled = ordered.toVector();
    bool distinct = true;
    for (int i = 0; i < 4 && distinct; i++) {
        for (int j = i + 1; j < 4; j++) {
            if (labeled[i] == labeled[j]) {
                distinct = false;
                break;
            }
        }
    }

    if (distinct && isConvexQuad(ordered)) {
        return ordered;
    }

    return orderByAngle(points);
}

double interiorAngle(const cv::Point2f& prev, const cv::Point2f& vertex, const cv::Point2f& next) {
    double v1x = prev.x - vertex.x;
    double v1y = prev.y - vertex.y;
    double v2x = next.x - vertex.x;
    double v2y = next.y - vertex.y;

    double mag1 = std::sqrt(v1x * v1x + v1y * v1y);
    double mag2 = std::sqrt(v2x * v2x + v2y * v2y);
    if (mag1 < 1.0 || mag2 < 1.0) {
        return -1.0;
    }

    double cosine = (v1x * v2x + v1y * v2y) / (mag1 * mag2);
    cosine = std::max(-1.0, std::min(1.0, cosine));
    return std::acos(cosine) * 180.0 / CV_PI;
}

bool hasReasonableAngles(const std::vector<cv::Point2f>& quad, double minDegrees, double maxDegrees) {
    if (quad.size() != 4) {
        return false;
    }

    for (int i = 0; i < 4; i++) {
        const cv::Point2f& prev = quad[(i + 3) % 4];
        const cv::Point2f& vertex = quad[i];
        const cv::Point2f& next = quad[(i + 1) % 4];

        double angle = interiorAngle(prev, vertex, next);
        if (angle < 0 || angle < minDegrees || angle > maxDegrees) {
            return false;
        }
    }
    return true;
}

bool isConvexQuad(const CornerSet& corners) {
    std::vector<cv::Point2f> pts = corners.toVector();

    // Cross products of consecutive edges must all share one sign
    int sign = 0;
    for (int i = 0; i < 4; i++) {
        const cv::Point2f& a = pts[i];
        const cv::Point2f& b = pts[(i + 1) % 4];
        const cv::Point2f& c = pts[(i + 2) % 4];
        double cross = static_cast<double>(b.x - a.x) * (c.y - b.y) -
                       static_cast<double>(b.y - a.y) * (c.x - b.x);
        if (std::abs(cross) < 1e-9) {
            return false;
        }
        int s = cross > 0 ? 1 : -1;
        if (sign == 0) {
            sign = s;
        } else if (s != sign) {
            return false;
        }
    }
    return true;
}

EdgeLengths measureEdges(const CornerSet& corners) {
    EdgeLengths edges;
    edges.top = pointDistance(corners.topRight, corners.topLeft);
    edges.bottom = pointDistance(corners.bottomRight, corners.bottomLeft);
    edges.left = pointDistance(corners.bottomLeft, corners.topLeft);
    edges.right = pointDistance(corners.bottomRight, corners.topRight);
    return edges;
}

double quadArea(const CornerSet& corners) {
    return cv::contourArea(corners.toVector());
}
