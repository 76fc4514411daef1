#ifndef FRAME_HPP
#define FRAME_HPP

#include <opencv2/opencv.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "scan_error.hpp"

// Input buffer layouts accepted by bufferToFrame
enum PixelFormat {
    FORMAT_BGRA = 0,
    FORMAT_BGR = 1,
    FORMAT_RGB = 2,
    FORMAT_RGBA = 3
};

// RGBA raster plus its relation to the original capture.
// scale = raster size / capture size, so a raster point p maps back to the
// capture as p / scale.
struct Frame {
    cv::Mat raster;        // CV_8UC4, RGBA
    float scale;
    cv::Size sourceSize;   // Original capture dimensions

    Frame() : scale(1.0f) {}

    int width() const { return raster.cols; }
    int height() const { return raster.rows; }
    bool empty() const { return raster.empty() || raster.cols <= 0 || raster.rows <= 0; }
};

int channelsForFormat(int format);

// Validate and copy a caller buffer into an RGBA frame.
// Fails with SCAN_INVALID_FRAME on null data, non-positive dimensions,
// an unknown format or length != width * height * channels.
ScanError bufferToFrame(
    const uint8_t* data,
    size_t length,
    int width,
    int height,
    int format,
    Frame& out
);

// Wrap an existing image (1, 3 or 4 channels, BGR order for 3/4 like
// cv::imread) as a full-resolution frame.
ScanError matToFrame(const cv::Mat& image, Frame& out);

// Bounded-resolution copy: scale = min(1, maxDimension / longEdge).
// The result's scale composes with the source's scale.
ScanError downscaleFrame(const Frame& source, int maxDimension, Frame& out);

// Coordinate mapping between a frame and its original capture
cv::Point2f frameToSource(const Frame& frame, const cv::Point2f& pt);
cv::Point2f sourceToFrame(const Frame& frame, const cv::Point2f& pt);

// Encode an RGBA raster as JPEG for the PDF assembly collaborator
bool encodeJpeg(const cv::Mat& rgba, int quality, std::vector<uint8_t>& out);

#endif // FRAME_HPP
