#include "frame.hpp"
#include <algorithm>
#include <cmath>

int channelsForFormat(int format) {
    switch (format) {
        case FORMAT_BGRA:
        case FORMAT_RGBA:
            return 4;
        case FORMAT_BGR:
        case FORMAT_RGB:
            return 3;
        default:
            return 0;
    }
}

ScanError bufferToFrame(
    const uint8_t* data,
    size_t length,
    int width,
    int height,
    int format,
    Frame& out
) {
    int channels = channelsForFormat(format);
    if (!data || width <= 0 || height <= 0 || channels == 0) {
        return SCAN_INVALID_FRAME;
    }

    size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * channels;
    if (length != expected) {
        return SCAN_INVALID_FRAME;
    }

    // The wrapped Mat borrows the caller buffer; every branch copies out of it
    cv::Mat rgba;
    switch (format) {
        case FORMAT_BGRA:
            cv::cvtColor(cv::Mat(height, width, CV_8UC4, const_cast<uint8_t*>(data)), rgba, cv::COLOR_BGRA2RGBA);
            break;
        case FORMAT_BGR:
            cv::cvtColor(cv::Mat(height, width, CV_8UC3, const_cast<uint8_t*>(data)), rgba, cv::COLOR_BGR2RGBA);
            break;
        case FORMAT_RGB:
            cv::cvtColor(cv::Mat(height, width, CV_8UC3, const_cast<uint8_t*>(data)), rgba, cv::COLOR_RGB2RGBA);
            break;
        case FORMAT_RGBA:
        default:
            rgba = cv::Mat(height, width, CV_8UC4, const_cast<uint8_t*>(data)).clone();
            break;
    }

    out.raster = rgba;
    out.scale = 1.0f;
    out.sourceSize = cv::Size(width, height);
    return SCAN_OK;
}

ScanError matToFrame(const cv::Mat& image, Frame& out) {
    if (image.empty() || image.depth() != CV_8U) {
        return SCAN_INVALID_FRAME;
    }

    cv::Mat rgba;
    if (image.channels() == 4) {
        cv::cvtColor(image, rgba, cv::COLOR_BGRA2RGBA);
    } else if (image.channels() == 3) {
        cv::cvtColor(image, rgba, cv::COLOR_BGR2RGBA);
    } else if (image.channels() == 1) {
        cv::cvtColor(image, rgba, cv::COLOR_GRAY2RGBA);
    } else {
        return SCAN_INVALID_FRAME;
    }

    out.raster = rgba;
    out.scale = 1.0f;
    out.sourceSize = image.size();
    return SCAN_OK;
}

ScanError downscaleFrame(const Frame& source, int maxDimension, Frame& out) {
    if (source.empty() || maxDimension <= 0) {
        return SCAN_INVALID_FRAME;
    }

    int longEdge = std::max(source.width(), source.height());
    float scale = std::min(1.0f, static_cast<float>(maxDimension) / longEdge);

    Frame result;
    if (scale >= 1.0f) {
        result.raster = source.raster.clone();
    } else {
        int w = std::max(1, static_cast<int>(std::lround(source.width() * scale)));
        int h = std::max(1, static_cast<int>(std::lround(source.height() * scale)));
        // Area interpolation avoids moire on thin document edges
        cv::resize(source.raster, result.raster, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    }

    result.scale = source.scale * scale;
    result.sourceSize = source.sourceSize.area() > 0 ? source.sourceSize : source.raster.size();

    out = result;
    return SCAN_OK;
}

cv::Point2f frameToSource(const Frame& frame, const cv::Point2f& pt) {
    if (frame.scale <= 0.0f) {
        return pt;
    }
    return cv::Point2f(pt.x / frame.scale, pt.y / frame.scale);
}

cv::Point2f sourceToFrame(const Frame& frame, const cv::Point2f& pt) {
    return cv::Point2f(pt.x * frame.scale, pt.y * frame.scale);
}

bool encodeJpeg(const cv::Mat& rgba, int quality, std::vector<uint8_t>& out) {
    if (rgba.empty()) {
        return false;
    }

    cv::Mat bgr;
    if (rgba.channels() == 4) {
        cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);
    } else if (rgba.channels() == 3) {
        cv::cvtColor(rgba, bgr, cv::COLOR_RGB2BGR);
    } else {
        bgr = rgba;
    }

    std::vector<int> params = { cv::IMWRITE_JPEG_QUALITY, std::max(1, std::min(100, quality)) };
    std::vector<uchar> buffer;
    if (!cv::imencode(".jpg", bgr, buffer, params)) {
        return false;
    }

    out.assign(buffer.begin(), buffer.end());
    return true;
}
