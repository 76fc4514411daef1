#include "image_enhancer.hpp"
#include <algorithm>
#include <cmath>

namespace {

uchar clampByte(float v) {
    return static_cast<uchar>(std::lround(std::max(0.0f, std::min(255.0f, v))));
}

}  // namespace

ImageEnhancer::ImageEnhancer() {}

ImageEnhancer::~ImageEnhancer() {}

cv::Mat ImageEnhancer::finishPage(const cv::Mat& input, PageFilter filter, const FilterAdjustments& adjustments) {
    if (input.empty()) {
        return input;
    }

    cv::Mat result;
    switch (filter) {
        case FILTER_MAGIC_COLOR:
            result = magicColor(input, adjustments.brightness, adjustments.contrast);
            break;
        case FILTER_ORIGINAL:
            result = adjustOriginal(input, adjustments.brightness, adjustments.contrast);
            break;
        case FILTER_GRAYSCALE:
            result = grayscale(input, adjustments.brightness);
            break;
        case FILTER_BLACK_WHITE:
            result = blackWhite(input, adjustments.brightness);
            break;
        case FILTER_NONE:
        default:
            return input.clone();
    }

    if (adjustments.sharpness > 0) {
        result = sharpen(result, adjustments.sharpness / 100.0f);
    }

    return result;
}

float ImageEnhancer::contrastCurve(float value, float exponent) {
    if (exponent == 1.0f) {
        return value;
    }
    if (value < 0.5f) {
        return 0.5f * std::pow(2.0f * value, exponent);
    }
    return 1.0f - 0.5f * std::pow(2.0f * (1.0f - value), exponent);
}

int ImageEnhancer::percentile(const std::vector<uchar>& sorted, double fraction, int fallback) {
    if (sorted.empty()) {
        return fallback;
    }
    size_t idx = static_cast<size_t>(std::floor(sorted.size() * fraction));
    idx = std::min(idx, sorted.size() - 1);
    return sorted[idx];
}

cv::Mat ImageEnhancer::magicColor(const cv::Mat& input, int brightness, int contrast) {
    std::vector<cv::Mat> channels;
    cv::split(input, channels);

    size_t total = input.total();
    size_t step = std::max<size_t>(1, total / 10000);
    float exponent = 1.0f + contrast / 100.0f;

    // Color channels only; alpha passes through
    int colorChannels = std::min(3, input.channels());
    for (int ch = 0; ch < colorChannels; ch++) {
        cv::Mat plane = channels[ch].isContinuous() ? channels[ch] : channels[ch].clone();

        std::vector<uchar> samples;
        samples.reserve(total / step + 1);
        const uchar* data = plane.ptr<uchar>();
        for (size_t i = 0; i < total; i += step) {
            samples.push_back(data[i]);
        }
        std::sort(samples.begin(), samples.end());

        int low = percentile(samples, 0.02, 0);
        int high = percentile(samples, 0.98, 255);
        float range = static_cast<float>(std::max(1, high - low));

        cv::Mat lut(1, 256, CV_8U);
        for (int v = 0; v < 256; v++) {
            float value = (v - low) / range * 255.0f;
            value += brightness * 0.3f;
            value = std::max(0.0f, std::min(255.0f, value));
            if (contrast != 0) {
                value = contrastCurve(value / 255.0f, exponent) * 255.0f;
            }
            lut.at<uchar>(v) = clampByte(value);
        }

        cv::LUT(plane, lut, channels[ch]);
    }

    cv::Mat result;
    cv::merge(channels, result);
    return result;
}

cv::Mat ImageEnhancer::adjustOriginal(const cv::Mat& input, int brightness, int contrast) {
    if (brightness == 0 && contrast == 0) {
        return input.clone();
    }

    float offset = brightness * 0.4f;
    float exponent = 1.0f + contrast / 100.0f;

    cv::Mat lut(1, 256, CV_8U);
    for (int v = 0; v < 256; v++) {
        float value = std::max(0.0f, std::min(1.0f, (v + offset) / 255.0f));
        value = contrastCurve(value, exponent);
        lut.at<uchar>(v) = clampByte(value * 255.0f);
    }

    std::vector<cv::Mat> channels;
    cv::split(input, channels);
    int colorChannels = std::min(3, input.channels());
    for (int ch = 0; ch < colorChannels; ch++) {
        cv::LUT(channels[ch], lut, channels[ch]);
    }

    cv::Mat result;
    cv::merge(channels, result);
    return result;
}

cv::Mat ImageEnhancer::grayscale(const cv::Mat& input, int brightness) {
    cv::Mat gray;
    if (input.channels() == 4) {
        cv::cvtColor(input, gray, cv::COLOR_RGBA2GRAY);
    } else if (input.channels() == 3) {
        cv::cvtColor(input, gray, cv::COLOR_RGB2GRAY);
    } else {
        gray = input.clone();
    }

    size_t total = gray.total();
    size_t step = std::max<size_t>(1, total / 5000);
    cv::Mat plane = gray.isContinuous() ? gray : gray.clone();

    std::vector<uchar> samples;
    const uchar* data = plane.ptr<uchar>();
    for (size_t i = 0; i < total; i += step) {
        samples.push_back(data[i]);
    }
    std::sort(samples.begin(), samples.end());

    int low = percentile(samples, 0.03, 0);
    int high = percentile(samples, 0.97, 255);
    float range = static_cast<float>(std::max(1, high - low));

    cv::Mat lut(1, 256, CV_8U);
    for (int v = 0; v < 256; v++) {
        lut.at<uchar>(v) = clampByte((v - low) / range * 255.0f + brightness * 0.4f);
    }

    cv::Mat stretched;
    cv::LUT(plane, lut, stretched);

    cv::Mat result;
    cv::cvtColor(stretched, result, input.channels() == 3 ? cv::COLOR_GRAY2RGB : cv::COLOR_GRAY2RGBA);
    return result;
}

cv::Mat ImageEnhancer::blackWhite(const cv::Mat& input, int brightness) {
    cv::Mat gray;
    if (input.channels() == 4) {
        cv::cvtColor(input, gray, cv::COLOR_RGBA2GRAY);
    } else if (input.channels() == 3) {
        cv::cvtColor(input, gray, cv::COLOR_RGB2GRAY);
    } else {
        gray = input.clone();
    }

    // Otsu picks the split, brightness nudges it
    cv::Mat unused;
    double otsu = cv::threshold(gray, unused, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    double adjusted = otsu - brightness * 0.5;

    cv::Mat binary;
    cv::threshold(gray, binary, adjusted, 255, cv::THRESH_BINARY);

    cv::Mat result;
    cv::cvtColor(binary, result, input.channels() == 3 ? cv::COLOR_GRAY2RGB : cv::COLOR_GRAY2RGBA);
    return result;
}

cv::Mat ImageEnhancer::sharpen(const cv::Mat& input, float amount) {
    if (input.empty() || amount <= 0) {
        return input.clone();
    }

    // Unsharp masking
    cv::Mat blurred;
    cv::GaussianBlur(input, blurred, cv::Size(0, 0), 1.0);

    float strength = amount * 2.0f;
    cv::Mat result;
    // sharpened = original + strength * (original - blurred)
    cv::addWeighted(input, 1.0 + strength, blurred, -strength, 0, result);

    return result;
}
