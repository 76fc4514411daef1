#ifndef IMAGE_ENHANCER_HPP
#define IMAGE_ENHANCER_HPP

#include <opencv2/opencv.hpp>

// Page finishing filters applied to a corrected page
enum PageFilter {
    FILTER_NONE = 0,
    FILTER_MAGIC_COLOR = 1,   // Per-channel percentile stretch
    FILTER_ORIGINAL = 2,      // Brightness/contrast only
    FILTER_GRAYSCALE = 3,
    FILTER_BLACK_WHITE = 4    // Otsu binarization
};

struct FilterAdjustments {
    int brightness;   // -60..60
    int contrast;     // -30..100
    int sharpness;    // 0..100

    FilterAdjustments() {
        brightness = 5;
        contrast = 20;
        sharpness = 40;
    }

    FilterAdjustments(int b, int c, int s) : brightness(b), contrast(c), sharpness(s) {}
};

class ImageEnhancer {
public:
    ImageEnhancer();
    ~ImageEnhancer();

    // Main entry: filter + sharpening. Input and output are RGBA (or RGB).
    cv::Mat finishPage(const cv::Mat& input, PageFilter filter,
                       const FilterAdjustments& adjustments = FilterAdjustments());

    // Individual filters
    cv::Mat magicColor(const cv::Mat& input, int brightness, int contrast);
    cv::Mat adjustOriginal(const cv::Mat& input, int brightness, int contrast);
    cv::Mat grayscale(const cv::Mat& input, int brightness);
    cv::Mat blackWhite(const cv::Mat& input, int brightness);
    cv::Mat sharpen(const cv::Mat& input, float amount);

    // Symmetric S-curve on [0,1], exponent 1 + contrast/100
    static float contrastCurve(float value, float exponent);

private:
    int percentile(const std::vector<uchar>& sorted, double fraction, int fallback);
};

#endif // IMAGE_ENHANCER_HPP
