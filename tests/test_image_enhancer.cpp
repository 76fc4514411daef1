#include <gtest/gtest.h>

#include "image_enhancer.hpp"
#include "test_helpers.hpp"

namespace {

cv::Mat makeLowContrastPage() {
    cv::Mat page(120, 90, CV_8UC4, cv::Scalar(150, 145, 140, 255));
    cv::rectangle(page, cv::Rect(10, 20, 70, 8), cv::Scalar(100, 100, 100, 255), cv::FILLED);
    cv::rectangle(page, cv::Rect(10, 50, 50, 8), cv::Scalar(110, 105, 100, 255), cv::FILLED);
    return page;
}

}  // namespace

TEST(ImageEnhancerTest, FiltersPreserveSizeAndChannels) {
    ImageEnhancer enhancer;
    cv::Mat page = makeLowContrastPage();

    const PageFilter filters[] = {
        FILTER_NONE, FILTER_MAGIC_COLOR, FILTER_ORIGINAL, FILTER_GRAYSCALE, FILTER_BLACK_WHITE
    };
    for (PageFilter filter : filters) {
        cv::Mat out = enhancer.finishPage(page, filter);
        EXPECT_EQ(out.size(), page.size()) << "filter " << filter;
        EXPECT_EQ(out.type(), CV_8UC4) << "filter " << filter;
    }
}

TEST(ImageEnhancerTest, NoneReturnsUntouchedCopy) {
    ImageEnhancer enhancer;
    cv::Mat page = makeLowContrastPage();

    cv::Mat out = enhancer.finishPage(page, FILTER_NONE);
    EXPECT_NE(out.data, page.data);
    EXPECT_EQ(cv::norm(out, page, cv::NORM_INF), 0.0);
}

TEST(ImageEnhancerTest, BlackWhiteIsBinary) {
    ImageEnhancer enhancer;
    cv::Mat page = makeLowContrastPage();

    cv::Mat out = enhancer.finishPage(page, FILTER_BLACK_WHITE, FilterAdjustments(5, 20, 0));

    std::vector<cv::Mat> channels;
    cv::split(out, channels);
    cv::Mat nonBinary = (channels[0] != 0) & (channels[0] != 255);
    EXPECT_EQ(cv::countNonZero(nonBinary), 0);

    // Text dark, paper white
    EXPECT_EQ(channels[0].at<uchar>(24, 40), 0);
    EXPECT_EQ(channels[0].at<uchar>(100, 40), 255);
}

TEST(ImageEnhancerTest, MagicColorStretchesRange) {
    ImageEnhancer enhancer;
    cv::Mat page = makeLowContrastPage();

    cv::Mat out = enhancer.magicColor(page, 0, 0);

    std::vector<cv::Mat> in;
    std::vector<cv::Mat> stretched;
    cv::split(page, in);
    cv::split(out, stretched);

    double inMin = 0, inMax = 0, outMin = 0, outMax = 0;
    cv::minMaxLoc(in[0], &inMin, &inMax);
    cv::minMaxLoc(stretched[0], &outMin, &outMax);
    EXPECT_GT(outMax - outMin, inMax - inMin);

    // Alpha untouched
    EXPECT_EQ(cv::countNonZero(stretched[3] != 255), 0);
}

TEST(ImageEnhancerTest, GrayscaleChannelsMatch) {
    ImageEnhancer enhancer;
    cv::Mat out = enhancer.grayscale(makeLowContrastPage(), 5);

    std::vector<cv::Mat> channels;
    cv::split(out, channels);
    EXPECT_EQ(cv::norm(channels[0], channels[1], cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(channels[1], channels[2], cv::NORM_INF), 0.0);
}

TEST(ImageEnhancerTest, ContrastCurve) {
    EXPECT_FLOAT_EQ(ImageEnhancer::contrastCurve(0.0f, 1.2f), 0.0f);
    EXPECT_FLOAT_EQ(ImageEnhancer::contrastCurve(0.5f, 1.2f), 0.5f);
    EXPECT_FLOAT_EQ(ImageEnhancer::contrastCurve(1.0f, 1.2f), 1.0f);
    EXPECT_FLOAT_EQ(ImageEnhancer::contrastCurve(0.3f, 1.0f), 0.3f);

    // Darks darker, lights lighter
    EXPECT_LT(ImageEnhancer::contrastCurve(0.25f, 1.5f), 0.25f);
    EXPECT_GT(ImageEnhancer::contrastCurve(0.75f, 1.5f), 0.75f);
}

TEST(ImageEnhancerTest, SharpenIncreasesEdgeContrast) {
    ImageEnhancer enhancer;
    cv::Mat page = makeLowContrastPage();

    cv::Mat sharp = enhancer.sharpen(page, 0.4f);
    ASSERT_EQ(sharp.size(), page.size());

    // Paper next to the text bar gets brighter
    EXPECT_GT(sharp.at<cv::Vec4b>(19, 40)[0], page.at<cv::Vec4b>(19, 40)[0]);
    EXPECT_EQ(cv::norm(enhancer.sharpen(page, 0.0f), page, cv::NORM_INF), 0.0);
}
