#include <gtest/gtest.h>
#include <vector>

#include "frame.hpp"
#include "test_helpers.hpp"

TEST(FrameTest, BufferIngestionRejectsInvalidInput) {
    std::vector<uint8_t> pixels(4 * 4 * 4, 128);
    Frame frame;

    EXPECT_EQ(bufferToFrame(nullptr, pixels.size(), 4, 4, FORMAT_RGBA, frame), SCAN_INVALID_FRAME);
    EXPECT_EQ(bufferToFrame(pixels.data(), pixels.size(), 0, 4, FORMAT_RGBA, frame), SCAN_INVALID_FRAME);
    EXPECT_EQ(bufferToFrame(pixels.data(), pixels.size(), 4, -1, FORMAT_RGBA, frame), SCAN_INVALID_FRAME);
    EXPECT_EQ(bufferToFrame(pixels.data(), pixels.size() - 1, 4, 4, FORMAT_RGBA, frame), SCAN_INVALID_FRAME);
    EXPECT_EQ(bufferToFrame(pixels.data(), pixels.size(), 4, 4, FORMAT_BGR, frame), SCAN_INVALID_FRAME);
    EXPECT_EQ(bufferToFrame(pixels.data(), pixels.size(), 4, 4, 9, frame), SCAN_INVALID_FRAME);
    EXPECT_TRUE(frame.empty());
}

TEST(FrameTest, BufferIngestionConvertsToRgba) {
    // One BGRA pixel repeated
    std::vector<uint8_t> pixels;
    for (int i = 0; i < 6; i++) {
        pixels.push_back(10);
        pixels.push_back(20);
        pixels.push_back(30);
        pixels.push_back(255);
    }

    Frame frame;
    ASSERT_EQ(bufferToFrame(pixels.data(), pixels.size(), 3, 2, FORMAT_BGRA, frame), SCAN_OK);
    EXPECT_EQ(frame.width(), 3);
    EXPECT_EQ(frame.height(), 2);
    EXPECT_EQ(frame.raster.type(), CV_8UC4);
    EXPECT_EQ(frame.sourceSize, cv::Size(3, 2));
    EXPECT_FLOAT_EQ(frame.scale, 1.0f);
    EXPECT_EQ(frame.raster.at<cv::Vec4b>(1, 2), cv::Vec4b(30, 20, 10, 255));

    // The frame owns its pixels
    pixels[0] = 99;
    EXPECT_EQ(frame.raster.at<cv::Vec4b>(0, 0)[2], 10);
}

TEST(FrameTest, RgbBufferGetsOpaqueAlpha) {
    std::vector<uint8_t> pixels = { 1, 2, 3, 4, 5, 6 };
    Frame frame;
    ASSERT_EQ(bufferToFrame(pixels.data(), pixels.size(), 2, 1, FORMAT_RGB, frame), SCAN_OK);
    EXPECT_EQ(frame.raster.at<cv::Vec4b>(0, 1), cv::Vec4b(4, 5, 6, 255));
}

TEST(FrameTest, DownscaleBoundsLongEdge) {
    Frame source = makePageFrame(1280, 720, cv::Rect(200, 100, 600, 400));

    Frame working;
    ASSERT_EQ(downscaleFrame(source, 640, working), SCAN_OK);
    EXPECT_EQ(working.width(), 640);
    EXPECT_EQ(working.height(), 360);
    EXPECT_FLOAT_EQ(working.scale, 0.5f);
    EXPECT_EQ(working.sourceSize, cv::Size(1280, 720));

    cv::Point2f back = frameToSource(working, cv::Point2f(320, 180));
    EXPECT_FLOAT_EQ(back.x, 640.0f);
    EXPECT_FLOAT_EQ(back.y, 360.0f);
}

TEST(FrameTest, DownscaleComposesScales) {
    Frame source = makePageFrame(1280, 720, cv::Rect(200, 100, 600, 400));

    Frame half;
    Frame quarter;
    ASSERT_EQ(downscaleFrame(source, 640, half), SCAN_OK);
    ASSERT_EQ(downscaleFrame(half, 320, quarter), SCAN_OK);

    EXPECT_EQ(quarter.width(), 320);
    EXPECT_FLOAT_EQ(quarter.scale, 0.25f);
    EXPECT_EQ(quarter.sourceSize, cv::Size(1280, 720));
}

TEST(FrameTest, DownscaleMapsBackWithinOnePixel) {
    Frame source = makePageFrame(1000, 750, cv::Rect(100, 100, 600, 400));

    Frame working;
    ASSERT_EQ(downscaleFrame(source, 640, working), SCAN_OK);
    EXPECT_EQ(working.width(), 640);
    EXPECT_EQ(working.height(), 480);

    for (int y = 0; y < working.height(); y += 37) {
        for (int x = 0; x < working.width(); x += 41) {
            cv::Point2f p(static_cast<float>(x), static_cast<float>(y));
            cv::Point2f roundTrip = sourceToFrame(working, frameToSource(working, p));
            EXPECT_NEAR(roundTrip.x, p.x, 1.0f);
            EXPECT_NEAR(roundTrip.y, p.y, 1.0f);
        }
    }
}

TEST(FrameTest, DownscaleKeepsSmallFrames) {
    Frame source = makePageFrame(300, 200, cv::Rect(50, 50, 100, 80));

    Frame working;
    ASSERT_EQ(downscaleFrame(source, 640, working), SCAN_OK);
    EXPECT_EQ(working.width(), 300);
    EXPECT_EQ(working.height(), 200);
    EXPECT_FLOAT_EQ(working.scale, 1.0f);
    EXPECT_NE(working.raster.data, source.raster.data);
}

TEST(FrameTest, DownscaleRejectsEmptyFrame) {
    Frame empty;
    Frame out;
    EXPECT_EQ(downscaleFrame(empty, 640, out), SCAN_INVALID_FRAME);
}

TEST(FrameTest, MatIngestionAndJpegEncoding) {
    cv::Mat bgr(40, 60, CV_8UC3, cv::Scalar(200, 100, 50));

    Frame frame;
    ASSERT_EQ(matToFrame(bgr, frame), SCAN_OK);
    EXPECT_EQ(frame.raster.at<cv::Vec4b>(0, 0), cv::Vec4b(50, 100, 200, 255));

    std::vector<uint8_t> jpeg;
    ASSERT_TRUE(encodeJpeg(frame.raster, 92, jpeg));
    ASSERT_GT(jpeg.size(), 2u);
    EXPECT_EQ(jpeg[0], 0xFF);
    EXPECT_EQ(jpeg[1], 0xD8);

    EXPECT_FALSE(encodeJpeg(cv::Mat(), 92, jpeg));
}
