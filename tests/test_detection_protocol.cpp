#include <gtest/gtest.h>
#include <string>

#include "detection_protocol.hpp"

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(DetectionProtocolTest, FoundResponseJson) {
    cv::Mat page(600, 400, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    CornerSet corners(cv::Point2f(100, 100), cv::Point2f(500, 100), cv::Point2f(500, 700), cv::Point2f(100, 700));

    DetectionResponse response = DetectionResponse::found(7, page, corners, 81.5f, "otsu eps=0.02");
    EXPECT_TRUE(response.detected());
    EXPECT_EQ(response.width(), 400);
    EXPECT_EQ(response.height(), 600);

    std::string json = responseToJson(response);
    EXPECT_TRUE(contains(json, "\"type\":\"result\"")) << json;
    EXPECT_TRUE(contains(json, "\"id\":7")) << json;
    EXPECT_TRUE(contains(json, "\"detected\":true")) << json;
    EXPECT_TRUE(contains(json, "\"width\":400,\"height\":600")) << json;
    EXPECT_TRUE(contains(json, "\"tl\":[100.00,100.00]")) << json;
    EXPECT_TRUE(contains(json, "\"bl\":[100.00,700.00]")) << json;
    EXPECT_TRUE(contains(json, "\"score\":81.50")) << json;
    EXPECT_TRUE(contains(json, "\"debug\":\"otsu eps=0.02\"")) << json;
}

TEST(DetectionProtocolTest, FailedResponseJson) {
    DetectionResponse response = DetectionResponse::failed(3, SCAN_NO_DOCUMENT_FOUND, "no quad found");
    EXPECT_FALSE(response.detected());
    EXPECT_EQ(response.message, "No document found");

    std::string json = responseToJson(response);
    EXPECT_TRUE(contains(json, "\"detected\":false")) << json;
    EXPECT_TRUE(contains(json, "\"error\":\"no_document_found\"")) << json;
    EXPECT_FALSE(contains(json, "\"quad\"")) << json;
    EXPECT_FALSE(contains(json, "\"width\"")) << json;
}

TEST(DetectionProtocolTest, LiveResponseHasQuadWithoutSize) {
    CornerSet corners(cv::Point2f(1, 2), cv::Point2f(3, 4), cv::Point2f(5, 6), cv::Point2f(7, 8));
    std::string json = responseToJson(DetectionResponse::foundLive(9, corners, 50.0f, ""));

    EXPECT_TRUE(contains(json, "\"detected\":true")) << json;
    EXPECT_TRUE(contains(json, "\"quad\":{")) << json;
    EXPECT_FALSE(contains(json, "\"width\"")) << json;
}

TEST(DetectionProtocolTest, EventJson) {
    EXPECT_EQ(responseToJson(DetectionResponse::ready()), "{\"type\":\"ready\"}");
    EXPECT_EQ(errorEventJson("bad \"runtime\"\n"),
              "{\"type\":\"error\",\"message\":\"bad \\\"runtime\\\"\\n\"}");
}

TEST(DetectionProtocolTest, RequestsOwnTheirFrame) {
    Frame frame;
    frame.raster = cv::Mat(10, 10, CV_8UC4, cv::Scalar::all(0));
    frame.sourceSize = frame.raster.size();

    CornerSet corners(cv::Point2f(0, 0), cv::Point2f(9, 0), cv::Point2f(9, 9), cv::Point2f(0, 9));
    DetectionRequest request = DetectionRequest::cropWithCorners(std::move(frame), corners);

    EXPECT_EQ(request.type, REQUEST_CROP_WITH_CORNERS);
    EXPECT_EQ(request.frame.width(), 10);
    EXPECT_EQ(request.corners, corners);
    EXPECT_STREQ(requestTypeName(request.type), "crop_with_corners");
}

TEST(ScanErrorTest, FallbackPolicy) {
    EXPECT_TRUE(isPermanentError(SCAN_RUNTIME_UNAVAILABLE));
    EXPECT_FALSE(isPermanentError(SCAN_TIMEOUT));
    EXPECT_FALSE(isPermanentError(SCAN_NO_DOCUMENT_FOUND));

    EXPECT_TRUE(shouldFallBackToManualCrop(SCAN_TIMEOUT));
    EXPECT_TRUE(shouldFallBackToManualCrop(SCAN_FRAME_TOO_SMALL));
    EXPECT_FALSE(shouldFallBackToManualCrop(SCAN_OK));

    EXPECT_STREQ(scanErrorName(SCAN_TIMEOUT), "timeout");
    EXPECT_STREQ(scanErrorName(SCAN_INVALID_FRAME), "invalid_frame");
}
