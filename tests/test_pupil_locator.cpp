/**
 * @file test_pupil_locator.cpp
 * @brief Pupil localization on synthetic eye crops
 */

#include <gtest/gtest.h>
#include <proctoreye/gaze/PupilLocator.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdlib>

using namespace proctoreye::gaze;

class PupilLocatorTest : public ::testing::Test {
protected:
    EyeRegion makeRegion(const cv::Mat& gray, const cv::Point& offset) const {
        EyeRegion region;
        region.side = EyeSide::LEFT;
        region.gray = gray;
        region.bounding_box = cv::Rect(offset, gray.size());
        return region;
    }

    EngineConfig config_;
    PupilLocator locator_{config_};
};

TEST_F(PupilLocatorTest, FindsDarkDiscInFrameCoordinates) {
    cv::Mat gray(50, 80, CV_8UC1, cv::Scalar(220));
    cv::circle(gray, cv::Point(40, 25), 8, cv::Scalar(15), cv::FILLED);

    auto result = locator_.locate(makeRegion(gray, cv::Point(100, 200)));
    ASSERT_TRUE(result.ok()) << result.detail;
    EXPECT_LE(std::abs(result.value->x - 140), 2);
    EXPECT_LE(std::abs(result.value->y - 225), 2);
}

TEST_F(PupilLocatorTest, ContourFallbackFindsOffCenterBlob) {
    cv::Mat gray(50, 80, CV_8UC1, cv::Scalar(220));
    cv::circle(gray, cv::Point(20, 20), 6, cv::Scalar(10), cv::FILLED);

    auto blob = locator_.find_dark_blob(gray);
    ASSERT_TRUE(blob.has_value());
    EXPECT_LE(std::abs(blob->x - 20), 1);
    EXPECT_LE(std::abs(blob->y - 20), 1);
}

TEST_F(PupilLocatorTest, TinySpeckIsNotFound) {
    cv::Mat gray(50, 80, CV_8UC1, cv::Scalar(220));
    cv::rectangle(gray, cv::Rect(40, 25, 3, 3), cv::Scalar(0), cv::FILLED);

    auto result = locator_.locate(makeRegion(gray, cv::Point(0, 0)));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, StageStatus::NOT_FOUND);
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(PupilLocatorTest, EmptyCropIsInsufficientInput) {
    auto result = locator_.locate(makeRegion(cv::Mat(), cv::Point(0, 0)));
    EXPECT_EQ(result.status, StageStatus::INSUFFICIENT_INPUT);
}

TEST_F(PupilLocatorTest, NonGrayCropIsFault) {
    cv::Mat color(50, 80, CV_8UC3, cv::Scalar(220, 220, 220));
    auto result = locator_.locate(makeRegion(color, cv::Point(0, 0)));
    EXPECT_EQ(result.status, StageStatus::FAULT);
}

TEST_F(PupilLocatorTest, CentralCandidateWins) {
    std::vector<cv::Vec3f> circles = {
        cv::Vec3f(5.0f, 5.0f, 6.0f),
        cv::Vec3f(39.6f, 24.4f, 6.0f),
        cv::Vec3f(70.0f, 40.0f, 6.0f)
    };
    EXPECT_EQ(PupilLocator::select_central_candidate(circles, cv::Size(80, 50)), cv::Point(40, 24));
}

TEST_F(PupilLocatorTest, CentralCandidateTieKeepsFirst) {
    std::vector<cv::Vec3f> circles = {
        cv::Vec3f(30.0f, 25.0f, 6.0f),
        cv::Vec3f(50.0f, 25.0f, 6.0f)
    };
    EXPECT_EQ(PupilLocator::select_central_candidate(circles, cv::Size(80, 50)), cv::Point(30, 25));
}
