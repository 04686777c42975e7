/**
 * @file test_blink_detector.cpp
 * @brief EAR computation and the debounced blink state machine
 *
 * Validates:
 * - Closed-form EAR on synthetic eyes
 * - Debounce: blink_frames - 1 low samples never count
 * - Excessive-blinking window (more than half of the last 30 samples low)
 * - Blink rate formula and its clock seeding
 */

#include <gtest/gtest.h>
#include <proctoreye/gaze/BlinkDetector.hpp>
#include "test_helpers.hpp"
#include <chrono>

using namespace proctoreye;
using namespace proctoreye::gaze;
using std::chrono::milliseconds;
using std::chrono::seconds;

class BlinkDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = detector_.make_state();
        t0_ = core::Clock::now();
    }

    core::Timestamp at(int frame) const {
        return t0_ + milliseconds(33 * frame);
    }

    /// Feeds samples starting at frame `first`; returns blinks emitted
    int feed(float ear, int count, int first = 0) {
        int blinks = 0;
        for (int i = 0; i < count; ++i) {
            if (detector_.update_with_ear(state_, ear, at(first + i)).blink_detected) {
                blinks++;
            }
        }
        return blinks;
    }

    EngineConfig config_;
    BlinkDetector detector_{config_};
    BlinkState state_;
    core::Timestamp t0_;
};

TEST_F(BlinkDetectorTest, EarMatchesClosedForm) {
    // Vertical distances 4 and 4, horizontal 20
    std::array<cv::Point, 6> eye = {
        cv::Point(0, 0), cv::Point(7, -2), cv::Point(13, -2),
        cv::Point(20, 0), cv::Point(13, 2), cv::Point(7, 2)
    };
    EXPECT_FLOAT_EQ(BlinkDetector::eye_aspect_ratio(eye), 0.2f);
}

TEST_F(BlinkDetectorTest, ZeroWidthEyeHasZeroEar) {
    std::array<cv::Point, 6> eye = {
        cv::Point(5, 0), cv::Point(5, -2), cv::Point(5, -2),
        cv::Point(5, 0), cv::Point(5, 2), cv::Point(5, 2)
    };
    EXPECT_FLOAT_EQ(BlinkDetector::eye_aspect_ratio(eye), 0.0f);
}

TEST_F(BlinkDetectorTest, EarFromLandmarkSet) {
    test::SyntheticFace face;
    face.left.half_height = 4;   // EAR 4 / 20
    face.right.half_height = 8;  // EAR 8 / 20
    LandmarkSet landmarks = test::make_landmarks(face);
    const cv::Size size(test::FRAME_WIDTH, test::FRAME_HEIGHT);

    EXPECT_FLOAT_EQ(BlinkDetector::compute_ear(landmarks, EyeSide::LEFT, size), 0.2f);
    EXPECT_FLOAT_EQ(BlinkDetector::compute_ear(landmarks, EyeSide::RIGHT, size), 0.4f);

    BlinkData data = detector_.update(state_, landmarks, size, at(0));
    EXPECT_FLOAT_EQ(data.ear, 0.3f);
}

TEST_F(BlinkDetectorTest, ShortClosureIsDebounced) {
    EXPECT_EQ(feed(0.1f, config_.blink_frames - 1), 0);
    EXPECT_EQ(state_.phase(), BlinkPhase::CLOSING);

    EXPECT_EQ(feed(0.35f, 1, config_.blink_frames - 1), 0);
    EXPECT_EQ(state_.total_blinks, 0);
    EXPECT_EQ(state_.consecutive_low_frames, 0);
    EXPECT_EQ(state_.phase(), BlinkPhase::OPEN);
}

TEST_F(BlinkDetectorTest, FullClosureCountsOnce) {
    EXPECT_EQ(feed(0.1f, config_.blink_frames), 0);
    EXPECT_EQ(feed(0.35f, 1, config_.blink_frames), 1);
    EXPECT_EQ(state_.total_blinks, 1);
    EXPECT_EQ(state_.consecutive_low_frames, 0);

    // Long closures still count as a single blink
    EXPECT_EQ(feed(0.1f, 10, 10), 0);
    EXPECT_EQ(feed(0.35f, 3, 20), 1);
    EXPECT_EQ(state_.total_blinks, 2);
}

TEST_F(BlinkDetectorTest, ThresholdSampleIsOpen) {
    feed(0.1f, 3);
    BlinkData data = detector_.update_with_ear(state_, config_.ear_threshold, at(3));
    EXPECT_TRUE(data.blink_detected);
}

TEST_F(BlinkDetectorTest, ExcessiveBlinkingNeedsFullWindow) {
    // 29 low samples: window not yet full
    feed(0.1f, 29);
    EXPECT_FALSE(state_.excessive_blinking);

    BlinkData data = detector_.update_with_ear(state_, 0.1f, at(29));
    EXPECT_TRUE(data.excessive_blinking);
}

TEST_F(BlinkDetectorTest, ExcessiveBlinkingRequiresMajority) {
    feed(0.35f, 15);
    feed(0.1f, 15, 15);
    // Exactly half low is not "more than half"
    EXPECT_FALSE(state_.excessive_blinking);

    feed(0.1f, 1, 30);
    EXPECT_TRUE(state_.excessive_blinking);

    feed(0.35f, 30, 31);
    EXPECT_FALSE(state_.excessive_blinking);
}

TEST_F(BlinkDetectorTest, EarHistoryIsBounded) {
    feed(0.3f, 1000);
    EXPECT_EQ(state_.ear_history.size(), 30u);
    EXPECT_EQ(state_.ear_history.capacity(), config_.ear_history_size);
}

TEST_F(BlinkDetectorTest, BlinkRateUsesMinutesSinceLastBlink) {
    EXPECT_FLOAT_EQ(BlinkDetector::blink_rate(state_, at(0)), 0.0f);

    // Clock starts at the first sample
    detector_.update_with_ear(state_, 0.35f, t0_);
    ASSERT_TRUE(state_.last_blink_time.has_value());
    EXPECT_EQ(*state_.last_blink_time, t0_);

    state_.total_blinks = 6;
    // Under a minute the divisor is clamped to 1
    EXPECT_FLOAT_EQ(BlinkDetector::blink_rate(state_, t0_ + seconds(30)), 6.0f);
    EXPECT_FLOAT_EQ(BlinkDetector::blink_rate(state_, t0_ + seconds(180)), 2.0f);
}
