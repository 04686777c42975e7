/**
 * @file BlinkDetector.cpp
 * @brief EAR computation and blink state machine
 */

#include "proctoreye/gaze/BlinkDetector.hpp"
#include "proctoreye/core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace proctoreye {
namespace gaze {

namespace {

double distance(const cv::Point& a, const cv::Point& b) {
    double dx = static_cast<double>(a.x - b.x);
    double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

BlinkDetector::BlinkDetector(const EngineConfig& config)
    : config_(config) {
}

BlinkState BlinkDetector::make_state() const {
    return BlinkState(config_.ear_history_size);
}

float BlinkDetector::eye_aspect_ratio(const std::array<cv::Point, 6>& p) {
    double vertical_1 = distance(p[1], p[5]);
    double vertical_2 = distance(p[2], p[4]);
    double horizontal = distance(p[0], p[3]);

    if (horizontal <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>((vertical_1 + vertical_2) / (2.0 * horizontal));
}

float BlinkDetector::compute_ear(const LandmarkSet& landmarks, EyeSide side, const cv::Size& frame_size) {
    const auto& indices = side == EyeSide::LEFT ? landmark_index::LEFT_EYE_EAR
                                                : landmark_index::RIGHT_EYE_EAR;
    std::array<cv::Point, 6> points;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        points[i] = landmarks.pixel(static_cast<std::size_t>(indices[i]), frame_size);
    }
    return eye_aspect_ratio(points);
}

BlinkData BlinkDetector::update(BlinkState& state,
                                const LandmarkSet& landmarks,
                                const cv::Size& frame_size,
                                core::Timestamp now) const {
    float left_ear = compute_ear(landmarks, EyeSide::LEFT, frame_size);
    float right_ear = compute_ear(landmarks, EyeSide::RIGHT, frame_size);
    return update_with_ear(state, (left_ear + right_ear) / 2.0f, now);
}

BlinkData BlinkDetector::update_with_ear(BlinkState& state, float ear, core::Timestamp now) const {
    if (!state.last_blink_time) {
        state.last_blink_time = now;
    }

    state.ear_history.push(ear);

    BlinkData data;
    data.ear = ear;

    if (ear < config_.ear_threshold) {
        state.consecutive_low_frames++;
    } else {
        // Release edge: count only if the eye stayed closed long enough
        if (state.consecutive_low_frames >= config_.blink_frames) {
            state.total_blinks++;
            state.last_blink_time = now;
            data.blink_detected = true;
            PROCTOREYE_LOG_DEBUG("BlinkDetector") << "blink #" << state.total_blinks << " after "
                                                  << state.consecutive_low_frames << " low frames";
        }
        state.consecutive_low_frames = 0;
    }

    // Re-evaluated only once a full window is available; holds its last value before that
    if (state.ear_history.size() >= config_.analysis_window) {
        auto window = state.ear_history.last(config_.analysis_window);
        auto low = std::count_if(window.begin(), window.end(),
                                 [this](float v) { return v < config_.ear_threshold; });
        state.excessive_blinking = static_cast<std::size_t>(low) * 2 > window.size();
    }

    data.excessive_blinking = state.excessive_blinking;
    data.blink_rate = blink_rate(state, now);
    return data;
}

float BlinkDetector::blink_rate(const BlinkState& state, core::Timestamp now) {
    if (!state.last_blink_time) {
        return 0.0f;
    }
    double minutes = std::chrono::duration<double>(now - *state.last_blink_time).count() / 60.0;
    return static_cast<float>(state.total_blinks / std::max(1.0, minutes));
}

} // namespace gaze
} // namespace proctoreye
