/**
 * @file GazeEstimator.cpp
 * @brief Gaze vector computation and calibration
 */

#include "proctoreye/gaze/GazeEstimator.hpp"
#include "proctoreye/core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace proctoreye {
namespace gaze {

GazeEstimator::GazeEstimator(const EngineConfig& config)
    : config_(config) {
}

cv::Point2f GazeEstimator::estimate(const std::vector<cv::Point>& eye_landmarks,
                                    const PupilEstimate& pupil) const {
    if (!pupil || eye_landmarks.empty()) {
        return cv::Point2f(0.0f, 0.0f);
    }

    double sum_x = 0.0;
    double sum_y = 0.0;
    int min_x = eye_landmarks.front().x;
    int max_x = min_x;
    int min_y = eye_landmarks.front().y;
    int max_y = min_y;
    for (const auto& p : eye_landmarks) {
        sum_x += p.x;
        sum_y += p.y;
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    const double n = static_cast<double>(eye_landmarks.size());
    const double center_x = sum_x / n;
    const double center_y = sum_y / n;
    const int width = max_x - min_x;
    const int height = max_y - min_y;

    if (width <= 0 || height <= 0) {
        return cv::Point2f(0.0f, 0.0f);
    }

    return cv::Point2f(static_cast<float>((pupil->x - center_x) / width * 100.0),
                       static_cast<float>((pupil->y - center_y) / height * 100.0));
}

cv::Point2f GazeEstimator::average(const std::vector<cv::Point2f>& vectors) {
    if (vectors.empty()) {
        return cv::Point2f(0.0f, 0.0f);
    }
    cv::Point2f sum(0.0f, 0.0f);
    for (const auto& v : vectors) {
        sum += v;
    }
    return sum / static_cast<float>(vectors.size());
}

void GazeEstimator::commit_calibration(CalibrationReference& reference, const cv::Point2f& gaze) const {
    reference.center_vector = gaze;
    reference.bounds = config_.gaze_bounds;
    reference.calibrated = true;
    PROCTOREYE_LOG_INFO("GazeEstimator") << "calibrated center gaze (" << gaze.x << ", " << gaze.y << ")";
}

bool GazeEstimator::is_looking_away(const CalibrationReference& reference, const cv::Point2f& gaze) const {
    if (!reference.calibrated) {
        return false;
    }
    float dev_x = std::abs(gaze.x - reference.center_vector.x);
    float dev_y = std::abs(gaze.y - reference.center_vector.y);
    return dev_x > config_.look_away_threshold_x || dev_y > config_.look_away_threshold_y;
}

std::string describe_gaze_direction(const cv::Point2f& gaze, float threshold) {
    if (std::abs(gaze.x) < threshold && std::abs(gaze.y) < threshold) {
        return "Center";
    }

    std::string desc;
    if (gaze.y < -threshold) {
        desc = "Up";
    } else if (gaze.y > threshold) {
        desc = "Down";
    }
    if (gaze.x < -threshold) {
        desc += desc.empty() ? "Left" : " Left";
    } else if (gaze.x > threshold) {
        desc += desc.empty() ? "Right" : " Right";
    }
    return desc.empty() ? "Center" : desc;
}

} // namespace gaze
} // namespace proctoreye
