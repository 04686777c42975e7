/**
 * @file GazeEstimator.hpp
 * @brief Eye-size-normalized gaze vectors and calibrated look-away decision
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_GAZE_ESTIMATOR_HPP
#define PROCTOREYE_GAZE_GAZE_ESTIMATOR_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "EngineConfig.hpp"
#include "GazeTypes.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Calibration reference (the calibration store)
 *
 * Starts uncalibrated. Each commit overwrites center_vector and bounds
 * (last write wins) and sets calibrated; nothing resets it afterwards.
 */
struct CalibrationReference {
    bool calibrated = false;
    cv::Point2f center_vector{0.0f, 0.0f};
    GazeBounds bounds;
};

/**
 * @brief Gaze vector estimation
 *
 * gaze = (pupil - eye_center) / (eye_width, eye_height) * 100, where the
 * eye center is the mean of the eye landmarks and width/height are their
 * pixel extents. The result is dimensionless across face size and distance.
 */
class GazeEstimator {
public:
    explicit GazeEstimator(const EngineConfig& config);

    /**
     * @brief Gaze vector of one eye
     *
     * @return (0, 0) when the pupil is absent, the landmarks are empty or
     *         the eye has zero width or height
     */
    cv::Point2f estimate(const std::vector<cv::Point>& eye_landmarks,
                         const PupilEstimate& pupil) const;

    /**
     * @brief Componentwise mean; (0, 0) for no vectors
     */
    static cv::Point2f average(const std::vector<cv::Point2f>& vectors);

    /**
     * @brief Commit a gaze vector as the calibrated center
     */
    void commit_calibration(CalibrationReference& reference, const cv::Point2f& gaze) const;

    /**
     * @brief Look-away decision
     *
     * Always false before calibration. Afterwards true when
     * |x - cx| > look_away_threshold_x or |y - cy| > look_away_threshold_y.
     */
    bool is_looking_away(const CalibrationReference& reference, const cv::Point2f& gaze) const;

private:
    EngineConfig config_;
};

/**
 * @brief Human-readable gaze direction
 *
 * "Center" when both components are within +-threshold, otherwise a
 * combination of "Up"/"Down" and "Left"/"Right".
 */
std::string describe_gaze_direction(const cv::Point2f& gaze, float threshold = 20.0f);

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_GAZE_ESTIMATOR_HPP
