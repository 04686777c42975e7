/**
 * @file PupilLocator.hpp
 * @brief Pupil localization inside a preprocessed eye region
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_PUPIL_LOCATOR_HPP
#define PROCTOREYE_GAZE_PUPIL_LOCATOR_HPP

#include <vector>
#include <opencv2/core.hpp>
#include "EngineConfig.hpp"
#include "GazeTypes.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Two-tier pupil locator
 *
 * Detection Algorithm:
 * 1. Hough circle search (radius min_pupil_radius..max_pupil_radius). When
 *    circles are found, take the one closest to the crop center; eyelid
 *    corners produce spurious off-center circles.
 * 2. Fallback when no circle is found: Otsu threshold, invert so the pupil
 *    is the bright blob, take the centroid of the largest external contour
 *    if its area exceeds min_contour_area.
 *
 * The returned point is in full-frame pixels (crop offset added back).
 *
 * Stateless; safe to share between frames.
 */
class PupilLocator {
public:
    explicit PupilLocator(const EngineConfig& config);

    /**
     * @brief Locate the pupil of one eye
     *
     * @return OK with frame coordinates, NOT_FOUND when neither method
     *         yields a candidate, INSUFFICIENT_INPUT for an empty crop,
     *         FAULT for a crop that is not CV_8UC1
     */
    StageResult<cv::Point> locate(const EyeRegion& region) const;

    /**
     * @brief Circle search only, crop coordinates
     */
    std::optional<cv::Point> find_circle(const cv::Mat& gray) const;

    /**
     * @brief Contour fallback only, crop coordinates
     */
    std::optional<cv::Point> find_dark_blob(const cv::Mat& gray) const;

    /**
     * @brief Pick the circle whose center is nearest the crop center
     *
     * Centers are rounded to integer pixels first. On equal distance the
     * earlier candidate wins.
     *
     * @param circles Hough output (x, y, radius)
     * @param crop_size Size of the searched crop
     */
    static cv::Point select_central_candidate(const std::vector<cv::Vec3f>& circles,
                                              const cv::Size& crop_size);

private:
    EngineConfig config_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_PUPIL_LOCATOR_HPP
