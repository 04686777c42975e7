/**
 * @file LandmarkSet.hpp
 * @brief Validated facial landmark container handed over by the landmark provider
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_LANDMARK_SET_HPP
#define PROCTOREYE_GAZE_LANDMARK_SET_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

namespace proctoreye {
namespace gaze {

/**
 * @brief Landmark indices in the MediaPipe Face Mesh topology (468/478 points)
 */
namespace landmark_index {

/// Eye contour, 16 points per eye
constexpr std::array<int, 16> LEFT_EYE = {
    33, 7, 163, 144, 145, 153, 154, 155, 133, 173, 157, 158, 159, 160, 161, 246};
constexpr std::array<int, 16> RIGHT_EYE = {
    362, 382, 381, 380, 374, 373, 390, 249, 263, 466, 388, 387, 386, 385, 384, 398};

/// EAR points ordered p1..p6: p1/p4 corners, p2/p6 and p3/p5 vertical lid pairs
constexpr std::array<int, 6> LEFT_EYE_EAR = {33, 160, 158, 133, 153, 144};
constexpr std::array<int, 6> RIGHT_EYE_EAR = {362, 385, 387, 263, 373, 380};

/// Smallest landmark count that can address every index above
constexpr std::size_t MIN_LANDMARK_COUNT = 467;

} // namespace landmark_index

/**
 * @brief One detected face in one frame
 *
 * Points are normalized to [0, 1] relative to the frame. The set is checked
 * once on construction so processing stages can index it without
 * per-point presence checks.
 *
 * Thread-safety: immutable after construction.
 */
class LandmarkSet {
public:
    /// Largest accepted |x| or |y|; providers overshoot [0, 1] slightly near the frame edge
    static constexpr float MAX_NORMALIZED_MAGNITUDE = 2.0f;

    /**
     * @brief Construct and validate a landmark set
     *
     * @param points Normalized landmark points (z is relative depth, unused by the engine)
     * @param face_box Optional normalized face bounding box from the provider
     * @throws core::InvalidInputException if there are too few points, a
     *         coordinate is not finite, or x/y exceed MAX_NORMALIZED_MAGNITUDE
     */
    explicit LandmarkSet(std::vector<cv::Point3f> points,
                         std::optional<cv::Rect2f> face_box = std::nullopt);

    /**
     * @brief Build from 2D points (depth set to 0)
     */
    static LandmarkSet from_points(const std::vector<cv::Point2f>& points,
                                   std::optional<cv::Rect2f> face_box = std::nullopt);

    std::size_t size() const { return points_.size(); }

    const cv::Point3f& at(std::size_t index) const;

    /**
     * @brief Project a landmark to integer pixel coordinates
     *
     * Coordinates are truncated toward zero, matching how the provider's
     * normalized output is mapped to the frame grid.
     */
    cv::Point pixel(std::size_t index, const cv::Size& frame_size) const;

    const std::optional<cv::Rect2f>& face_box() const { return face_box_; }

private:
    std::vector<cv::Point3f> points_;
    std::optional<cv::Rect2f> face_box_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_LANDMARK_SET_HPP
