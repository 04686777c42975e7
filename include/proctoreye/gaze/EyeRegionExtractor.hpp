/**
 * @file EyeRegionExtractor.hpp
 * @brief Crops and normalizes the eye regions of a detected face
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_EYE_REGION_EXTRACTOR_HPP
#define PROCTOREYE_GAZE_EYE_REGION_EXTRACTOR_HPP

#include <array>
#include <vector>
#include <opencv2/core.hpp>
#include "EngineConfig.hpp"
#include "GazeTypes.hpp"
#include "LandmarkSet.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Landmarks to per-eye preprocessed crops
 *
 * For each eye the 16 contour landmarks are projected to pixels, boxed with
 * padding (x +-padding_x, y +-padding_y), clipped to the frame and cropped.
 * The crop is converted to grayscale, Gaussian-blurred and
 * histogram-equalized so the circle and contour search downstream sees
 * normalized brightness.
 *
 * Stateless; safe to share between frames.
 */
class EyeRegionExtractor {
public:
    explicit EyeRegionExtractor(const EngineConfig& config);

    /**
     * @brief Extract one eye
     *
     * Every contour point is projected and kept, including points that fall
     * outside the frame; only the padded box is clipped to the frame.
     *
     * @return INSUFFICIENT_INPUT when fewer than min_eye_points landmarks are
     *         available or the clipped box is empty
     */
    StageResult<EyeRegion> extract(const LandmarkSet& landmarks,
                                   const cv::Mat& frame,
                                   EyeSide side) const;

    /**
     * @brief Padded, clipped bounding box of a point set
     *
     * @return Empty rect when the clipped box has no area
     */
    cv::Rect padded_bounds(const std::vector<cv::Point>& points, const cv::Size& frame_size) const;

    /**
     * @brief Grayscale + blur + equalize
     */
    cv::Mat normalize_crop(const cv::Mat& crop) const;

    static const std::array<int, 16>& eye_indices(EyeSide side);

private:
    EngineConfig config_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_EYE_REGION_EXTRACTOR_HPP
