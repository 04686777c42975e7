/**
 * @file BlinkDetector.hpp
 * @brief Eye Aspect Ratio time series and debounced blink counting
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_BLINK_DETECTOR_HPP
#define PROCTOREYE_GAZE_BLINK_DETECTOR_HPP

#include <array>
#include <optional>
#include <opencv2/core.hpp>
#include "proctoreye/core/types.hpp"
#include "EngineConfig.hpp"
#include "GazeTypes.hpp"
#include "LandmarkSet.hpp"
#include "RingBuffer.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Blink phase derived from the low-sample counter
 */
enum class BlinkPhase {
    OPEN,    ///< consecutive_low_frames == 0
    CLOSING  ///< at least one low sample since the last release
};

/**
 * @brief Persistent blink state
 *
 * Transitions per EAR sample:
 * - sample < threshold: consecutive_low_frames += 1 (OPEN -> CLOSING)
 * - sample >= threshold and consecutive_low_frames >= blink_frames:
 *   one blink, total_blinks += 1, last_blink_time = now, counter = 0
 * - sample >= threshold and counter < blink_frames: counter = 0, no blink
 *
 * A blink is only counted on the release edge.
 */
struct BlinkState {
    int consecutive_low_frames = 0;
    int total_blinks = 0;
    RingBuffer<float> ear_history;
    std::optional<core::Timestamp> last_blink_time;  ///< Seeded with the first sample's time
    bool excessive_blinking = false;

    explicit BlinkState(std::size_t history_size = 30)
        : ear_history(history_size) {}

    BlinkPhase phase() const {
        return consecutive_low_frames == 0 ? BlinkPhase::OPEN : BlinkPhase::CLOSING;
    }
};

/**
 * @brief EAR-based blink detector
 *
 * EAR = (|p2 - p6| + |p3 - p5|) / (2 |p1 - p4|) per eye, averaged over both
 * eyes. The detector holds configuration only; the evolving state is passed
 * in by the caller.
 */
class BlinkDetector {
public:
    explicit BlinkDetector(const EngineConfig& config);

    BlinkState make_state() const;

    /**
     * @brief EAR from six ordered points p1..p6
     *
     * @return 0 when the horizontal distance is 0
     */
    static float eye_aspect_ratio(const std::array<cv::Point, 6>& points);

    /**
     * @brief EAR of one eye of a landmark set, in pixel space
     */
    static float compute_ear(const LandmarkSet& landmarks, EyeSide side, const cv::Size& frame_size);

    /**
     * @brief Process one frame's landmarks
     */
    BlinkData update(BlinkState& state,
                     const LandmarkSet& landmarks,
                     const cv::Size& frame_size,
                     core::Timestamp now) const;

    /**
     * @brief Process one averaged EAR sample
     */
    BlinkData update_with_ear(BlinkState& state, float ear, core::Timestamp now) const;

    /**
     * @brief Blink rate as total_blinks / max(1, minutes since last blink)
     */
    static float blink_rate(const BlinkState& state, core::Timestamp now);

private:
    EngineConfig config_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_BLINK_DETECTOR_HPP
