/**
 * @file MovementAnalyzer.hpp
 * @brief Frame-to-frame pupil displacement and windowed anomaly flag
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_MOVEMENT_ANALYZER_HPP
#define PROCTOREYE_GAZE_MOVEMENT_ANALYZER_HPP

#include "EngineConfig.hpp"
#include "GazeTypes.hpp"
#include "RingBuffer.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Persistent movement state
 *
 * While either previous pupil is missing the analyzer is bootstrapping: it
 * stores the current pair and reports zero movement. Once both are known,
 * each frame appends the mean displacement of the eyes valid in both frames
 * and re-evaluates suspicious over the last analysis window.
 */
struct MovementState {
    PupilEstimate previous_left;
    PupilEstimate previous_right;
    RingBuffer<float> movement_history;
    bool suspicious = false;

    explicit MovementState(std::size_t history_size = 90)
        : movement_history(history_size) {}

    bool has_previous_pair() const { return previous_left.has_value() && previous_right.has_value(); }
};

/**
 * @brief Eye movement anomaly analysis
 *
 * suspicious := mean(last analysis_window samples) > 2 * movement_threshold,
 * evaluated once the window is full.
 */
class MovementAnalyzer {
public:
    explicit MovementAnalyzer(const EngineConfig& config);

    MovementState make_state() const;

    /**
     * @brief Process the current frame's pupils
     *
     * An eye missing in either frame is excluded from the mean rather than
     * counted as zero movement. When no eye is valid in both frames nothing
     * is recorded and zero/not-suspicious is reported.
     */
    MovementData update(MovementState& state,
                        const PupilEstimate& left,
                        const PupilEstimate& right) const;

private:
    EngineConfig config_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_MOVEMENT_ANALYZER_HPP
