/**
 * @file AttentionScorer.hpp
 * @brief Composite attention score from the frame's flags
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_ATTENTION_SCORER_HPP
#define PROCTOREYE_GAZE_ATTENTION_SCORER_HPP

#include "EngineConfig.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Inputs of the attention score for one frame
 */
struct AttentionInputs {
    bool looking_away = false;
    bool excessive_blinking = false;
    bool suspicious_movement = false;
    float blink_rate = 0.0f;  ///< Blinks per minute
};

/**
 * @brief Pure scoring function
 *
 * Starts at 100 and subtracts each applicable penalty independently
 * (look-away 30, excessive blinking 20, suspicious movement 25, blink rate
 * outside [5, 30] 15); the result is clamped to >= 0.
 */
class AttentionScorer {
public:
    explicit AttentionScorer(const EngineConfig& config);

    float score(const AttentionInputs& inputs) const;

    static constexpr float MAX_SCORE = 100.0f;

private:
    EngineConfig config_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_ATTENTION_SCORER_HPP
