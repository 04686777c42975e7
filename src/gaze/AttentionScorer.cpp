/**
 * @file AttentionScorer.cpp
 * @brief Attention score deductions
 */

#include "proctoreye/gaze/AttentionScorer.hpp"
#include <algorithm>

namespace proctoreye {
namespace gaze {

AttentionScorer::AttentionScorer(const EngineConfig& config)
    : config_(config) {
}

float AttentionScorer::score(const AttentionInputs& inputs) const {
    float score = MAX_SCORE;

    if (inputs.looking_away) {
        score -= config_.look_away_penalty;
    }
    if (inputs.excessive_blinking) {
        score -= config_.excessive_blinking_penalty;
    }
    if (inputs.suspicious_movement) {
        score -= config_.suspicious_movement_penalty;
    }
    if (inputs.blink_rate > config_.max_normal_blink_rate ||
        inputs.blink_rate < config_.min_normal_blink_rate) {
        score -= config_.abnormal_blink_rate_penalty;
    }

    return std::max(0.0f, score);
}

} // namespace gaze
} // namespace proctoreye
