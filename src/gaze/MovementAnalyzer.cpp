/**
 * @file MovementAnalyzer.cpp
 * @brief Pupil displacement tracking
 */

#include "proctoreye/gaze/MovementAnalyzer.hpp"
#include "proctoreye/core/Logger.hpp"
#include <cmath>
#include <numeric>

namespace proctoreye {
namespace gaze {

namespace {

float displacement(const cv::Point& a, const cv::Point& b) {
    float dx = static_cast<float>(a.x - b.x);
    float dy = static_cast<float>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

MovementAnalyzer::MovementAnalyzer(const EngineConfig& config)
    : config_(config) {
}

MovementState MovementAnalyzer::make_state() const {
    return MovementState(config_.movement_history_size);
}

MovementData MovementAnalyzer::update(MovementState& state,
                                      const PupilEstimate& left,
                                      const PupilEstimate& right) const {
    if (!state.has_previous_pair()) {
        state.previous_left = left;
        state.previous_right = right;
        return MovementData{};
    }

    float total = 0.0f;
    int valid = 0;
    if (left && state.previous_left) {
        total += displacement(*left, *state.previous_left);
        valid++;
    }
    if (right && state.previous_right) {
        total += displacement(*right, *state.previous_right);
        valid++;
    }

    if (valid == 0) {
        return MovementData{};
    }

    const float magnitude = total / static_cast<float>(valid);
    state.movement_history.push(magnitude);

    if (state.movement_history.size() >= config_.analysis_window) {
        auto window = state.movement_history.last(config_.analysis_window);
        float mean = std::accumulate(window.begin(), window.end(), 0.0f) /
                     static_cast<float>(window.size());
        bool was_suspicious = state.suspicious;
        state.suspicious = mean > config_.movement_threshold * 2.0f;
        if (state.suspicious && !was_suspicious) {
            PROCTOREYE_LOG_DEBUG("MovementAnalyzer") << "suspicious movement, window mean " << mean << " px";
        }
    }

    state.previous_left = left;
    state.previous_right = right;

    MovementData data;
    data.movement_magnitude = magnitude;
    data.suspicious = state.suspicious;
    return data;
}

} // namespace gaze
} // namespace proctoreye
