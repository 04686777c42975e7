/**
 * @file EngineConfig.cpp
 * @brief Engine configuration validation and YAML loading
 */

#include "proctoreye/gaze/EngineConfig.hpp"
#include "proctoreye/core/Configuration.hpp"
#include "proctoreye/core/exception.h"
#include <sstream>

namespace proctoreye {
namespace gaze {

bool EngineConfig::is_valid() const {
    return ear_threshold > 0.0f &&
           blink_frames > 0 &&
           ear_history_size > 0 &&
           movement_threshold > 0.0f &&
           movement_history_size > 0 &&
           analysis_window > 0 &&
           analysis_window <= ear_history_size &&
           analysis_window <= movement_history_size &&
           look_away_threshold_x > 0.0f &&
           look_away_threshold_y > 0.0f &&
           gaze_history_size > 0 &&
           eye_padding_x >= 0 && eye_padding_y >= 0 &&
           min_eye_points > 0 &&
           blur_kernel_size > 0 && (blur_kernel_size % 2) == 1 &&
           hough_dp > 0.0 && hough_min_dist > 0.0 &&
           hough_canny_threshold > 0.0 && hough_accumulator_threshold > 0.0 &&
           min_pupil_radius > 0 && min_pupil_radius <= max_pupil_radius &&
           min_contour_area >= 0.0 &&
           look_away_penalty >= 0.0f &&
           excessive_blinking_penalty >= 0.0f &&
           suspicious_movement_penalty >= 0.0f &&
           abnormal_blink_rate_penalty >= 0.0f &&
           min_normal_blink_rate <= max_normal_blink_rate;
}

std::string EngineConfig::to_string() const {
    std::ostringstream oss;
    oss << "ear_threshold=" << ear_threshold
        << " blink_frames=" << blink_frames
        << " movement_threshold=" << movement_threshold
        << " look_away=(" << look_away_threshold_x << "," << look_away_threshold_y << ")"
        << " history=(ear " << ear_history_size
        << ", gaze " << gaze_history_size
        << ", movement " << movement_history_size << ")"
        << " window=" << analysis_window
        << " pupil_radius=[" << min_pupil_radius << "," << max_pupil_radius << "]";
    return oss.str();
}

EngineConfig EngineConfig::from_configuration(const std::string& section) {
    const auto& cfg = core::Configuration::getInstance();
    const std::string p = section.empty() ? "" : section + ".";

    EngineConfig c;
    c.ear_threshold = cfg.get<float>(p + "blink.ear_threshold", c.ear_threshold);
    c.blink_frames = cfg.get<int>(p + "blink.blink_frames", c.blink_frames);
    c.ear_history_size = cfg.get<std::size_t>(p + "blink.history_size", c.ear_history_size);

    c.movement_threshold = cfg.get<float>(p + "movement.threshold", c.movement_threshold);
    c.movement_history_size = cfg.get<std::size_t>(p + "movement.history_size", c.movement_history_size);
    c.analysis_window = cfg.get<std::size_t>(p + "analysis_window", c.analysis_window);

    c.look_away_threshold_x = cfg.get<float>(p + "gaze.look_away_threshold_x", c.look_away_threshold_x);
    c.look_away_threshold_y = cfg.get<float>(p + "gaze.look_away_threshold_y", c.look_away_threshold_y);
    c.gaze_history_size = cfg.get<std::size_t>(p + "gaze.history_size", c.gaze_history_size);
    c.gaze_bounds.left = cfg.get<float>(p + "gaze.bounds.left", c.gaze_bounds.left);
    c.gaze_bounds.right = cfg.get<float>(p + "gaze.bounds.right", c.gaze_bounds.right);
    c.gaze_bounds.up = cfg.get<float>(p + "gaze.bounds.up", c.gaze_bounds.up);
    c.gaze_bounds.down = cfg.get<float>(p + "gaze.bounds.down", c.gaze_bounds.down);

    c.eye_padding_x = cfg.get<int>(p + "eye_region.padding_x", c.eye_padding_x);
    c.eye_padding_y = cfg.get<int>(p + "eye_region.padding_y", c.eye_padding_y);
    c.min_eye_points = cfg.get<int>(p + "eye_region.min_points", c.min_eye_points);
    c.blur_kernel_size = cfg.get<int>(p + "eye_region.blur_kernel_size", c.blur_kernel_size);

    c.hough_dp = cfg.get<double>(p + "pupil.hough_dp", c.hough_dp);
    c.hough_min_dist = cfg.get<double>(p + "pupil.hough_min_dist", c.hough_min_dist);
    c.hough_canny_threshold = cfg.get<double>(p + "pupil.hough_canny_threshold", c.hough_canny_threshold);
    c.hough_accumulator_threshold = cfg.get<double>(p + "pupil.hough_accumulator_threshold",
                                                    c.hough_accumulator_threshold);
    c.min_pupil_radius = cfg.get<int>(p + "pupil.min_radius", c.min_pupil_radius);
    c.max_pupil_radius = cfg.get<int>(p + "pupil.max_radius", c.max_pupil_radius);
    c.min_contour_area = cfg.get<double>(p + "pupil.min_contour_area", c.min_contour_area);

    c.look_away_penalty = cfg.get<float>(p + "attention.look_away_penalty", c.look_away_penalty);
    c.excessive_blinking_penalty = cfg.get<float>(p + "attention.excessive_blinking_penalty",
                                                  c.excessive_blinking_penalty);
    c.suspicious_movement_penalty = cfg.get<float>(p + "attention.suspicious_movement_penalty",
                                                   c.suspicious_movement_penalty);
    c.abnormal_blink_rate_penalty = cfg.get<float>(p + "attention.abnormal_blink_rate_penalty",
                                                   c.abnormal_blink_rate_penalty);
    c.min_normal_blink_rate = cfg.get<float>(p + "attention.min_blink_rate", c.min_normal_blink_rate);
    c.max_normal_blink_rate = cfg.get<float>(p + "attention.max_blink_rate", c.max_normal_blink_rate);

    if (!c.is_valid()) {
        PROCTOREYE_THROW(core::ConfigurationException,
                         "Invalid engine configuration in section '" + section + "': " + c.to_string());
    }
    return c;
}

} // namespace gaze
} // namespace proctoreye
