/**
 * @file EngineConfig.hpp
 * @brief Tunable parameters of the attention engine
 *
 * All values are fixed when the engine is constructed.
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_ENGINE_CONFIG_HPP
#define PROCTOREYE_GAZE_ENGINE_CONFIG_HPP

#include <cstddef>
#include <string>

namespace proctoreye {
namespace gaze {

/**
 * @brief Reference gaze bounds recorded with a calibration
 */
struct GazeBounds {
    float left = -50.0f;
    float right = 50.0f;
    float up = -30.0f;
    float down = 30.0f;
};

/**
 * @brief Attention engine configuration
 */
struct EngineConfig {
    // Blink detection
    float ear_threshold = 0.25f;             ///< EAR below this counts as a closed-eye sample
    int blink_frames = 3;                    ///< Consecutive low samples needed for one blink
    std::size_t ear_history_size = 30;       ///< EAR ring capacity (1 s at 30 FPS)

    // Eye movement
    float movement_threshold = 10.0f;        ///< Pixels; suspicious when window mean > 2x this
    std::size_t movement_history_size = 90;  ///< Movement ring capacity (3 s at 30 FPS)
    std::size_t analysis_window = 30;        ///< Samples used by the windowed flags

    // Gaze
    float look_away_threshold_x = 40.0f;     ///< Max horizontal deviation from calibrated center
    float look_away_threshold_y = 30.0f;     ///< Max vertical deviation from calibrated center
    std::size_t gaze_history_size = 60;      ///< Gaze ring capacity (2 s at 30 FPS)
    GazeBounds gaze_bounds;

    // Eye region extraction
    int eye_padding_x = 10;                  ///< Horizontal bounding box padding (px)
    int eye_padding_y = 5;                   ///< Vertical bounding box padding (px)
    int min_eye_points = 6;                  ///< Minimum projected landmarks per eye
    int blur_kernel_size = 5;                ///< Gaussian kernel (odd)

    // Pupil localization
    double hough_dp = 1.0;
    double hough_min_dist = 20.0;
    double hough_canny_threshold = 50.0;
    double hough_accumulator_threshold = 30.0;
    int min_pupil_radius = 5;
    int max_pupil_radius = 25;
    double min_contour_area = 20.0;          ///< px^2, fallback contour must exceed this

    // Attention scoring
    float look_away_penalty = 30.0f;
    float excessive_blinking_penalty = 20.0f;
    float suspicious_movement_penalty = 25.0f;
    float abnormal_blink_rate_penalty = 15.0f;
    float min_normal_blink_rate = 5.0f;      ///< Blinks per minute
    float max_normal_blink_rate = 30.0f;     ///< Blinks per minute

    /**
     * @brief Validate configuration
     */
    bool is_valid() const;

    std::string to_string() const;

    /**
     * @brief Read values under a key prefix from core::Configuration
     *
     * Missing keys keep their defaults.
     *
     * @param section Key prefix, e.g. "engine"
     * @throws core::ConfigurationException on a malformed value or an invalid result
     */
    static EngineConfig from_configuration(const std::string& section = "engine");
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_ENGINE_CONFIG_HPP
