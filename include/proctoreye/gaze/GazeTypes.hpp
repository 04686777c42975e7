/**
 * @file GazeTypes.hpp
 * @brief Core data types for the gaze and attention engine
 *
 * Defines per-eye and per-frame result structures, the stage outcome type
 * and the session summary snapshot.
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_TYPES_HPP
#define PROCTOREYE_GAZE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

namespace proctoreye {
namespace gaze {

/**
 * @brief Which eye, from the subject's point of view as labelled by the landmark model
 */
enum class EyeSide {
    LEFT = 0,
    RIGHT = 1
};

inline std::string eye_side_to_string(EyeSide side) {
    return side == EyeSide::LEFT ? "left" : "right";
}

/**
 * @brief Pupil position in full-frame pixels, or nullopt when not found
 */
using PupilEstimate = std::optional<cv::Point>;

/**
 * @brief Outcome kind of one processing stage
 */
enum class StageStatus {
    OK = 0,              ///< Stage produced a value
    INSUFFICIENT_INPUT,  ///< Too few landmarks or degenerate geometry
    NOT_FOUND,           ///< Detection ran but found nothing
    FAULT                ///< Unexpected failure
};

inline std::string stage_status_to_string(StageStatus status) {
    switch (status) {
        case StageStatus::OK: return "OK";
        case StageStatus::INSUFFICIENT_INPUT: return "InsufficientInput";
        case StageStatus::NOT_FOUND: return "NotFound";
        case StageStatus::FAULT: return "Fault";
        default: return "Invalid";
    }
}

/**
 * @brief Value-or-status result of a processing stage
 */
template<typename T>
struct StageResult {
    StageStatus status = StageStatus::NOT_FOUND;
    std::optional<T> value;
    std::string detail;

    bool ok() const { return status == StageStatus::OK && value.has_value(); }

    static StageResult success(T v) {
        StageResult r;
        r.status = StageStatus::OK;
        r.value = std::move(v);
        return r;
    }

    static StageResult failure(StageStatus status, std::string detail) {
        StageResult r;
        r.status = status;
        r.detail = std::move(detail);
        return r;
    }
};

/**
 * @brief Preprocessed eye crop, valid for one frame only
 */
struct EyeRegion {
    EyeSide side = EyeSide::LEFT;

    /// Grayscale, blurred and histogram-equalized crop
    cv::Mat gray;

    /// Crop rectangle in frame pixels; tl() is (x_min, y_min), br() is (x_max, y_max)
    cv::Rect bounding_box;

    /// Eye contour landmarks in frame pixels, unclipped
    std::vector<cv::Point> landmarks;
};

/**
 * @brief Metrics of one eye in one frame
 *
 * pupil_center() returns (0, 0) when no pupil was found. That sentinel
 * collides with a real pupil at the frame's top-left pixel, which cannot
 * occur for a face inside the frame (the eye crop is padded away from the
 * border by the landmark geometry). Use has_pupil() to tell them apart.
 */
struct EyeMetrics {
    EyeSide side = EyeSide::LEFT;
    float ear = 0.0f;
    cv::Point2f gaze_direction{0.0f, 0.0f};
    PupilEstimate pupil;
    bool blink_detected = false;

    bool has_pupil() const { return pupil.has_value(); }

    cv::Point pupil_center() const { return pupil.value_or(cv::Point(0, 0)); }
};

/**
 * @brief Blink detector output for one frame
 */
struct BlinkData {
    bool blink_detected = false;
    float ear = 0.0f;                ///< Mean EAR of both eyes
    float blink_rate = 0.0f;         ///< Blinks per minute as defined by BlinkDetector
    bool excessive_blinking = false;
};

/**
 * @brief Movement analyzer output for one frame
 */
struct MovementData {
    float movement_magnitude = 0.0f; ///< Mean pupil displacement in pixels
    bool suspicious = false;
};

/**
 * @brief Proctoring flags
 */
struct AttentionFlags {
    bool looking_away = false;
    bool excessive_blinking = false;
    bool suspicious_movement = false;

    bool any() const { return looking_away || excessive_blinking || suspicious_movement; }
};

/**
 * @brief Everything the engine produced for one frame
 */
struct FrameResult {
    std::uint64_t frame_index = 0;

    std::optional<EyeMetrics> left_eye;
    std::optional<EyeMetrics> right_eye;

    BlinkData blink_data;
    cv::Point2f gaze_direction{0.0f, 0.0f};  ///< Mean of the present eyes' vectors
    MovementData movement_data;
    float attention_score = 0.0f;            ///< [0, 100]
    AttentionFlags flags;

    bool face_detected = false;              ///< False for frames without a detection
    bool faulted = false;                    ///< True when a stage failed and defaults were substituted
};

/**
 * @brief Read-only snapshot of accumulated session history
 */
struct SessionSummary {
    int total_blinks = 0;
    float average_ear = 0.0f;
    std::vector<float> recent_movement_samples;       ///< Up to the last analysis window
    std::vector<cv::Point2f> recent_gaze_samples;     ///< Up to the last analysis window
    AttentionFlags current_flags;
    bool calibrated = false;

    std::uint64_t frames_processed = 0;     ///< Frames with a detection, including faulted ones
    std::uint64_t frames_without_face = 0;
    std::uint64_t frames_faulted = 0;
    std::uint64_t frames_with_pupils = 0;   ///< Frames where both pupils were found
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_TYPES_HPP
