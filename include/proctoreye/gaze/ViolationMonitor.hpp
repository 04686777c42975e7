/**
 * @file ViolationMonitor.hpp
 * @brief Proctoring violation bookkeeping over a stream of frame results
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_VIOLATION_MONITOR_HPP
#define PROCTOREYE_GAZE_VIOLATION_MONITOR_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>
#include "proctoreye/core/types.hpp"
#include "GazeTypes.hpp"
#include "RingBuffer.hpp"

namespace proctoreye {
namespace gaze {

enum class ViolationType {
    LOOKING_AWAY = 0,
    EXCESSIVE_BLINKING,
    SUSPICIOUS_MOVEMENT,
    LOW_ATTENTION
};

std::string violation_type_to_string(ViolationType type);

/**
 * @brief One logged violating frame
 */
struct ViolationEntry {
    core::Timestamp timestamp;
    std::vector<ViolationType> violations;
    float attention_score = 0.0f;
    cv::Point2f gaze_direction{0.0f, 0.0f};
};

struct ViolationConfig {
    float alert_threshold = 60.0f;               ///< LOW_ATTENTION below this score
    int max_consecutive_violations = 5;          ///< is_critical() at or above this
    std::size_t attention_history_capacity = 300;
    std::size_t violation_log_capacity = 1000;
    float min_detection_accuracy = 0.8f;         ///< Critical only while face or eye detection rate is below this

    bool is_valid() const;

    /**
     * @brief Read values under a key prefix from core::Configuration
     * @throws core::ConfigurationException on a malformed value or an invalid result
     */
    static ViolationConfig from_configuration(const std::string& section = "monitor");
};

struct AttentionStatistics {
    std::size_t samples = 0;
    float mean = 0.0f;
    float min = 0.0f;
    float max = 0.0f;
    float variance = 0.0f;  ///< Population variance
};

/**
 * @brief Consumes FrameResults and tracks violations
 *
 * The consecutive counter rises by one on each violating frame and decays
 * by one (floor 0) on each clean frame. Frames without a face carry an
 * attention score of 0 and are therefore LOW_ATTENTION.
 *
 * A full counter only becomes critical when detection is unreliable: the
 * face detection rate or the eye detection rate over all recorded frames
 * is below min_detection_accuracy. A frame counts toward eye detection
 * when both pupils were found and the candidate is not looking away.
 *
 * Thread-safety: Not thread-safe; feed it from the frame loop thread.
 */
class ViolationMonitor {
public:
    ViolationMonitor();

    /**
     * @throws core::ConfigurationException if config.is_valid() is false
     */
    explicit ViolationMonitor(const ViolationConfig& config);

    /**
     * @brief Record one frame
     * @return Violations found in this frame, in ViolationType order
     */
    std::vector<ViolationType> record(const FrameResult& result,
                                      core::Timestamp timestamp = core::Clock::now());

    int consecutive_violations() const { return consecutive_violations_; }

    /**
     * @brief Counter at max_consecutive_violations and a detection rate
     *        below min_detection_accuracy
     */
    bool is_critical() const;

    /// Fraction of recorded frames with a face, 0 before the first frame
    float face_detection_rate() const;

    /// Fraction of recorded frames with both pupils found while not looking away
    float eye_detection_rate() const;

    /// Violating frames recorded since the last reset, including evicted log entries
    std::size_t total_violations() const { return total_violations_; }

    std::vector<ViolationEntry> violation_log() const;

    AttentionStatistics attention_statistics() const;

    /**
     * @brief Violation counts over the retained log, most frequent first
     * @param limit Maximum entries returned, 0 for all
     */
    std::vector<std::pair<ViolationType, std::size_t>> most_common_violations(std::size_t limit = 5) const;

    void reset();

    const ViolationConfig& config() const { return config_; }

private:
    ViolationConfig config_;
    RingBuffer<float> attention_history_;
    RingBuffer<ViolationEntry> violation_log_;
    int consecutive_violations_ = 0;
    std::size_t total_violations_ = 0;
    std::size_t frames_recorded_ = 0;
    std::size_t frames_with_face_ = 0;
    std::size_t frames_with_eyes_ = 0;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_VIOLATION_MONITOR_HPP
