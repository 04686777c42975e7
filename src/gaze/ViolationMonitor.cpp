/**
 * @file ViolationMonitor.cpp
 * @brief Violation log, consecutive counter and attention statistics
 */

#include "proctoreye/gaze/ViolationMonitor.hpp"
#include "proctoreye/core/Configuration.hpp"
#include "proctoreye/core/Logger.hpp"
#include "proctoreye/core/exception.h"
#include <algorithm>
#include <array>
#include <sstream>

namespace proctoreye {
namespace gaze {

std::string violation_type_to_string(ViolationType type) {
    switch (type) {
        case ViolationType::LOOKING_AWAY: return "Looking Away";
        case ViolationType::EXCESSIVE_BLINKING: return "Excessive Blinking";
        case ViolationType::SUSPICIOUS_MOVEMENT: return "Suspicious Movement";
        case ViolationType::LOW_ATTENTION: return "Low Attention";
        default: return "Unknown";
    }
}

bool ViolationConfig::is_valid() const {
    return alert_threshold >= 0.0f && alert_threshold <= 100.0f &&
           max_consecutive_violations > 0 &&
           attention_history_capacity > 0 &&
           violation_log_capacity > 0 &&
           min_detection_accuracy >= 0.0f && min_detection_accuracy <= 1.0f;
}

ViolationConfig ViolationConfig::from_configuration(const std::string& section) {
    const auto& cfg = core::Configuration::getInstance();
    const std::string p = section.empty() ? "" : section + ".";

    ViolationConfig c;
    c.alert_threshold = cfg.get<float>(p + "alert_threshold", c.alert_threshold);
    c.max_consecutive_violations = cfg.get<int>(p + "max_consecutive_violations", c.max_consecutive_violations);
    c.attention_history_capacity = cfg.get<std::size_t>(p + "attention_history_size", c.attention_history_capacity);
    c.violation_log_capacity = cfg.get<std::size_t>(p + "violation_log_size", c.violation_log_capacity);
    c.min_detection_accuracy = cfg.get<float>(p + "min_detection_accuracy", c.min_detection_accuracy);

    if (!c.is_valid()) {
        PROCTOREYE_THROW(core::ConfigurationException, "invalid violation monitor configuration in '" + section + "'");
    }
    return c;
}

ViolationMonitor::ViolationMonitor()
    : ViolationMonitor(ViolationConfig{}) {
}

ViolationMonitor::ViolationMonitor(const ViolationConfig& config)
    : config_(config)
    , attention_history_(std::max<std::size_t>(config.attention_history_capacity, 1))
    , violation_log_(std::max<std::size_t>(config.violation_log_capacity, 1)) {
    if (!config_.is_valid()) {
        PROCTOREYE_THROW(core::ConfigurationException, "invalid violation monitor configuration");
    }
}

std::vector<ViolationType> ViolationMonitor::record(const FrameResult& result, core::Timestamp timestamp) {
    std::vector<ViolationType> violations;
    if (result.flags.looking_away) {
        violations.push_back(ViolationType::LOOKING_AWAY);
    }
    if (result.flags.excessive_blinking) {
        violations.push_back(ViolationType::EXCESSIVE_BLINKING);
    }
    if (result.flags.suspicious_movement) {
        violations.push_back(ViolationType::SUSPICIOUS_MOVEMENT);
    }
    if (result.attention_score < config_.alert_threshold) {
        violations.push_back(ViolationType::LOW_ATTENTION);
    }

    attention_history_.push(result.attention_score);

    frames_recorded_++;
    if (result.face_detected) {
        frames_with_face_++;
    }
    if (result.left_eye && result.left_eye->has_pupil() &&
        result.right_eye && result.right_eye->has_pupil() &&
        !result.flags.looking_away) {
        frames_with_eyes_++;
    }

    if (violations.empty()) {
        consecutive_violations_ = std::max(0, consecutive_violations_ - 1);
        return violations;
    }

    const bool was_critical = is_critical();
    consecutive_violations_++;
    total_violations_++;

    ViolationEntry entry;
    entry.timestamp = timestamp;
    entry.violations = violations;
    entry.attention_score = result.attention_score;
    entry.gaze_direction = result.gaze_direction;
    violation_log_.push(std::move(entry));

    if (is_critical() && !was_critical) {
        PROCTOREYE_LOG_WARNING("ViolationMonitor").frame(result.frame_index)
            << consecutive_violations_ << " consecutive violating frames, face detection "
            << face_detection_rate() << ", eye detection " << eye_detection_rate();
    }
    return violations;
}

bool ViolationMonitor::is_critical() const {
    if (consecutive_violations_ < config_.max_consecutive_violations) {
        return false;
    }
    return face_detection_rate() < config_.min_detection_accuracy ||
           eye_detection_rate() < config_.min_detection_accuracy;
}

float ViolationMonitor::face_detection_rate() const {
    return frames_recorded_ > 0
        ? static_cast<float>(frames_with_face_) / static_cast<float>(frames_recorded_) : 0.0f;
}

float ViolationMonitor::eye_detection_rate() const {
    return frames_recorded_ > 0
        ? static_cast<float>(frames_with_eyes_) / static_cast<float>(frames_recorded_) : 0.0f;
}

std::vector<ViolationEntry> ViolationMonitor::violation_log() const {
    return violation_log_.last();
}

AttentionStatistics ViolationMonitor::attention_statistics() const {
    AttentionStatistics stats;
    if (attention_history_.is_empty()) {
        return stats;
    }

    stats.samples = attention_history_.size();
    stats.min = *std::min_element(attention_history_.begin(), attention_history_.end());
    stats.max = *std::max_element(attention_history_.begin(), attention_history_.end());

    double sum = 0.0;
    for (float v : attention_history_) {
        sum += v;
    }
    const double mean = sum / static_cast<double>(stats.samples);

    double squared = 0.0;
    for (float v : attention_history_) {
        squared += (v - mean) * (v - mean);
    }

    stats.mean = static_cast<float>(mean);
    stats.variance = static_cast<float>(squared / static_cast<double>(stats.samples));
    return stats;
}

std::vector<std::pair<ViolationType, std::size_t>> ViolationMonitor::most_common_violations(std::size_t limit) const {
    std::array<std::size_t, 4> counts{};
    for (const auto& entry : violation_log_) {
        for (ViolationType type : entry.violations) {
            counts[static_cast<std::size_t>(type)]++;
        }
    }

    std::vector<std::pair<ViolationType, std::size_t>> ranked;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] > 0) {
            ranked.emplace_back(static_cast<ViolationType>(i), counts[i]);
        }
    }

    // Ties keep ViolationType order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    if (limit > 0 && ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

void ViolationMonitor::reset() {
    attention_history_.clear();
    violation_log_.clear();
    consecutive_violations_ = 0;
    total_violations_ = 0;
    frames_recorded_ = 0;
    frames_with_face_ = 0;
    frames_with_eyes_ = 0;
    PROCTOREYE_LOG_DEBUG("ViolationMonitor") << "reset";
}

} // namespace gaze
} // namespace proctoreye
