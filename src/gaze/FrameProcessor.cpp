/**
 * @file FrameProcessor.cpp
 * @brief Per-frame orchestration with transactional state commit
 */

#include "proctoreye/gaze/FrameProcessor.hpp"
#include "proctoreye/gaze/AttentionScorer.hpp"
#include "proctoreye/gaze/BlinkDetector.hpp"
#include "proctoreye/gaze/EyeRegionExtractor.hpp"
#include "proctoreye/gaze/GazeEstimator.hpp"
#include "proctoreye/gaze/MovementAnalyzer.hpp"
#include "proctoreye/gaze/PupilLocator.hpp"
#include "proctoreye/gaze/RingBuffer.hpp"
#include "proctoreye/core/Logger.hpp"
#include "proctoreye/core/exception.h"
#include <numeric>

namespace proctoreye {
namespace gaze {

namespace {

/**
 * @brief Everything that survives from one frame to the next
 */
struct EngineState {
    BlinkState blink;
    MovementState movement;
    CalibrationReference calibration;
    RingBuffer<cv::Point2f> gaze_history;
    AttentionFlags last_flags;

    explicit EngineState(const EngineConfig& config)
        : blink(config.ear_history_size)
        , movement(config.movement_history_size)
        , gaze_history(config.gaze_history_size) {}
};

struct SessionCounters {
    std::uint64_t frames_processed = 0;
    std::uint64_t frames_without_face = 0;
    std::uint64_t frames_faulted = 0;
    std::uint64_t frames_with_pupils = 0;
};

} // namespace

class FrameProcessor::Impl {
public:
    explicit Impl(const EngineConfig& cfg)
        : config(cfg)
        , extractor(cfg)
        , pupil_locator(cfg)
        , blink_detector(cfg)
        , gaze_estimator(cfg)
        , movement_analyzer(cfg)
        , scorer(cfg)
        , state(cfg) {
    }

    FrameResult run(const LandmarkSet& landmarks, const cv::Mat& frame,
                    core::Timestamp timestamp, std::uint64_t frame_index,
                    EngineState& working, const char*& stage) const;

    EngineConfig config;

    EyeRegionExtractor extractor;
    PupilLocator pupil_locator;
    BlinkDetector blink_detector;
    GazeEstimator gaze_estimator;
    MovementAnalyzer movement_analyzer;
    AttentionScorer scorer;

    EngineState state;
    SessionCounters counters;
    std::uint64_t next_frame_index = 0;
};

FrameResult FrameProcessor::Impl::run(const LandmarkSet& landmarks, const cv::Mat& frame,
                                      core::Timestamp timestamp, std::uint64_t frame_index,
                                      EngineState& working, const char*& stage) const {
    FrameResult result;
    result.face_detected = true;

    stage = "input";
    if (frame.empty()) {
        PROCTOREYE_THROW_CODE(core::InvalidInputException, core::ResultCode::ERROR_INVALID_FRAME,
                              "empty frame");
    }
    const cv::Size frame_size = frame.size();

    // Eye regions, pupils and per-eye gaze
    std::optional<EyeRegion> regions[2];
    PupilEstimate pupils[2];
    cv::Point2f gazes[2];
    std::vector<cv::Point2f> present_gazes;

    for (EyeSide side : {EyeSide::LEFT, EyeSide::RIGHT}) {
        const int i = static_cast<int>(side);

        stage = "eye_region";
        StageResult<EyeRegion> region = extractor.extract(landmarks, frame, side);
        if (!region.ok()) {
            PROCTOREYE_LOG_DEBUG("FrameProcessor").frame(frame_index)
                << eye_side_to_string(side) << " eye region " << stage_status_to_string(region.status)
                << ": " << region.detail;
            continue;
        }

        stage = "pupil";
        StageResult<cv::Point> pupil = pupil_locator.locate(*region.value);
        if (pupil.status == StageStatus::FAULT) {
            throw core::ProcessingException(stage, pupil.detail, PROCTOREYE_WHERE);
        }
        if (pupil.ok()) {
            pupils[i] = *pupil.value;
        } else {
            PROCTOREYE_LOG_DEBUG("FrameProcessor").frame(frame_index)
                << eye_side_to_string(side) << " pupil " << stage_status_to_string(pupil.status)
                << ": " << pupil.detail;
        }

        stage = "gaze";
        gazes[i] = gaze_estimator.estimate(region.value->landmarks, pupils[i]);
        present_gazes.push_back(gazes[i]);
        regions[i] = std::move(region.value);
    }

    stage = "blink";
    result.blink_data = blink_detector.update(working.blink, landmarks, frame_size, timestamp);

    for (EyeSide side : {EyeSide::LEFT, EyeSide::RIGHT}) {
        const int i = static_cast<int>(side);
        if (!regions[i]) {
            continue;
        }
        EyeMetrics metrics;
        metrics.side = side;
        metrics.ear = BlinkDetector::compute_ear(landmarks, side, frame_size);
        metrics.gaze_direction = gazes[i];
        metrics.pupil = pupils[i];
        metrics.blink_detected = result.blink_data.blink_detected;
        (side == EyeSide::LEFT ? result.left_eye : result.right_eye) = metrics;
    }

    stage = "movement";
    result.movement_data = movement_analyzer.update(working.movement, pupils[0], pupils[1]);

    stage = "gaze";
    result.gaze_direction = GazeEstimator::average(present_gazes);
    working.gaze_history.push(result.gaze_direction);

    stage = "attention";
    result.flags.looking_away = gaze_estimator.is_looking_away(working.calibration, result.gaze_direction);
    result.flags.excessive_blinking = result.blink_data.excessive_blinking;
    result.flags.suspicious_movement = working.movement.suspicious;

    AttentionInputs inputs;
    inputs.looking_away = result.flags.looking_away;
    inputs.excessive_blinking = result.flags.excessive_blinking;
    inputs.suspicious_movement = result.movement_data.suspicious;
    inputs.blink_rate = result.blink_data.blink_rate;
    result.attention_score = scorer.score(inputs);

    working.last_flags = result.flags;
    return result;
}

FrameProcessor::FrameProcessor()
    : FrameProcessor(EngineConfig{}) {
}

FrameProcessor::FrameProcessor(const EngineConfig& config) {
    if (!config.is_valid()) {
        PROCTOREYE_THROW(core::ConfigurationException, "invalid engine configuration: " + config.to_string());
    }
    pImpl = std::make_unique<Impl>(config);
    PROCTOREYE_LOG_INFO("FrameProcessor") << "initialized with " << config.to_string();
}

FrameProcessor::~FrameProcessor() = default;

FrameProcessor::FrameProcessor(FrameProcessor&&) noexcept = default;
FrameProcessor& FrameProcessor::operator=(FrameProcessor&&) noexcept = default;

FrameResult FrameProcessor::process(const LandmarkSet& landmarks,
                                    const cv::Mat& frame,
                                    core::Timestamp timestamp) {
    const std::uint64_t frame_index = pImpl->next_frame_index++;
    pImpl->counters.frames_processed++;

    EngineState working = pImpl->state;
    const char* stage = "init";

    try {
        FrameResult result = pImpl->run(landmarks, frame, timestamp, frame_index, working, stage);
        result.frame_index = frame_index;

        pImpl->state = std::move(working);
        if (result.left_eye && result.left_eye->has_pupil() &&
            result.right_eye && result.right_eye->has_pupil()) {
            pImpl->counters.frames_with_pupils++;
        }
        return result;
    } catch (const cv::Exception& e) {
        PROCTOREYE_LOG_ERROR("FrameProcessor").frame(frame_index)
            << "OpenCV fault in stage '" << stage << "': " << e.what();
    } catch (const core::Exception& e) {
        PROCTOREYE_LOG_ERROR("FrameProcessor").frame(frame_index)
            << "fault in stage '" << stage << "': [" << core::resultCodeToString(e.getResultCode())
            << "] " << e.getMessage();
    } catch (const std::exception& e) {
        PROCTOREYE_LOG_ERROR("FrameProcessor").frame(frame_index)
            << "fault in stage '" << stage << "': " << e.what();
    }

    pImpl->counters.frames_faulted++;

    FrameResult faulted;
    faulted.frame_index = frame_index;
    faulted.face_detected = true;
    faulted.faulted = true;
    return faulted;
}

FrameResult FrameProcessor::process_no_face() {
    FrameResult result;
    result.frame_index = pImpl->next_frame_index++;
    pImpl->counters.frames_without_face++;
    return result;
}

void FrameProcessor::calibrate(const cv::Point2f& gaze_direction) {
    pImpl->gaze_estimator.commit_calibration(pImpl->state.calibration, gaze_direction);
}

bool FrameProcessor::is_calibrated() const {
    return pImpl->state.calibration.calibrated;
}

SessionSummary FrameProcessor::summary() const {
    const EngineState& state = pImpl->state;
    const std::size_t window = pImpl->config.analysis_window;

    SessionSummary summary;
    summary.total_blinks = state.blink.total_blinks;

    if (!state.blink.ear_history.is_empty()) {
        float sum = std::accumulate(state.blink.ear_history.begin(), state.blink.ear_history.end(), 0.0f);
        summary.average_ear = sum / static_cast<float>(state.blink.ear_history.size());
    }

    summary.recent_movement_samples = state.movement.movement_history.last(window);
    summary.recent_gaze_samples = state.gaze_history.last(window);
    summary.current_flags = state.last_flags;
    summary.calibrated = state.calibration.calibrated;

    summary.frames_processed = pImpl->counters.frames_processed;
    summary.frames_without_face = pImpl->counters.frames_without_face;
    summary.frames_faulted = pImpl->counters.frames_faulted;
    summary.frames_with_pupils = pImpl->counters.frames_with_pupils;
    return summary;
}

const EngineConfig& FrameProcessor::config() const {
    return pImpl->config;
}

} // namespace gaze
} // namespace proctoreye
