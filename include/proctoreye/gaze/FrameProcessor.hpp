/**
 * @file FrameProcessor.hpp
 * @brief Per-frame orchestration of the gaze and attention engine
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_FRAME_PROCESSOR_HPP
#define PROCTOREYE_GAZE_FRAME_PROCESSOR_HPP

#include <memory>
#include <opencv2/core.hpp>
#include "proctoreye/core/types.hpp"
#include "EngineConfig.hpp"
#include "GazeTypes.hpp"
#include "LandmarkSet.hpp"

namespace proctoreye {
namespace gaze {

/**
 * @brief Public entry point of the engine
 *
 * Each call to process() runs, in order: eye region extraction, pupil
 * localization, gaze estimation, blink detection, movement analysis and
 * attention scoring, and returns one FrameResult.
 *
 * Persistent state (blink, calibration, movement, gaze history) is updated
 * transactionally: every frame works on a copy that is committed only when
 * all stages finished. A stage fault is logged and yields a zeroed,
 * faulted FrameResult while the persistent state stays untouched.
 *
 * Thread-safety: Not thread-safe and not reentrant. Drive process(),
 * process_no_face() and calibrate() from one thread.
 */
class FrameProcessor {
public:
    /**
     * @brief Constructor with default configuration
     */
    FrameProcessor();

    /**
     * @brief Constructor with custom configuration
     * @throws core::ConfigurationException if config.is_valid() is false
     */
    explicit FrameProcessor(const EngineConfig& config);

    ~FrameProcessor();

    // Disable copy, allow move
    FrameProcessor(const FrameProcessor&) = delete;
    FrameProcessor& operator=(const FrameProcessor&) = delete;
    FrameProcessor(FrameProcessor&&) noexcept;
    FrameProcessor& operator=(FrameProcessor&&) noexcept;

    /**
     * @brief Process one detected face
     *
     * @param landmarks Validated landmark set for this frame
     * @param frame Color (BGR/BGRA) or grayscale 8-bit frame the landmarks refer to
     * @param timestamp Capture time of the frame
     */
    FrameResult process(const LandmarkSet& landmarks,
                        const cv::Mat& frame,
                        core::Timestamp timestamp = core::Clock::now());

    /**
     * @brief Record a frame in which the provider found no face
     *
     * Returns a zeroed result (attention 0, face_detected false); engine
     * state is not touched.
     */
    FrameResult process_no_face();

    /**
     * @brief Commit a gaze vector as the calibrated center
     *
     * Must be serialized with process() calls.
     */
    void calibrate(const cv::Point2f& gaze_direction);

    bool is_calibrated() const;

    /**
     * @brief Snapshot of accumulated history
     */
    SessionSummary summary() const;

    const EngineConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_FRAME_PROCESSOR_HPP
