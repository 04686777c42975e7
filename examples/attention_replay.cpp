/**
 * @file attention_replay.cpp
 * @brief Replay a recorded session through the attention engine
 *
 * Usage:
 *   attention_replay <video> <landmarks.yaml> [--config engine.yaml]
 *                    [--calibrate-frame N] [--log-dir DIR]
 *
 * The landmarks file holds one entry per video frame:
 *
 *   frames:
 *     - landmarks: [[0.41, 0.38, -0.02], [0.42, 0.39, -0.01], ...]
 *     - {}            # no face in this frame
 *
 * Frames are fed to FrameProcessor on this thread with timestamps derived
 * from the video frame rate. The gaze of frame N is committed as the
 * calibration center. Every result goes to a ViolationMonitor and a
 * session summary is logged at the end.
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#include <proctoreye/core/Configuration.hpp>
#include <proctoreye/core/Logger.hpp>
#include <proctoreye/core/exception.h>
#include <proctoreye/gaze/FrameProcessor.hpp>
#include <proctoreye/gaze/GazeEstimator.hpp>
#include <proctoreye/gaze/ViolationMonitor.hpp>
#include <opencv2/videoio.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace proctoreye;

namespace {

struct ReplayOptions {
    std::string video_path;
    std::string landmarks_path;
    std::string config_path;
    std::string log_dir;
    long calibrate_frame = 0;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <video> <landmarks.yaml>"
              << " [--config engine.yaml] [--calibrate-frame N] [--log-dir DIR]" << std::endl;
}

bool parseArguments(int argc, char** argv, ReplayOptions& options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--calibrate-frame" && i + 1 < argc) {
            try {
                options.calibrate_frame = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid frame number: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--log-dir" && i + 1 < argc) {
            options.log_dir = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return false;
    }
    options.video_path = positional[0];
    options.landmarks_path = positional[1];
    return true;
}

/**
 * @brief Per-frame landmark sets; nullopt where no face was detected
 */
std::vector<std::optional<gaze::LandmarkSet>> loadLandmarks(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        PROCTOREYE_THROW(core::ConfigurationException, "Failed to read " + path + ": " + e.what());
    }

    const YAML::Node frames = root["frames"];
    if (!frames || !frames.IsSequence()) {
        PROCTOREYE_THROW(core::ConfigurationException, path + " has no 'frames' sequence");
    }

    std::vector<std::optional<gaze::LandmarkSet>> sets;
    sets.reserve(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const YAML::Node points = frames[i]["landmarks"];
        if (!points || !points.IsSequence() || points.size() == 0) {
            sets.emplace_back(std::nullopt);
            continue;
        }

        std::vector<cv::Point3f> landmarks;
        landmarks.reserve(points.size());
        try {
            for (const auto& p : points) {
                float z = p.size() > 2 ? p[2].as<float>() : 0.0f;
                landmarks.emplace_back(p[0].as<float>(), p[1].as<float>(), z);
            }
        } catch (const YAML::Exception& e) {
            PROCTOREYE_THROW(core::ConfigurationException,
                             "Bad landmark in frame " + std::to_string(i) + ": " + e.what());
        }

        try {
            sets.emplace_back(gaze::LandmarkSet(std::move(landmarks)));
        } catch (const core::InvalidInputException& e) {
            // Provider output that fails validation is treated as a missed detection
            LOG_WARNING("Frame " + std::to_string(i) + " landmarks rejected: " + e.getMessage());
            sets.emplace_back(std::nullopt);
        }
    }
    return sets;
}

void logSummary(const gaze::FrameProcessor& processor, const gaze::ViolationMonitor& monitor) {
    const gaze::SessionSummary summary = processor.summary();
    const gaze::AttentionStatistics stats = monitor.attention_statistics();

    const std::uint64_t total_frames = summary.frames_processed + summary.frames_without_face;
    auto percent = [total_frames](std::uint64_t count) {
        return total_frames > 0 ? 100.0 * static_cast<double>(count) / static_cast<double>(total_frames) : 0.0;
    };

    PROCTOREYE_LOG_INFO("Replay") << "Frames: " << total_frames
                                  << " (face " << percent(summary.frames_processed) << "%"
                                  << ", both pupils " << percent(summary.frames_with_pupils) << "%"
                                  << ", faulted " << summary.frames_faulted << ")";
    PROCTOREYE_LOG_INFO("Replay") << "Blinks: " << summary.total_blinks
                                  << ", average EAR " << summary.average_ear
                                  << ", calibrated " << (summary.calibrated ? "yes" : "no");
    PROCTOREYE_LOG_INFO("Replay") << "Attention: mean " << stats.mean
                                  << ", min " << stats.min
                                  << ", max " << stats.max
                                  << ", variance " << stats.variance;
    PROCTOREYE_LOG_INFO("Replay") << "Violating frames: " << monitor.total_violations()
                                  << ", consecutive at end " << monitor.consecutive_violations();

    for (const auto& entry : monitor.most_common_violations()) {
        PROCTOREYE_LOG_INFO("Replay") << "  " << gaze::violation_type_to_string(entry.first)
                                      << ": " << entry.second;
    }
}

} // namespace

int main(int argc, char** argv) {
    ReplayOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    auto& logger = core::Logger::getInstance();
    if (!options.log_dir.empty()) {
        if (!logger.initializeWithTimestamp(options.log_dir, core::LogLevel::INFO)) {
            LOG_WARNING("File logging disabled, logging to console only");
        }
    }

    try {
        gaze::EngineConfig engine_config;
        gaze::ViolationConfig monitor_config;
        if (!options.config_path.empty()) {
            core::Configuration::getInstance().load(options.config_path);
            engine_config = gaze::EngineConfig::from_configuration("engine");
            monitor_config = gaze::ViolationConfig::from_configuration("monitor");
        }

        auto landmark_sets = loadLandmarks(options.landmarks_path);
        LOG_INFO("Loaded landmarks for " + std::to_string(landmark_sets.size()) + " frames");

        cv::VideoCapture capture(options.video_path);
        if (!capture.isOpened()) {
            LOG_ERROR("Cannot open video " + options.video_path);
            return 1;
        }

        double fps = capture.get(cv::CAP_PROP_FPS);
        if (fps <= 0.0) {
            fps = 30.0;
        }
        const auto frame_period = std::chrono::duration_cast<core::Clock::duration>(
            std::chrono::duration<double>(1.0 / fps));

        gaze::FrameProcessor processor(engine_config);
        gaze::ViolationMonitor monitor(monitor_config);

        const core::Timestamp start = core::Clock::now();
        cv::Mat frame;
        long index = 0;

        while (capture.read(frame)) {
            if (static_cast<std::size_t>(index) >= landmark_sets.size()) {
                LOG_WARNING("Video has more frames than the landmarks file, stopping at frame " +
                            std::to_string(index));
                break;
            }

            const core::Timestamp timestamp = start + frame_period * index;
            const auto& landmarks = landmark_sets[static_cast<std::size_t>(index)];

            gaze::FrameResult result = landmarks ? processor.process(*landmarks, frame, timestamp)
                                                 : processor.process_no_face();

            if (index == options.calibrate_frame) {
                if (result.face_detected && !result.faulted) {
                    processor.calibrate(result.gaze_direction);
                } else {
                    LOG_WARNING("No usable face on calibration frame " + std::to_string(index));
                }
            }

            auto violations = monitor.record(result, timestamp);
            if (!violations.empty()) {
                std::string names;
                for (auto v : violations) {
                    names += (names.empty() ? "" : ", ") + gaze::violation_type_to_string(v);
                }
                LOG_DEBUG("Frame " + std::to_string(index) + " [" +
                          gaze::describe_gaze_direction(result.gaze_direction) + "] score " +
                          std::to_string(result.attention_score) + ": " + names);
            }

            index++;
        }

        logSummary(processor, monitor);

    } catch (const core::Exception& e) {
        LOG_ERROR(std::string("Replay failed: ") + e.what() + " (" + e.getContext() + ")");
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Replay failed: ") + e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
