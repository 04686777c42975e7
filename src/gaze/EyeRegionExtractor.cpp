/**
 * @file EyeRegionExtractor.cpp
 * @brief Eye region cropping and preprocessing
 */

#include "proctoreye/gaze/EyeRegionExtractor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace proctoreye {
namespace gaze {

EyeRegionExtractor::EyeRegionExtractor(const EngineConfig& config)
    : config_(config) {
}

const std::array<int, 16>& EyeRegionExtractor::eye_indices(EyeSide side) {
    return side == EyeSide::LEFT ? landmark_index::LEFT_EYE : landmark_index::RIGHT_EYE;
}

StageResult<EyeRegion> EyeRegionExtractor::extract(const LandmarkSet& landmarks,
                                                   const cv::Mat& frame,
                                                   EyeSide side) const {
    const cv::Size frame_size = frame.size();

    // Points outside the frame are kept; only the padded box is clipped
    std::vector<cv::Point> eye_points;
    eye_points.reserve(16);
    for (int index : eye_indices(side)) {
        eye_points.push_back(landmarks.pixel(static_cast<std::size_t>(index), frame_size));
    }

    if (static_cast<int>(eye_points.size()) < config_.min_eye_points) {
        return StageResult<EyeRegion>::failure(
            StageStatus::INSUFFICIENT_INPUT,
            eye_side_to_string(side) + " eye has " + std::to_string(eye_points.size()) +
            " landmarks");
    }

    cv::Rect box = padded_bounds(eye_points, frame_size);
    if (box.empty()) {
        return StageResult<EyeRegion>::failure(
            StageStatus::INSUFFICIENT_INPUT,
            eye_side_to_string(side) + " eye bounding box is degenerate");
    }

    EyeRegion region;
    region.side = side;
    region.bounding_box = box;
    region.landmarks = std::move(eye_points);
    region.gray = normalize_crop(frame(box));

    return StageResult<EyeRegion>::success(std::move(region));
}

cv::Rect EyeRegionExtractor::padded_bounds(const std::vector<cv::Point>& points,
                                           const cv::Size& frame_size) const {
    if (points.empty()) {
        return cv::Rect();
    }

    auto [min_x_it, max_x_it] = std::minmax_element(points.begin(), points.end(),
        [](const cv::Point& a, const cv::Point& b) { return a.x < b.x; });
    auto [min_y_it, max_y_it] = std::minmax_element(points.begin(), points.end(),
        [](const cv::Point& a, const cv::Point& b) { return a.y < b.y; });

    int x_min = std::max(0, min_x_it->x - config_.eye_padding_x);
    int y_min = std::max(0, min_y_it->y - config_.eye_padding_y);
    int x_max = std::min(frame_size.width, max_x_it->x + config_.eye_padding_x);
    int y_max = std::min(frame_size.height, max_y_it->y + config_.eye_padding_y);

    if (x_max <= x_min || y_max <= y_min) {
        return cv::Rect();
    }
    return cv::Rect(x_min, y_min, x_max - x_min, y_max - y_min);
}

cv::Mat EyeRegionExtractor::normalize_crop(const cv::Mat& crop) const {
    cv::Mat gray;
    switch (crop.channels()) {
        case 3:
            cv::cvtColor(crop, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(crop, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            gray = crop.clone();
            break;
    }

    const int k = config_.blur_kernel_size;
    cv::GaussianBlur(gray, gray, cv::Size(k, k), 0);
    // Contrast stretch; requires 8-bit input
    cv::equalizeHist(gray, gray);
    return gray;
}

} // namespace gaze
} // namespace proctoreye
