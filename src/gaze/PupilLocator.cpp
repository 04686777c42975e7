/**
 * @file PupilLocator.cpp
 * @brief Hough circle search with Otsu contour fallback
 */

#include "proctoreye/gaze/PupilLocator.hpp"
#include "proctoreye/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <limits>

namespace proctoreye {
namespace gaze {

PupilLocator::PupilLocator(const EngineConfig& config)
    : config_(config) {
}

StageResult<cv::Point> PupilLocator::locate(const EyeRegion& region) const {
    if (region.gray.empty()) {
        return StageResult<cv::Point>::failure(StageStatus::INSUFFICIENT_INPUT,
                                               "empty " + eye_side_to_string(region.side) + " eye crop");
    }
    if (region.gray.type() != CV_8UC1) {
        return StageResult<cv::Point>::failure(StageStatus::FAULT,
                                               eye_side_to_string(region.side) + " eye crop is not 8-bit grayscale");
    }

    std::optional<cv::Point> local = find_circle(region.gray);
    const char* method = "hough";
    if (!local) {
        local = find_dark_blob(region.gray);
        method = "contour";
    }

    if (!local) {
        return StageResult<cv::Point>::failure(StageStatus::NOT_FOUND,
                                               "no pupil candidate in " +
                                               eye_side_to_string(region.side) + " eye");
    }

    cv::Point frame_point = *local + region.bounding_box.tl();
    PROCTOREYE_LOG_TRACE("PupilLocator") << eye_side_to_string(region.side) << " pupil via " << method
                                         << " at " << frame_point;
    return StageResult<cv::Point>::success(frame_point);
}

std::optional<cv::Point> PupilLocator::find_circle(const cv::Mat& gray) const {
    std::vector<cv::Vec3f> circles;
    cv::HoughCircles(gray, circles, cv::HOUGH_GRADIENT,
                     config_.hough_dp,
                     config_.hough_min_dist,
                     config_.hough_canny_threshold,
                     config_.hough_accumulator_threshold,
                     config_.min_pupil_radius,
                     config_.max_pupil_radius);

    if (circles.empty()) {
        return std::nullopt;
    }
    return select_central_candidate(circles, gray.size());
}

std::optional<cv::Point> PupilLocator::find_dark_blob(const cv::Mat& gray) const {
    cv::Mat binary;
    cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    cv::bitwise_not(binary, binary);  // pupil becomes the bright blob

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours.empty()) {
        return std::nullopt;
    }

    const std::vector<cv::Point>* largest = nullptr;
    double largest_area = -1.0;
    for (const auto& contour : contours) {
        double area = cv::contourArea(contour);
        if (area > largest_area) {
            largest_area = area;
            largest = &contour;
        }
    }

    if (largest == nullptr || largest_area <= config_.min_contour_area) {
        return std::nullopt;
    }

    cv::Moments m = cv::moments(*largest);
    if (m.m00 == 0.0) {
        return std::nullopt;
    }
    return cv::Point(static_cast<int>(m.m10 / m.m00), static_cast<int>(m.m01 / m.m00));
}

cv::Point PupilLocator::select_central_candidate(const std::vector<cv::Vec3f>& circles,
                                                 const cv::Size& crop_size) {
    const int center_x = crop_size.width / 2;
    const int center_y = crop_size.height / 2;

    cv::Point best(0, 0);
    double best_distance = std::numeric_limits<double>::max();
    for (const auto& c : circles) {
        cv::Point candidate(cvRound(c[0]), cvRound(c[1]));
        double dx = candidate.x - center_x;
        double dy = candidate.y - center_y;
        double distance = std::sqrt(dx * dx + dy * dy);
        if (distance < best_distance) {
            best_distance = distance;
            best = candidate;
        }
    }
    return best;
}

} // namespace gaze
} // namespace proctoreye
