/**
 * @file LandmarkSet.cpp
 * @brief Landmark set validation at the provider boundary
 */

#include "proctoreye/gaze/LandmarkSet.hpp"
#include "proctoreye/core/exception.h"
#include <cmath>
#include <string>
#include <utility>

namespace proctoreye {
namespace gaze {

LandmarkSet::LandmarkSet(std::vector<cv::Point3f> points, std::optional<cv::Rect2f> face_box)
    : points_(std::move(points))
    , face_box_(face_box) {

    if (points_.size() < landmark_index::MIN_LANDMARK_COUNT) {
        PROCTOREYE_THROW_CODE(core::InvalidInputException,
                              core::ResultCode::ERROR_INSUFFICIENT_LANDMARKS,
                              "Landmark set has " + std::to_string(points_.size()) +
                              " points, need at least " +
                              std::to_string(landmark_index::MIN_LANDMARK_COUNT));
    }

    for (std::size_t i = 0; i < points_.size(); ++i) {
        const auto& p = points_[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            PROCTOREYE_THROW_CODE(core::InvalidInputException,
                                  core::ResultCode::ERROR_INVALID_PARAMETER,
                                  "Landmark " + std::to_string(i) + " has a non-finite coordinate");
        }
        if (std::fabs(p.x) > MAX_NORMALIZED_MAGNITUDE || std::fabs(p.y) > MAX_NORMALIZED_MAGNITUDE) {
            PROCTOREYE_THROW_CODE(core::InvalidInputException,
                                  core::ResultCode::ERROR_INVALID_PARAMETER,
                                  "Landmark " + std::to_string(i) + " at (" + std::to_string(p.x) +
                                  ", " + std::to_string(p.y) + ") is outside the normalized range");
        }
    }
}

LandmarkSet LandmarkSet::from_points(const std::vector<cv::Point2f>& points,
                                     std::optional<cv::Rect2f> face_box) {
    std::vector<cv::Point3f> points3d;
    points3d.reserve(points.size());
    for (const auto& p : points) {
        points3d.emplace_back(p.x, p.y, 0.0f);
    }
    return LandmarkSet(std::move(points3d), face_box);
}

const cv::Point3f& LandmarkSet::at(std::size_t index) const {
    if (index >= points_.size()) {
        PROCTOREYE_THROW_CODE(core::InvalidInputException,
                              core::ResultCode::ERROR_INVALID_PARAMETER,
                              "Landmark index " + std::to_string(index) + " out of range");
    }
    return points_[index];
}

cv::Point LandmarkSet::pixel(std::size_t index, const cv::Size& frame_size) const {
    const auto& p = at(index);
    return cv::Point(static_cast<int>(p.x * frame_size.width),
                     static_cast<int>(p.y * frame_size.height));
}

} // namespace gaze
} // namespace proctoreye
