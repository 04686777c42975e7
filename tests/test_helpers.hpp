/**
 * @file test_helpers.hpp
 * @brief Synthetic faces and frames shared by the unit tests
 */

#ifndef PROCTOREYE_TESTS_TEST_HELPERS_HPP
#define PROCTOREYE_TESTS_TEST_HELPERS_HPP

#include <proctoreye/gaze/GazeTypes.hpp>
#include <proctoreye/gaze/LandmarkSet.hpp>
#include <opencv2/core.hpp>
#include <vector>

namespace proctoreye {
namespace test {

constexpr int FRAME_WIDTH = 640;
constexpr int FRAME_HEIGHT = 480;
constexpr std::size_t FACE_MESH_POINTS = 478;

/**
 * @brief Eye shape in frame pixels
 *
 * Corners sit at center +/- half_width, lids at center +/- half_height,
 * so the EAR of the generated eye is half_height / half_width.
 */
struct SyntheticEye {
    cv::Point center;
    int half_width = 20;
    int half_height = 8;
};

struct SyntheticFace {
    SyntheticEye left{cv::Point(200, 240)};
    SyntheticEye right{cv::Point(440, 240)};
};

/**
 * @brief Normalized coordinate that maps back to exactly this pixel
 */
cv::Point2f to_normalized(const cv::Point& pixel, const cv::Size& frame_size);

/**
 * @brief Pixel positions of the 16 contour landmarks of one eye, in index order
 */
std::vector<cv::Point> eye_contour_pixels(gaze::EyeSide side, const SyntheticEye& eye);

/**
 * @brief 478-point landmark set; non-eye points sit between the eyes
 */
gaze::LandmarkSet make_landmarks(const SyntheticFace& face = SyntheticFace{},
                                 const cv::Size& frame_size = cv::Size(FRAME_WIDTH, FRAME_HEIGHT));

/**
 * @brief Bright BGR frame with a dark disc at every given pupil position
 */
cv::Mat make_frame(const std::vector<cv::Point>& pupils, int pupil_radius = 6,
                   const cv::Size& frame_size = cv::Size(FRAME_WIDTH, FRAME_HEIGHT));

/**
 * @brief Bright BGR frame with a single dark pixel at every given position
 *
 * The specks are too small for either pupil detection method.
 */
cv::Mat make_speck_frame(const std::vector<cv::Point>& specks,
                         const cv::Size& frame_size = cv::Size(FRAME_WIDTH, FRAME_HEIGHT));

} // namespace test
} // namespace proctoreye

#endif // PROCTOREYE_TESTS_TEST_HELPERS_HPP
