/**
 * @file FaceLandmarks.cpp
 * @brief Landmark layouts and normalization helpers
 */

#include "facecue/face/FaceLandmarks.hpp"
#include "facecue/core/exception.h"

#include <algorithm>

namespace facecue {
namespace face {

FaceLandmarks FaceLandmarks::from_pixels(const std::vector<cv::Point2f>& pixels,
                                         const cv::Size& image_size) {
    FaceLandmarks landmarks;
    if (image_size.width <= 0 || image_size.height <= 0) {
        FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                           "Image size must be positive");
    }

    const float sx = 1.0f / static_cast<float>(image_size.width);
    const float sy = 1.0f / static_cast<float>(image_size.height);

    landmarks.points.reserve(pixels.size());
    for (const cv::Point2f& p : pixels) {
        landmarks.points.emplace_back(p.x * sx, p.y * sy);
    }
    return landmarks;
}

LandmarkLayout LandmarkLayout::mediapipe_face_mesh() {
    LandmarkLayout layout;
    layout.name = "mediapipe468";
    layout.point_count = 468;
    layout.right_eye = {159, 145, 33, 133};
    layout.left_eye = {386, 374, 362, 263};
    layout.mouth = {13, 14, 78, 308};
    layout.right_eyebrow = 70;
    layout.left_eyebrow = 300;
    layout.reference_point = 10;    // forehead center
    layout.nose_tip = 4;
    layout.chin = 152;
    return layout;
}

LandmarkLayout LandmarkLayout::ibug_68() {
    LandmarkLayout layout;
    layout.name = "ibug68";
    layout.point_count = 68;
    layout.right_eye = {37, 41, 36, 39};
    layout.left_eye = {43, 47, 42, 45};
    layout.mouth = {62, 66, 60, 64};    // inner lip contour
    layout.right_eyebrow = 19;
    layout.left_eyebrow = 24;
    layout.reference_point = 27;    // top of the nose bridge
    layout.nose_tip = 30;
    layout.chin = 8;
    return layout;
}

LandmarkLayout LandmarkLayout::from_name(const std::string& name) {
    if (name == "mediapipe468") {
        return mediapipe_face_mesh();
    }
    if (name == "ibug68") {
        return ibug_68();
    }
    FACECUE_THROW(core::ConfigException, "Unknown landmark layout: " + name);
}

int LandmarkLayout::max_index() const {
    const int indices[] = {
        right_eye.top, right_eye.bottom, right_eye.left, right_eye.right,
        left_eye.top, left_eye.bottom, left_eye.left, left_eye.right,
        mouth.top, mouth.bottom, mouth.left, mouth.right,
        right_eyebrow, left_eyebrow, reference_point, nose_tip, chin
    };
    return *std::max_element(std::begin(indices), std::end(indices));
}

} // namespace face
} // namespace facecue
