/**
 * @file FeatureExtractor.cpp
 * @brief Landmark geometry to FeatureFrame
 */

#include "facecue/face/FeatureExtractor.hpp"
#include "facecue/core/exception.h"

#include <cmath>

namespace facecue {
namespace face {

namespace {
constexpr float kRadToDeg = 57.29577951308232f;
}

FeatureExtractor::FeatureExtractor(const LandmarkLayout& layout)
    : layout_(layout) {
}

float FeatureExtractor::aspect_ratio(const cv::Point2f& top, const cv::Point2f& bottom,
                                     const cv::Point2f& left, const cv::Point2f& right) {
    const float vertical = static_cast<float>(cv::norm(top - bottom));
    const float horizontal = static_cast<float>(cv::norm(left - right));
    return horizontal > 0.0f ? vertical / horizontal : 0.0f;
}

float FeatureExtractor::tilt_angle(const cv::Point2f& nose_tip, const cv::Point2f& chin) {
    const cv::Point2f diff = nose_tip - chin;
    return std::atan2(diff.x, diff.y) * kRadToDeg;
}

float FeatureExtractor::opening_ratio(const FaceLandmarks& landmarks,
                                      const LandmarkLayout::Opening& opening) const {
    return aspect_ratio(landmarks.points[opening.top], landmarks.points[opening.bottom],
                        landmarks.points[opening.left], landmarks.points[opening.right]);
}

gesture::FeatureFrame FeatureExtractor::extract(const FaceLandmarks& landmarks,
                                                core::Timestamp timestamp) const {
    if (landmarks.empty()) {
        return gesture::FeatureFrame::no_face(timestamp);
    }

    if (static_cast<int>(landmarks.size()) <= layout_.max_index()) {
        FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                           "Layout " + layout_.name + " needs " +
                           std::to_string(layout_.max_index() + 1) + " landmarks, got " +
                           std::to_string(landmarks.size()));
    }

    const std::vector<cv::Point2f>& p = landmarks.points;

    gesture::FeatureFrame frame;
    frame.face_detected = true;
    frame.timestamp = timestamp;
    frame.right_eye_ar = opening_ratio(landmarks, layout_.right_eye);
    frame.left_eye_ar = opening_ratio(landmarks, layout_.left_eye);
    frame.mouth_ar = opening_ratio(landmarks, layout_.mouth);

    const float brow_y = (p[layout_.right_eyebrow].y + p[layout_.left_eyebrow].y) * 0.5f;
    frame.eyebrow_position = p[layout_.reference_point].y - brow_y;

    frame.head_tilt_angle = tilt_angle(p[layout_.nose_tip], p[layout_.chin]);
    return frame;
}

} // namespace face
} // namespace facecue
