/**
 * @file FeatureExtractor.hpp
 * @brief Geometric facial features (EAR, MAR, eyebrow height, head tilt)
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_FACE_FEATURE_EXTRACTOR_HPP
#define FACECUE_FACE_FEATURE_EXTRACTOR_HPP

#include <facecue/face/FaceLandmarks.hpp>
#include <facecue/gesture/GestureTypes.hpp>

namespace facecue {
namespace face {

/**
 * @brief Computes one FeatureFrame from normalized landmarks
 *
 * - Eye/mouth aspect ratio: |top - bottom| / |left - right| (0 when the
 *   horizontal extent collapses)
 * - Eyebrow position: reference_y - mean(eyebrow_y); grows when the brows
 *   move up in the image
 * - Head tilt angle: atan2(nose.x - chin.x, nose.y - chin.y) in degrees,
 *   +-180 when upright
 *
 * Stateless apart from its layout; safe to share between threads.
 */
class FeatureExtractor {
public:
    explicit FeatureExtractor(const LandmarkLayout& layout = LandmarkLayout::ibug_68());

    /**
     * @brief Extract features
     *
     * @param landmarks Normalized landmarks; empty means no face
     * @param timestamp Frame capture time
     * @return Feature frame (face_detected = false for empty landmarks)
     * @throws core::Exception (ERROR_INVALID_PARAMETER) if the landmark set
     *         is too small for the layout
     */
    gesture::FeatureFrame extract(const FaceLandmarks& landmarks,
                                  core::Timestamp timestamp) const;

    static float aspect_ratio(const cv::Point2f& top, const cv::Point2f& bottom,
                              const cv::Point2f& left, const cv::Point2f& right);

    static float tilt_angle(const cv::Point2f& nose_tip, const cv::Point2f& chin);

    const LandmarkLayout& layout() const { return layout_; }

private:
    LandmarkLayout layout_;

    float opening_ratio(const FaceLandmarks& landmarks,
                        const LandmarkLayout::Opening& opening) const;
};

} // namespace face
} // namespace facecue

#endif // FACECUE_FACE_FEATURE_EXTRACTOR_HPP
