/**
 * @file FaceLandmarks.hpp
 * @brief Normalized 2D facial landmarks and the index layouts that name them
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_FACE_LANDMARKS_HPP
#define FACECUE_FACE_LANDMARKS_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace facecue {
namespace face {

/**
 * @brief Landmark points of one face
 *
 * Coordinates are normalized to the image: x in [0, 1] left to right,
 * y in [0, 1] top to bottom. An empty point list means no face.
 */
struct FaceLandmarks {
    std::vector<cv::Point2f> points;
    cv::Rect face_box;              ///< Detection box in pixels, empty if unknown

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }

    /**
     * @brief Build from pixel coordinates
     */
    static FaceLandmarks from_pixels(const std::vector<cv::Point2f>& pixels,
                                     const cv::Size& image_size);
};

/**
 * @brief Landmark indices used by the feature extractor
 *
 * Each eye and the mouth are described by a top/bottom pair (vertical
 * opening) and a left/right pair (horizontal extent). The eyebrow position
 * is measured against reference_point; head tilt is the nose-tip to chin
 * direction.
 */
struct LandmarkLayout {
    struct Opening {
        int top;
        int bottom;
        int left;
        int right;
    };

    std::string name;
    size_t point_count = 0;         ///< Landmarks a provider must deliver

    Opening right_eye{};
    Opening left_eye{};
    Opening mouth{};

    int right_eyebrow = 0;
    int left_eyebrow = 0;
    int reference_point = 0;        ///< Fixed point above or below the brows
    int nose_tip = 0;
    int chin = 0;

    /**
     * @brief MediaPipe Face Mesh (468 points)
     */
    static LandmarkLayout mediapipe_face_mesh();

    /**
     * @brief iBUG 300-W 68-point markup (dlib, OpenCV FacemarkLBF)
     */
    static LandmarkLayout ibug_68();

    /**
     * @brief Look up a preset by name ("mediapipe468" or "ibug68")
     * @throws core::ConfigException for an unknown name
     */
    static LandmarkLayout from_name(const std::string& name);

    /**
     * @brief Largest index referenced by the layout
     */
    int max_index() const;
};

} // namespace face
} // namespace facecue

#endif // FACECUE_FACE_LANDMARKS_HPP
