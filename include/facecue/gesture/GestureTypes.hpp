/**
 * @file GestureTypes.hpp
 * @brief Core data types for facial gesture detection
 *
 * Defines the per-frame feature input, the gesture event output and the
 * per-frame face state snapshot shared by all detectors.
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_TYPES_HPP
#define FACECUE_GESTURE_TYPES_HPP

#include <optional>
#include <string>
#include <facecue/core/types.hpp>

namespace facecue {
namespace gesture {

/**
 * @brief Discrete intent signals produced by the detector
 */
enum class GestureType {
    NONE = 0,           ///< No gesture this frame
    DOUBLE_BLINK,       ///< Two confirmed blinks within the interval (yes)
    LONG_CLOSE,         ///< Eyes held closed (no)
    EYEBROWS_RAISED,    ///< Eyebrows raised above baseline (menu)
    MOUTH_OPEN,         ///< Mouth held open (select)
    HEAD_TILT_LEFT,     ///< Head tilted left from center (previous)
    HEAD_TILT_RIGHT     ///< Head tilted right from center (next)
};

/**
 * @brief Head-tilt classification zones
 */
enum class HeadTiltZone {
    LEFT,
    CENTER,
    RIGHT
};

/**
 * @brief Per-frame facial geometry measurements
 *
 * Produced once per processed image. When face_detected is false the
 * geometry fields carry no meaning and detectors ignore them.
 */
struct FeatureFrame {
    bool face_detected = false;

    float left_eye_ar = 0.0f;       ///< Left eye aspect ratio (EAR)
    float right_eye_ar = 0.0f;      ///< Right eye aspect ratio (EAR)
    float mouth_ar = 0.0f;          ///< Mouth aspect ratio (MAR)
    float eyebrow_position = 0.0f;  ///< Eyebrow height relative to a facial reference, higher = raised
    float head_tilt_angle = 180.0f; ///< Degrees; upright near +-180, maximal tilt near 0

    core::Timestamp timestamp;      ///< Monotonic capture time

    /**
     * @brief Frame carrying the "no face" marker
     */
    static FeatureFrame no_face(core::Timestamp ts) {
        FeatureFrame frame;
        frame.face_detected = false;
        frame.timestamp = ts;
        return frame;
    }
};

/**
 * @brief A confirmed, emitted gesture
 */
struct GestureEvent {
    GestureType type = GestureType::NONE;
    core::Timestamp timestamp;
    FeatureFrame features;          ///< Raw feature values at trigger time
};

/**
 * @brief Raw per-frame conditions reported alongside events
 */
struct FaceStateSnapshot {
    bool face_detected = false;
    bool eyes_closed = false;
    bool mouth_open = false;
    bool eyebrows_raised = false;
    bool head_tilt_left = false;
    bool head_tilt_right = false;
    bool head_tilt_center = true;

    float left_eye_ar = 0.0f;
    float right_eye_ar = 0.0f;
    float mouth_ar = 0.0f;
    float eyebrow_position = 0.0f;
    float head_tilt_angle = 0.0f;
    float head_deviation = 0.0f;    ///< Signed deviation from upright, degrees
};

/**
 * @brief Outcome of processing one frame
 */
struct DetectionResult {
    FaceStateSnapshot state;
    std::optional<GestureEvent> event;
};

/**
 * @brief Convert GestureType enum to its wire name ("DOUBLE_BLINK", ...)
 */
inline std::string gesture_type_to_string(GestureType type) {
    switch (type) {
        case GestureType::NONE: return "NONE";
        case GestureType::DOUBLE_BLINK: return "DOUBLE_BLINK";
        case GestureType::LONG_CLOSE: return "LONG_CLOSE";
        case GestureType::EYEBROWS_RAISED: return "EYEBROWS_RAISED";
        case GestureType::MOUTH_OPEN: return "MOUTH_OPEN";
        case GestureType::HEAD_TILT_LEFT: return "HEAD_TILT_LEFT";
        case GestureType::HEAD_TILT_RIGHT: return "HEAD_TILT_RIGHT";
        default: return "INVALID";
    }
}

/**
 * @brief Human-readable gesture label with its menu meaning
 */
inline std::string gesture_display_name(GestureType type) {
    switch (type) {
        case GestureType::DOUBLE_BLINK: return "Double blink (yes)";
        case GestureType::LONG_CLOSE: return "Long close (no)";
        case GestureType::EYEBROWS_RAISED: return "Eyebrows raised (menu)";
        case GestureType::MOUTH_OPEN: return "Mouth open (select)";
        case GestureType::HEAD_TILT_LEFT: return "Head tilt left (previous)";
        case GestureType::HEAD_TILT_RIGHT: return "Head tilt right (next)";
        default: return "None";
    }
}

inline std::string head_tilt_zone_to_string(HeadTiltZone zone) {
    switch (zone) {
        case HeadTiltZone::LEFT: return "LEFT";
        case HeadTiltZone::CENTER: return "CENTER";
        case HeadTiltZone::RIGHT: return "RIGHT";
        default: return "INVALID";
    }
}

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_TYPES_HPP
