/**
 * @file MouthDetector.hpp
 * @brief Latched mouth-open detection
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_MOUTH_DETECTOR_HPP
#define FACECUE_GESTURE_MOUTH_DETECTOR_HPP

#include "DetectorConfig.hpp"
#include "GestureTypes.hpp"

namespace facecue {
namespace gesture {

struct MouthState {
    int confirm_frame_count = 0;
    bool fired = false;             ///< Latched until the mouth closes
};

/**
 * @brief Mouth gesture state machine
 *
 * MOUTH_OPEN fires once when MAR stays above the threshold for
 * confirm_frames consecutive frames, then waits for a closed frame.
 */
class MouthDetector {
public:
    explicit MouthDetector(const MouthConfig& config = MouthConfig());

    GestureType update(float mouth_ar);
    void on_face_lost();
    void reset();
    void configure(const MouthConfig& config);

    bool mouth_open() const { return open_; }
    const MouthState& state() const { return state_; }

private:
    MouthConfig config_;
    MouthState state_;
    bool open_ = false;
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_MOUTH_DETECTOR_HPP
