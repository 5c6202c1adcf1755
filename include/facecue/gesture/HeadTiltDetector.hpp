/**
 * @file HeadTiltDetector.hpp
 * @brief Edge-triggered head-tilt detection with deadzone and hysteresis
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_HEAD_TILT_DETECTOR_HPP
#define FACECUE_GESTURE_HEAD_TILT_DETECTOR_HPP

#include "DetectorConfig.hpp"
#include "GestureTypes.hpp"

namespace facecue {
namespace gesture {

struct HeadTiltState {
    HeadTiltZone confirmed_zone = HeadTiltZone::CENTER;
    HeadTiltZone candidate_zone = HeadTiltZone::CENTER;
    int candidate_frame_count = 0;
};

/**
 * @brief Head-tilt zone state machine
 *
 * The raw head_tilt_angle lives in a cyclic space where upright is near
 * +-180 degrees and maximal tilt near 0. normalize_deviation() maps it once
 * per frame to a signed deviation from upright (left negative, right
 * positive) so every comparison below is linear.
 *
 * Zones:
 * - CENTER: |deviation| <= deadzone
 * - LEFT / RIGHT: |deviation| > angle_threshold, by sign
 * - between deadzone and threshold: counts as the confirmed zone
 *
 * A new zone must hold for confirm_frames consecutive frames. Only a
 * confirmed CENTER -> LEFT/RIGHT transition emits an event.
 */
class HeadTiltDetector {
public:
    explicit HeadTiltDetector(const HeadTiltConfig& config = HeadTiltConfig());

    /**
     * @brief Map a raw angle to a signed deviation from upright in (-180, 180]
     */
    static float normalize_deviation(float head_tilt_angle);

    /**
     * @brief Advance by one frame
     * @param deviation Output of normalize_deviation() for this frame
     * @return HEAD_TILT_LEFT, HEAD_TILT_RIGHT or NONE
     */
    GestureType update(float deviation);

    void on_face_lost();
    void reset();
    void configure(const HeadTiltConfig& config);

    /**
     * @brief Classify a deviation without touching state
     */
    HeadTiltZone classify(float deviation) const;

    HeadTiltZone confirmed_zone() const { return state_.confirmed_zone; }
    const HeadTiltState& state() const { return state_; }

private:
    HeadTiltConfig config_;
    HeadTiltState state_;
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_HEAD_TILT_DETECTOR_HPP
