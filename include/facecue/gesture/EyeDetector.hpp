/**
 * @file EyeDetector.hpp
 * @brief Blink, double-blink and long-close detection from eye aspect ratios
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_EYE_DETECTOR_HPP
#define FACECUE_GESTURE_EYE_DETECTOR_HPP

#include <optional>
#include "DetectorConfig.hpp"
#include "GestureTypes.hpp"

namespace facecue {
namespace gesture {

/**
 * @brief Mutable state of the eye state machine
 */
struct EyeState {
    bool closed = false;
    int closed_frame_count = 0;
    std::optional<core::Timestamp> pending_blink_time;  ///< Unpaired blink edge
    bool long_close_fired = false;                      ///< Latched until eyes reopen
};

/**
 * @brief Eye gesture state machine
 *
 * Eyes are closed on a frame iff the mean of both EARs is strictly below
 * the threshold. A closed run of at least min_blink_frames that ends in an
 * open frame is a confirmed blink edge; two edges no more than
 * double_blink_interval_s apart produce DOUBLE_BLINK. A closed run reaching
 * long_close_frames produces LONG_CLOSE once per closure.
 *
 * Thread-safety: Not thread-safe. Owned by a single SessionDetector.
 */
class EyeDetector {
public:
    explicit EyeDetector(const EyeConfig& config = EyeConfig());

    /**
     * @brief Advance by one frame with a detected face
     * @return DOUBLE_BLINK, LONG_CLOSE or NONE
     */
    GestureType update(float left_eye_ar, float right_eye_ar, core::Timestamp now);

    /**
     * @brief Frame without a face: break the closed run, keep latches
     */
    void on_face_lost();

    void reset();
    void configure(const EyeConfig& config);

    bool eyes_closed() const { return state_.closed; }

    /// True if the last update() produced a confirmed blink edge
    bool blink_edge() const { return blink_edge_; }

    const EyeState& state() const { return state_; }

private:
    EyeConfig config_;
    EyeState state_;
    bool blink_edge_ = false;
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_EYE_DETECTOR_HPP
