/**
 * @file EyebrowDetector.hpp
 * @brief Eyebrow-raise detection against an adaptive baseline
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_EYEBROW_DETECTOR_HPP
#define FACECUE_GESTURE_EYEBROW_DETECTOR_HPP

#include <deque>
#include <optional>
#include "DetectorConfig.hpp"
#include "GestureTypes.hpp"

namespace facecue {
namespace gesture {

struct EyebrowState {
    std::optional<float> baseline;  ///< Empty until baseline_min_samples collected
    int confirm_frame_count = 0;
    bool fired = false;             ///< Latched until the eyebrows lower
};

/**
 * @brief Eyebrow gesture state machine
 *
 * The baseline is a fixed-window moving average of eyebrow_position, fed
 * only by frames that are near-center and not raised. Head tilt shifts the
 * apparent eyebrow landmarks, so frames whose |head deviation| reaches
 * center_tolerance leave the detector untouched and never fire.
 *
 * Performance: O(1) per frame (running sum over the window).
 */
class EyebrowDetector {
public:
    explicit EyebrowDetector(const EyebrowConfig& config = EyebrowConfig());

    /**
     * @brief Advance by one frame with a detected face
     *
     * @param eyebrow_position Raw eyebrow height
     * @param head_deviation Signed head deviation from upright, degrees
     * @return EYEBROWS_RAISED or NONE
     */
    GestureType update(float eyebrow_position, float head_deviation);

    void on_face_lost();
    void reset();
    void configure(const EyebrowConfig& config);

    bool eyebrows_raised() const { return raised_; }

    /// True if the last update() was skipped because the head was tilted
    bool suppressed() const { return suppressed_; }

    const EyebrowState& state() const { return state_; }
    size_t baseline_samples() const { return samples_.size(); }

private:
    void add_baseline_sample(float position);

    EyebrowConfig config_;
    EyebrowState state_;
    std::deque<float> samples_;
    double sample_sum_ = 0.0;
    bool raised_ = false;
    bool suppressed_ = false;
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_EYEBROW_DETECTOR_HPP
