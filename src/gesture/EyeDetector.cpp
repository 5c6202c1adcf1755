/**
 * @file EyeDetector.cpp
 * @brief Implementation of the eye gesture state machine
 */

#include "facecue/gesture/EyeDetector.hpp"
#include "facecue/core/Logger.hpp"

namespace facecue {
namespace gesture {

EyeDetector::EyeDetector(const EyeConfig& config)
    : config_(config) {
}

void EyeDetector::configure(const EyeConfig& config) {
    config_ = config;
    reset();
}

void EyeDetector::reset() {
    state_ = EyeState();
    blink_edge_ = false;
}

void EyeDetector::on_face_lost() {
    blink_edge_ = false;
    state_.closed = false;
    state_.closed_frame_count = 0;
}

GestureType EyeDetector::update(float left_eye_ar, float right_eye_ar, core::Timestamp now) {
    blink_edge_ = false;

    const float ear = 0.5f * (left_eye_ar + right_eye_ar);
    const bool closed = ear < config_.aspect_ratio_threshold;

    if (closed) {
        state_.closed = true;
        ++state_.closed_frame_count;

        if (state_.closed_frame_count >= config_.long_close_frames && !state_.long_close_fired) {
            state_.long_close_fired = true;
            return GestureType::LONG_CLOSE;
        }
        return GestureType::NONE;
    }

    const bool was_closed = state_.closed;
    const int closed_run = state_.closed_frame_count;

    // Open frame: the run ends and the long-close latch re-arms
    state_.closed = false;
    state_.closed_frame_count = 0;
    state_.long_close_fired = false;

    if (!was_closed || closed_run < config_.min_blink_frames) {
        return GestureType::NONE;
    }

    blink_edge_ = true;

    const auto interval = core::toClockDuration(config_.double_blink_interval_s);
    if (state_.pending_blink_time && now - *state_.pending_blink_time <= interval) {
        state_.pending_blink_time.reset();
        return GestureType::DOUBLE_BLINK;
    }

    FACECUE_LOG_DEBUG("EyeDetector") << "blink edge after " << closed_run << " closed frames";
    state_.pending_blink_time = now;
    return GestureType::NONE;
}

} // namespace gesture
} // namespace facecue
