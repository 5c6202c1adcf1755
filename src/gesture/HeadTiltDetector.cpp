/**
 * @file HeadTiltDetector.cpp
 * @brief Implementation of the head-tilt zone state machine
 */

#include "facecue/gesture/HeadTiltDetector.hpp"
#include "facecue/core/Logger.hpp"

#include <cmath>

namespace facecue {
namespace gesture {

HeadTiltDetector::HeadTiltDetector(const HeadTiltConfig& config)
    : config_(config) {
}

void HeadTiltDetector::configure(const HeadTiltConfig& config) {
    config_ = config;
    reset();
}

void HeadTiltDetector::reset() {
    state_ = HeadTiltState();
}

void HeadTiltDetector::on_face_lost() {
    state_.candidate_zone = state_.confirmed_zone;
    state_.candidate_frame_count = 0;
}

float HeadTiltDetector::normalize_deviation(float head_tilt_angle) {
    // Upright (+-180) -> 0, left tilt (e.g. -160) -> -20, right tilt (160) -> +20
    float deviation = std::fmod(180.0f - head_tilt_angle, 360.0f);
    if (deviation > 180.0f) {
        deviation -= 360.0f;
    } else if (deviation <= -180.0f) {
        deviation += 360.0f;
    }
    return deviation;
}

HeadTiltZone HeadTiltDetector::classify(float deviation) const {
    const float magnitude = std::abs(deviation);

    if (magnitude <= config_.deadzone) {
        return HeadTiltZone::CENTER;
    }
    if (magnitude > config_.angle_threshold) {
        return deviation < 0.0f ? HeadTiltZone::LEFT : HeadTiltZone::RIGHT;
    }
    // Transition band: hold the confirmed zone
    return state_.confirmed_zone;
}

GestureType HeadTiltDetector::update(float deviation) {
    const HeadTiltZone zone = classify(deviation);

    if (zone == state_.confirmed_zone) {
        state_.candidate_zone = zone;
        state_.candidate_frame_count = 0;
        return GestureType::NONE;
    }

    if (zone == state_.candidate_zone) {
        ++state_.candidate_frame_count;
    } else {
        state_.candidate_zone = zone;
        state_.candidate_frame_count = 1;
    }

    if (state_.candidate_frame_count < config_.confirm_frames) {
        return GestureType::NONE;
    }

    const HeadTiltZone previous = state_.confirmed_zone;
    state_.confirmed_zone = zone;
    state_.candidate_frame_count = 0;

    FACECUE_LOG_DEBUG("HeadTiltDetector") << "zone " << head_tilt_zone_to_string(previous)
                                          << " -> " << head_tilt_zone_to_string(zone);

    if (previous != HeadTiltZone::CENTER) {
        return GestureType::NONE;
    }
    return zone == HeadTiltZone::LEFT ? GestureType::HEAD_TILT_LEFT
                                      : GestureType::HEAD_TILT_RIGHT;
}

} // namespace gesture
} // namespace facecue
