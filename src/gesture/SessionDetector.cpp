/**
 * @file SessionDetector.cpp
 * @brief Implementation of the per-session gesture state machine
 */

#include <facecue/gesture/SessionDetector.hpp>
#include <facecue/gesture/EyeDetector.hpp>
#include <facecue/gesture/EyebrowDetector.hpp>
#include <facecue/gesture/HeadTiltDetector.hpp>
#include <facecue/gesture/MouthDetector.hpp>
#include <facecue/core/Logger.hpp>

#include <array>
#include <cmath>

namespace facecue {
namespace gesture {

namespace {

bool features_finite(const FeatureFrame& frame) {
    return std::isfinite(frame.left_eye_ar) &&
           std::isfinite(frame.right_eye_ar) &&
           std::isfinite(frame.mouth_ar) &&
           std::isfinite(frame.eyebrow_position) &&
           std::isfinite(frame.head_tilt_angle);
}

} // namespace

// PIMPL implementation
class SessionDetector::Impl {
public:
    DetectorConfig config;

    EyeDetector eye;
    MouthDetector mouth;
    EyebrowDetector eyebrow;
    HeadTiltDetector head_tilt;

    std::optional<core::Timestamp> cooldown_until;
    SessionStats stats;

    explicit Impl(const DetectorConfig& cfg)
        : config(cfg)
        , eye(cfg.eye)
        , mouth(cfg.mouth)
        , eyebrow(cfg.eyebrow)
        , head_tilt(cfg.head_tilt) {
    }

    void lose_face() {
        eye.on_face_lost();
        mouth.on_face_lost();
        eyebrow.on_face_lost();
        head_tilt.on_face_lost();
    }

    DetectionResult process(const FeatureFrame& frame) {
        ++stats.frames_processed;

        DetectionResult result;
        FaceStateSnapshot& snapshot = result.state;

        if (frame.face_detected && !features_finite(frame)) {
            LOG_WARNING("SessionDetector: non-finite features, treating frame as no face");
        }

        if (!frame.face_detected || !features_finite(frame)) {
            ++stats.frames_without_face;
            lose_face();
            return result;
        }

        const float deviation = HeadTiltDetector::normalize_deviation(frame.head_tilt_angle);

        // Fixed evaluation order doubles as the same-frame priority order
        const std::array<GestureType, 4> candidates = {
            eye.update(frame.left_eye_ar, frame.right_eye_ar, frame.timestamp),
            mouth.update(frame.mouth_ar),
            eyebrow.update(frame.eyebrow_position, deviation),
            head_tilt.update(deviation)
        };

        snapshot.face_detected = true;
        snapshot.eyes_closed = eye.eyes_closed();
        snapshot.mouth_open = mouth.mouth_open();
        snapshot.eyebrows_raised = eyebrow.eyebrows_raised();
        snapshot.head_tilt_center = std::abs(deviation) <= config.head_tilt.deadzone;
        snapshot.head_tilt_left = !snapshot.head_tilt_center && deviation < 0.0f;
        snapshot.head_tilt_right = !snapshot.head_tilt_center && deviation > 0.0f;
        snapshot.left_eye_ar = frame.left_eye_ar;
        snapshot.right_eye_ar = frame.right_eye_ar;
        snapshot.mouth_ar = frame.mouth_ar;
        snapshot.eyebrow_position = frame.eyebrow_position;
        snapshot.head_tilt_angle = frame.head_tilt_angle;
        snapshot.head_deviation = deviation;

        GestureType selected = GestureType::NONE;
        for (GestureType candidate : candidates) {
            if (candidate == GestureType::NONE) {
                continue;
            }
            if (selected == GestureType::NONE) {
                selected = candidate;
            } else {
                ++stats.events_discarded;
                LOG_DEBUG("SessionDetector: discarded " + gesture_type_to_string(candidate) +
                          " (same frame as " + gesture_type_to_string(selected) + ")");
            }
        }

        if (selected == GestureType::NONE) {
            return result;
        }

        if (cooldown_until && frame.timestamp < *cooldown_until) {
            ++stats.events_suppressed;
            LOG_DEBUG("SessionDetector: " + gesture_type_to_string(selected) + " suppressed by cooldown");
            return result;
        }

        GestureEvent event;
        event.type = selected;
        event.timestamp = frame.timestamp;
        event.features = frame;
        result.event = event;

        cooldown_until = frame.timestamp + core::toClockDuration(config.cooldown_s);
        ++stats.events_emitted;

        LOG_INFO("Gesture detected: " + gesture_type_to_string(selected));
        return result;
    }

    void reset() {
        eye.reset();
        mouth.reset();
        eyebrow.reset();
        head_tilt.reset();
        cooldown_until.reset();
    }
};

SessionDetector::SessionDetector(const DetectorConfig& config) {
    config.validate();
    pImpl = std::make_unique<Impl>(config);
}

SessionDetector::~SessionDetector() = default;

DetectionResult SessionDetector::process(const FeatureFrame& frame) {
    return pImpl->process(frame);
}

void SessionDetector::reset() {
    pImpl->reset();
    LOG_DEBUG("SessionDetector: state reset");
}

std::optional<core::Timestamp> SessionDetector::cooldown_until() const {
    return pImpl->cooldown_until;
}

bool SessionDetector::in_cooldown(core::Timestamp now) const {
    return pImpl->cooldown_until && now < *pImpl->cooldown_until;
}

const DetectorConfig& SessionDetector::config() const {
    return pImpl->config;
}

SessionStats SessionDetector::stats() const {
    return pImpl->stats;
}

const EyeDetector& SessionDetector::eye() const {
    return pImpl->eye;
}

const MouthDetector& SessionDetector::mouth() const {
    return pImpl->mouth;
}

const EyebrowDetector& SessionDetector::eyebrow() const {
    return pImpl->eyebrow;
}

const HeadTiltDetector& SessionDetector::head_tilt() const {
    return pImpl->head_tilt;
}

} // namespace gesture
} // namespace facecue
