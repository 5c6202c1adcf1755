/**
 * @file SessionDetector.hpp
 * @brief Per-session composition of the gesture detectors with cooldown gating
 *
 * The SessionDetector is the single entry point of the detection core: it
 * consumes one FeatureFrame at a time and returns the frame's face state
 * snapshot plus at most one GestureEvent.
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_SESSION_DETECTOR_HPP
#define FACECUE_GESTURE_SESSION_DETECTOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <facecue/gesture/DetectorConfig.hpp>
#include <facecue/gesture/GestureTypes.hpp>

namespace facecue {
namespace gesture {

class EyeDetector;
class MouthDetector;
class EyebrowDetector;
class HeadTiltDetector;

/**
 * @brief Counters for one session
 */
struct SessionStats {
    uint64_t frames_processed = 0;
    uint64_t frames_without_face = 0;
    uint64_t events_emitted = 0;
    uint64_t events_suppressed = 0;     ///< Dropped by the cooldown gate
    uint64_t events_discarded = 0;      ///< Lost a same-frame priority tie
};

/**
 * @brief Gesture event detection state machine for one client session
 *
 * Per frame with a face, detectors are evaluated in the fixed order
 * Eye -> Mouth -> Eyebrow -> HeadTilt. The first candidate in that order is
 * the frame's event; later ones are discarded. Inside the cooldown window the
 * event is suppressed, but every detector has already advanced and latched.
 * An emitted event starts a new cooldown window.
 *
 * Frames without a face produce no event and break every consecutive-frame
 * run; latches, the eyebrow baseline, the confirmed head zone and a pending
 * blink are kept.
 *
 * Example usage:
 * @code
 * SessionDetector detector(DetectorConfig::from_configuration(config));
 * for (const FeatureFrame& frame : frames) {
 *     DetectionResult result = detector.process(frame);
 *     if (result.event) {
 *         std::cout << gesture_type_to_string(result.event->type) << std::endl;
 *     }
 * }
 * @endcode
 *
 * Thread-safety: Not thread-safe. One instance per session, driven by one
 * processing path in frame-arrival order.
 */
class SessionDetector {
public:
    /**
     * @brief Constructor
     * @throws core::ConfigException if config is invalid
     */
    explicit SessionDetector(const DetectorConfig& config = DetectorConfig());

    ~SessionDetector();

    // Disable copy and move
    SessionDetector(const SessionDetector&) = delete;
    SessionDetector& operator=(const SessionDetector&) = delete;
    SessionDetector(SessionDetector&&) = delete;
    SessionDetector& operator=(SessionDetector&&) = delete;

    /**
     * @brief Process one frame
     *
     * @param frame Feature frame; timestamps must not go backwards
     * @return Face state snapshot and the emitted event, if any
     */
    DetectionResult process(const FeatureFrame& frame);

    /**
     * @brief Return every detector to its initial state
     *
     * Empties the eyebrow baseline, clears all latches, the pending blink
     * and the cooldown.
     */
    void reset();

    /**
     * @brief End of the active cooldown window, if any
     */
    std::optional<core::Timestamp> cooldown_until() const;

    bool in_cooldown(core::Timestamp now) const;

    const DetectorConfig& config() const;
    SessionStats stats() const;

    const EyeDetector& eye() const;
    const MouthDetector& mouth() const;
    const EyebrowDetector& eyebrow() const;
    const HeadTiltDetector& head_tilt() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_SESSION_DETECTOR_HPP
