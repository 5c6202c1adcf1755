/**
 * @file DetectorConfig.hpp
 * @brief Threshold configuration for the facial gesture detectors
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_DETECTOR_CONFIG_HPP
#define FACECUE_GESTURE_DETECTOR_CONFIG_HPP

#include <string>

namespace facecue {
namespace core {
class Configuration;
}

namespace gesture {

/**
 * @brief Blink, double-blink and long-close thresholds
 */
struct EyeConfig {
    float aspect_ratio_threshold = 0.20f;   ///< Eyes closed iff mean EAR < threshold
    int min_blink_frames = 2;               ///< Closed frames needed for a blink edge
    double double_blink_interval_s = 0.8;   ///< Max gap between paired blink edges
    int long_close_frames = 30;             ///< Closed frames needed for LONG_CLOSE
};

/**
 * @brief Mouth-open thresholds
 */
struct MouthConfig {
    float aspect_ratio_threshold = 0.30f;   ///< Mouth open iff MAR > threshold
    int confirm_frames = 5;
};

/**
 * @brief Eyebrow-raise thresholds and baseline tracking
 */
struct EyebrowConfig {
    float raise_threshold = 0.020f;         ///< Raised iff position - baseline > threshold
    int confirm_frames = 5;
    float center_tolerance = 15.0f;         ///< Max |head deviation| (deg) for detection
    int baseline_window = 30;               ///< Moving-average window (frames)
    int baseline_min_samples = 10;          ///< Samples before the baseline is usable
};

/**
 * @brief Head-tilt zone thresholds
 */
struct HeadTiltConfig {
    float angle_threshold = 15.0f;          ///< |deviation| beyond this is LEFT/RIGHT
    float deadzone = 7.0f;                  ///< |deviation| within this is CENTER
    int confirm_frames = 5;
};

/**
 * @brief Complete detector configuration
 *
 * Loaded once at process or session start. Field defaults are the
 * documented fallback values.
 */
struct DetectorConfig {
    EyeConfig eye;
    MouthConfig mouth;
    EyebrowConfig eyebrow;
    HeadTiltConfig head_tilt;
    double cooldown_s = 0.5;                ///< Global quiet period after any event

    /**
     * @brief Check every constraint
     * @throws core::ConfigException naming the first violated field
     */
    void validate() const;

    /**
     * @brief Non-throwing variant of validate()
     */
    bool is_valid() const;

    /**
     * @brief One-line summary for logging
     */
    std::string to_string() const;

    /**
     * @brief Build from a loaded configuration document
     *
     * Missing or unparseable fields keep their defaults (a warning is logged
     * for unparseable ones). The result is validated before it is returned.
     *
     * @throws core::ConfigException if a value violates its constraint
     */
    static DetectorConfig from_configuration(const core::Configuration& config);
};

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_DETECTOR_CONFIG_HPP
