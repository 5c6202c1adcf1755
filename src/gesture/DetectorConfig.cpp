/**
 * @file DetectorConfig.cpp
 * @brief Loading and validation of detector thresholds
 */

#include "facecue/gesture/DetectorConfig.hpp"
#include "facecue/core/Configuration.hpp"
#include "facecue/core/Logger.hpp"
#include "facecue/core/exception.h"

#include <cmath>
#include <sstream>

namespace facecue {
namespace gesture {

namespace {

// Longest duration accepted for time windows; keeps conversions to the
// steady clock's nanosecond ticks far from overflow
constexpr double kMaxDurationSeconds = 3600.0;

bool duration_in_range(double seconds) {
    return std::isfinite(seconds) && seconds <= kMaxDurationSeconds;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        FACECUE_THROW(core::ConfigException, message);
    }
}

/**
 * @brief Read key into value if present and parseable; warn if present but not
 */
template<typename T>
bool read_field(const core::Configuration& config, const std::string& key, T& value) {
    if (config.tryGet(key, value)) {
        return true;
    }
    if (config.has(key)) {
        std::ostringstream oss;
        oss << "Config: cannot parse '" << key << "', using default " << value;
        LOG_WARNING(oss.str());
    }
    return false;
}

/**
 * @brief Like read_field, falling back to a legacy key name
 */
template<typename T>
void read_field_or_alias(const core::Configuration& config, const std::string& key,
                         const std::string& alias, T& value) {
    if (read_field(config, key, value)) {
        return;
    }
    if (!config.has(key) && read_field(config, alias, value)) {
        LOG_INFO("Config: '" + alias + "' is deprecated, use '" + key + "'");
    }
}

} // namespace

void DetectorConfig::validate() const {
    require(eye.aspect_ratio_threshold > 0.0f, "eye.aspect_ratio_threshold must be > 0");
    require(eye.min_blink_frames >= 1, "eye.min_blink_frames must be >= 1");
    require(eye.double_blink_interval_s > 0.0, "eye.double_blink_interval_s must be > 0");
    require(duration_in_range(eye.double_blink_interval_s),
            "eye.double_blink_interval_s must be finite and <= 3600");
    require(eye.long_close_frames > eye.min_blink_frames,
            "eye.long_close_frames must be greater than eye.min_blink_frames");

    require(mouth.aspect_ratio_threshold > 0.0f, "mouth.aspect_ratio_threshold must be > 0");
    require(mouth.confirm_frames >= 1, "mouth.confirm_frames must be >= 1");

    require(eyebrow.raise_threshold > 0.0f, "eyebrow.raise_threshold must be > 0");
    require(eyebrow.confirm_frames >= 1, "eyebrow.confirm_frames must be >= 1");
    require(eyebrow.center_tolerance > 0.0f, "eyebrow.center_tolerance must be > 0");
    require(eyebrow.baseline_window >= 1, "eyebrow.baseline_window must be >= 1");
    require(eyebrow.baseline_min_samples >= 1 &&
            eyebrow.baseline_min_samples <= eyebrow.baseline_window,
            "eyebrow.baseline_min_samples must be in [1, eyebrow.baseline_window]");

    require(head_tilt.deadzone >= 0.0f, "head_tilt.deadzone must be >= 0");
    require(head_tilt.angle_threshold > head_tilt.deadzone,
            "head_tilt.angle_threshold must be greater than head_tilt.deadzone");
    require(head_tilt.angle_threshold < 180.0f, "head_tilt.angle_threshold must be < 180");
    require(head_tilt.confirm_frames >= 1, "head_tilt.confirm_frames must be >= 1");

    require(cooldown_s >= 0.0, "gesture.cooldown_s must be >= 0");
    require(duration_in_range(cooldown_s), "gesture.cooldown_s must be finite and <= 3600");
}

bool DetectorConfig::is_valid() const {
    try {
        validate();
        return true;
    } catch (const core::ConfigException&) {
        return false;
    }
}

std::string DetectorConfig::to_string() const {
    std::ostringstream oss;
    oss << "eye(ear<" << eye.aspect_ratio_threshold
        << " blink>=" << eye.min_blink_frames
        << " dbl<=" << eye.double_blink_interval_s << "s"
        << " long=" << eye.long_close_frames << ")"
        << " mouth(mar>" << mouth.aspect_ratio_threshold
        << " n=" << mouth.confirm_frames << ")"
        << " eyebrow(d>" << eyebrow.raise_threshold
        << " n=" << eyebrow.confirm_frames
        << " tol=" << eyebrow.center_tolerance << ")"
        << " tilt(>" << head_tilt.angle_threshold
        << " dz=" << head_tilt.deadzone
        << " n=" << head_tilt.confirm_frames << ")"
        << " cooldown=" << cooldown_s << "s";
    return oss.str();
}

DetectorConfig DetectorConfig::from_configuration(const core::Configuration& config) {
    DetectorConfig result;

    read_field(config, "eye.aspect_ratio_threshold", result.eye.aspect_ratio_threshold);
    read_field(config, "eye.min_blink_frames", result.eye.min_blink_frames);
    read_field_or_alias(config, "eye.double_blink_interval_s", "eye.double_blink_interval",
                        result.eye.double_blink_interval_s);
    read_field(config, "eye.long_close_frames", result.eye.long_close_frames);

    read_field(config, "mouth.aspect_ratio_threshold", result.mouth.aspect_ratio_threshold);
    read_field(config, "mouth.confirm_frames", result.mouth.confirm_frames);

    read_field(config, "eyebrow.raise_threshold", result.eyebrow.raise_threshold);
    read_field(config, "eyebrow.confirm_frames", result.eyebrow.confirm_frames);
    read_field(config, "eyebrow.center_tolerance", result.eyebrow.center_tolerance);
    read_field(config, "eyebrow.baseline_window", result.eyebrow.baseline_window);
    read_field(config, "eyebrow.baseline_min_samples", result.eyebrow.baseline_min_samples);

    read_field(config, "head_tilt.angle_threshold", result.head_tilt.angle_threshold);
    read_field(config, "head_tilt.deadzone", result.head_tilt.deadzone);
    read_field(config, "head_tilt.confirm_frames", result.head_tilt.confirm_frames);

    read_field_or_alias(config, "gesture.cooldown_s", "gesture.cooldown", result.cooldown_s);

    result.validate();
    return result;
}

} // namespace gesture
} // namespace facecue
