/**
 * @file FeatureTrace.hpp
 * @brief CSV traces of feature frames for offline replay and tuning
 *
 * Format (header line required, '#' lines ignored):
 * @code
 * timestamp_s,face_detected,left_eye_ar,right_eye_ar,mouth_ar,eyebrow_position,head_tilt_angle
 * 0.000,1,0.28,0.29,0.05,-0.081,-178.2
 * 0.033,0,,,,,
 * @endcode
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_GESTURE_FEATURE_TRACE_HPP
#define FACECUE_GESTURE_FEATURE_TRACE_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "GestureTypes.hpp"

namespace facecue {
namespace gesture {

/**
 * @brief Parse a trace; timestamps are offsets from origin
 * @throws core::FileException on a malformed line (message names the line)
 */
std::vector<FeatureFrame> read_feature_trace(std::istream& input,
                                             core::Timestamp origin = core::Timestamp());

/**
 * @brief Parse a trace file
 * @throws core::FileException if the file cannot be opened or is malformed
 */
std::vector<FeatureFrame> load_feature_trace(const std::string& path,
                                             core::Timestamp origin = core::Timestamp());

/**
 * @brief Write frames in the trace format
 */
void write_feature_trace(std::ostream& output,
                         const std::vector<FeatureFrame>& frames,
                         core::Timestamp origin = core::Timestamp());

} // namespace gesture
} // namespace facecue

#endif // FACECUE_GESTURE_FEATURE_TRACE_HPP
