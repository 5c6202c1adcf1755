/**
 * @file types.hpp
 * @brief Common type definitions for FaceCue
 *
 * Fundamental result codes and time types shared by every FaceCue module.
 */

#ifndef FACECUE_CORE_TYPES_HPP
#define FACECUE_CORE_TYPES_HPP

#include <chrono>
#include <string>

namespace facecue {
namespace core {

/**
 * @brief Result codes returned or carried by FaceCue operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_INVALID_PARAMETER,
    ERROR_INVALID_CONFIG,
    ERROR_NOT_INITIALIZED,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_DECODE_FAILURE,
    ERROR_INVALID_MESSAGE,
    ERROR_CAMERA_NOT_FOUND
};

/**
 * @brief Monotonic time used for frame capture and gesture timing
 */
using Timestamp = std::chrono::steady_clock::time_point;
using Seconds = std::chrono::duration<double>;

/**
 * @brief Convert a duration in seconds to the monotonic clock's duration
 */
inline std::chrono::steady_clock::duration toClockDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(Seconds(seconds));
}

} // namespace core
} // namespace facecue

#endif // FACECUE_CORE_TYPES_HPP
