#pragma once

#include <string>

/**
 * @file LoggingSetup.hpp
 * @brief Configure the global logger from the "logging" configuration section
 */

namespace facecue {
namespace core {

class Configuration;

/**
 * Apply logging.level, logging.console and logging.directory.
 * An unknown level name keeps INFO and logs a warning.
 * @return Path of the opened log file, empty if logging to console only
 */
std::string configureLogging(const Configuration& config);

} // namespace core
} // namespace facecue
