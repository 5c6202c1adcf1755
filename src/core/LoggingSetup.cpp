#include "facecue/core/LoggingSetup.hpp"
#include "facecue/core/Configuration.hpp"
#include "facecue/core/Logger.hpp"

namespace facecue {
namespace core {

std::string configureLogging(const Configuration& config) {
    Logger& logger = Logger::getInstance();

    LogLevel level = LogLevel::INFO;
    const std::string levelName = config.getString("logging.level", "INFO");
    const bool knownLevel = parseLogLevel(levelName, level);
    if (!knownLevel) {
        level = LogLevel::INFO;
    }

    const bool console = config.getBool("logging.console", true);
    const std::string directory = config.getString("logging.directory", "");

    std::string logFile;
    if (!directory.empty() && logger.initializeWithTimestamp(directory, level)) {
        logFile = logger.getCurrentLogFile();
    } else {
        logger.initialize(level, console, false);
    }
    logger.setConsoleOutput(console);

    if (!knownLevel) {
        LOG_WARNING("Unknown logging.level '" + levelName + "', using INFO");
    }
    if (!logFile.empty()) {
        LOG_INFO("Logging to " + logFile);
    }
    return logFile;
}

} // namespace core
} // namespace facecue
