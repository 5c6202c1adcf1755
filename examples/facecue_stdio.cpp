/**
 * @file facecue_stdio.cpp
 * @brief One gesture session over stdin/stdout
 *
 * Reads one client JSON message per line from stdin and writes one server
 * JSON message per line to stdout. Logging goes to stderr.
 */

#include <facecue/core/Configuration.hpp>
#include <facecue/core/LoggingSetup.hpp>
#include <facecue/core/Logger.hpp>
#include <facecue/core/exception.h>
#include <facecue/protocol/SessionRegistry.hpp>
#include <iostream>

using namespace facecue;

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help" << std::endl;
    std::cout << "  -c, --config <file>  YAML configuration file" << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            }
        }
    }

    try {
        core::Configuration config;
        if (!config_path.empty()) {
            config.load(config_path);
        }
        core::configureLogging(config);

        const face::FacemarkProviderConfig provider_config =
            face::FacemarkProviderConfig::from_configuration(config);

        protocol::SessionRegistry registry(
            gesture::DetectorConfig::from_configuration(config),
            [provider_config]() -> std::unique_ptr<face::ILandmarkProvider> {
                return std::make_unique<face::FacemarkLandmarkProvider>(provider_config);
            });

        std::shared_ptr<protocol::GestureSession> session = registry.open();
        std::cout << session->open().dump() << std::endl;

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            std::cout << session->handle_text(line).dump() << std::endl;
        }

        registry.close(session->id());
    } catch (const core::Exception& e) {
        LOG_CRITICAL(e.what());
        return 1;
    }

    return 0;
}
