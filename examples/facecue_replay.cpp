/**
 * @file facecue_replay.cpp
 * @brief Replay a CSV trace of feature frames through the gesture detector
 *
 * Prints one line per emitted gesture and a summary of the session counters.
 * Useful for tuning thresholds against recorded sensor traces.
 */

#include <facecue/core/Configuration.hpp>
#include <facecue/core/LoggingSetup.hpp>
#include <facecue/core/Logger.hpp>
#include <facecue/core/exception.h>
#include <facecue/gesture/FeatureTrace.hpp>
#include <facecue/gesture/SessionDetector.hpp>
#include <iostream>
#include <iomanip>
#include <map>

using namespace facecue;

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options] <trace.csv>" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help" << std::endl;
    std::cout << "  -c, --config <file>  YAML configuration file" << std::endl;
    std::cout << "  -s, --states         Print the face state of every frame" << std::endl;
    std::cout << "  -v, --verbose        Verbose logging" << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string trace_path;
    bool print_states = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            }
        } else if (arg == "-s" || arg == "--states") {
            print_states = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            trace_path = arg;
        }
    }

    if (trace_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        core::Configuration config;
        if (!config_path.empty()) {
            config.load(config_path);
        }
        core::configureLogging(config);
        if (verbose) {
            core::Logger::getInstance().setLevel(core::LogLevel::DEBUG);
        }

        gesture::SessionDetector detector(gesture::DetectorConfig::from_configuration(config));
        LOG_INFO("Detector configuration: " + detector.config().to_string());

        const core::Timestamp origin;
        const std::vector<gesture::FeatureFrame> frames = gesture::load_feature_trace(trace_path, origin);

        std::map<gesture::GestureType, int> gesture_counts;
        size_t index = 0;
        for (const gesture::FeatureFrame& frame : frames) {
            gesture::DetectionResult result = detector.process(frame);
            const double t = core::Seconds(frame.timestamp - origin).count();

            if (print_states) {
                const gesture::FaceStateSnapshot& s = result.state;
                std::cout << std::fixed << std::setprecision(3) << t
                          << " face=" << s.face_detected
                          << " eyes_closed=" << s.eyes_closed
                          << " mouth_open=" << s.mouth_open
                          << " brows_raised=" << s.eyebrows_raised
                          << " tilt=" << std::setprecision(1) << s.head_deviation << std::endl;
            }

            if (result.event) {
                gesture_counts[result.event->type]++;
                std::cout << "frame " << index << " t=" << std::fixed << std::setprecision(3) << t
                          << "s " << gesture::gesture_type_to_string(result.event->type) << std::endl;
            }
            ++index;
        }

        const gesture::SessionStats stats = detector.stats();
        std::cout << "\n=== Summary ===" << std::endl;
        std::cout << "Frames: " << stats.frames_processed
                  << " (no face: " << stats.frames_without_face << ")" << std::endl;
        std::cout << "Events: " << stats.events_emitted
                  << " | suppressed by cooldown: " << stats.events_suppressed
                  << " | discarded same-frame: " << stats.events_discarded << std::endl;
        for (const auto& entry : gesture_counts) {
            std::cout << "  " << std::left << std::setw(18)
                      << gesture::gesture_type_to_string(entry.first) << entry.second << std::endl;
        }
    } catch (const core::Exception& e) {
        LOG_CRITICAL(e.what());
        return 1;
    }

    return 0;
}
