/**
 * @file facecue_camera.cpp
 * @brief Live facial gesture detection from a webcam
 *
 * OpenCV VideoCapture -> Facemark landmarks -> SessionDetector.
 * Keys in the display window: 'r' resets the detector, 'q' quits.
 */

#include <facecue/core/Configuration.hpp>
#include <facecue/core/LoggingSetup.hpp>
#include <facecue/core/Logger.hpp>
#include <facecue/core/exception.h>
#include <facecue/face/FeatureExtractor.hpp>
#include <facecue/face/LandmarkProvider.hpp>
#include <facecue/gesture/SessionDetector.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <iostream>
#include <iomanip>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <sstream>

using namespace facecue;

// Global flag for clean shutdown
std::atomic<bool> should_exit(false);

void signal_handler(int signal) {
    std::cout << "\n\nReceived signal " << signal << ", shutting down..." << std::endl;
    should_exit = true;
}

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help" << std::endl;
    std::cout << "  -c, --config <file>  YAML configuration file" << std::endl;
    std::cout << "  -d, --display        Show live camera feed with overlay" << std::endl;
    std::cout << "  -v, --verbose        Verbose logging" << std::endl;
}

void draw_overlay(cv::Mat& frame, const face::FaceLandmarks& landmarks,
                  const gesture::DetectionResult& result, const std::string& last_gesture) {
    const cv::Scalar green(0, 255, 0);
    const cv::Scalar yellow(0, 255, 255);

    if (!landmarks.face_box.empty()) {
        cv::rectangle(frame, landmarks.face_box, green, 2);
    }
    for (const cv::Point2f& p : landmarks.points) {
        cv::circle(frame, cv::Point2f(p.x * frame.cols, p.y * frame.rows), 1, green, -1);
    }

    const gesture::FaceStateSnapshot& s = result.state;
    std::ostringstream line1;
    line1 << std::fixed << std::setprecision(3)
          << "EAR " << (s.left_eye_ar + s.right_eye_ar) * 0.5f
          << "  MAR " << s.mouth_ar
          << "  tilt " << std::setprecision(1) << s.head_deviation;
    cv::putText(frame, line1.str(), cv::Point(10, 25), cv::FONT_HERSHEY_SIMPLEX, 0.6, yellow, 2);

    std::ostringstream line2;
    line2 << (s.face_detected ? "" : "NO FACE ")
          << (s.eyes_closed ? "EYES_CLOSED " : "")
          << (s.mouth_open ? "MOUTH_OPEN " : "")
          << (s.eyebrows_raised ? "BROWS_RAISED " : "")
          << (s.head_tilt_left ? "TILT_L " : "")
          << (s.head_tilt_right ? "TILT_R " : "");
    cv::putText(frame, line2.str(), cv::Point(10, 50), cv::FONT_HERSHEY_SIMPLEX, 0.6, yellow, 2);

    if (!last_gesture.empty()) {
        cv::putText(frame, last_gesture, cv::Point(10, frame.rows - 20),
                    cv::FONT_HERSHEY_SIMPLEX, 0.9, green, 2);
    }
}

int main(int argc, char** argv) {
    std::string config_path;
    bool show_display = false;
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
        } else if (arg == "-d" || arg == "--display") {
            show_display = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        core::Configuration& config = core::Configuration::getInstance();
        if (!config_path.empty()) {
            config.load(config_path);
        }
        core::configureLogging(config);
        if (verbose) {
            core::Logger::getInstance().setLevel(core::LogLevel::DEBUG);
        }

        gesture::SessionDetector detector(gesture::DetectorConfig::from_configuration(config));
        face::FacemarkLandmarkProvider provider(face::FacemarkProviderConfig::from_configuration(config));
        face::FeatureExtractor extractor(provider.layout());

        const int device_id = config.getInt("camera.device_id", 0);
        cv::VideoCapture capture(device_id);
        if (!capture.isOpened()) {
            FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_CAMERA_NOT_FOUND,
                               "Cannot open camera " + std::to_string(device_id));
        }
        capture.set(cv::CAP_PROP_FRAME_WIDTH, config.getInt("camera.width", 640));
        capture.set(cv::CAP_PROP_FRAME_HEIGHT, config.getInt("camera.height", 480));
        capture.set(cv::CAP_PROP_FPS, config.getInt("camera.fps", 30));

        LOG_INFO("Camera " + std::to_string(device_id) + " opened, detection running");

        if (show_display) {
            cv::namedWindow("FaceCue", cv::WINDOW_NORMAL);
        }

        cv::Mat frame;
        face::FaceLandmarks landmarks;
        std::string last_gesture;
        int frame_count = 0;
        auto start_time = std::chrono::steady_clock::now();

        while (!should_exit) {
            if (!capture.read(frame) || frame.empty()) {
                LOG_WARNING("Camera frame grab failed");
                continue;
            }
            const core::Timestamp now = std::chrono::steady_clock::now();

            provider.detect(frame, landmarks);
            gesture::DetectionResult result = detector.process(extractor.extract(landmarks, now));

            if (result.event) {
                last_gesture = gesture::gesture_display_name(result.event->type);
                std::cout << "GESTURE: " << gesture::gesture_type_to_string(result.event->type) << std::endl;
            }

            if (++frame_count % 90 == 0) {
                double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
                FACECUE_LOG_DEBUG("facecue_camera") << "FPS: " << std::fixed << std::setprecision(1)
                                                    << frame_count / elapsed;
            }

            if (show_display) {
                draw_overlay(frame, landmarks, result, last_gesture);
                cv::imshow("FaceCue", frame);
                const int key = cv::waitKey(1) & 0xFF;
                if (key == 'q') {
                    break;
                }
                if (key == 'r') {
                    detector.reset();
                    last_gesture.clear();
                    LOG_INFO("Detector reset");
                }
            }
        }

        const gesture::SessionStats stats = detector.stats();
        LOG_INFO("Processed " + std::to_string(stats.frames_processed) + " frames, " +
                 std::to_string(stats.events_emitted) + " gestures");
    } catch (const core::Exception& e) {
        LOG_CRITICAL(e.what());
        return 1;
    }

    return 0;
}
