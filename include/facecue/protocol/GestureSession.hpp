/**
 * @file GestureSession.hpp
 * @brief One client session: message handling around a SessionDetector
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_PROTOCOL_GESTURE_SESSION_HPP
#define FACECUE_PROTOCOL_GESTURE_SESSION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <facecue/face/LandmarkProvider.hpp>
#include <facecue/gesture/SessionDetector.hpp>
#include <facecue/protocol/Messages.hpp>

namespace facecue {
namespace protocol {

/**
 * @brief Session counters
 */
struct GestureSessionStats {
    gesture::SessionStats detection;
    uint64_t messages_received = 0;
    uint64_t errors_sent = 0;
};

/**
 * @brief Per-client message handler
 *
 * Owns the session's SessionDetector and landmark provider. Each text
 * message yields exactly one response message. Malformed input is answered
 * with an "error" message and leaves the detector state untouched.
 *
 * Thread-safety: messages of one session are serialized by an internal
 * mutex; different sessions share nothing.
 */
class GestureSession {
public:
    using Clock = std::function<core::Timestamp()>;
    using WallClock = std::function<int64_t()>;
    using GestureCallback = std::function<void(const std::string& session_id,
                                               const gesture::GestureEvent& event)>;

    /**
     * @brief Constructor
     *
     * @param id Session identifier
     * @param config Detector configuration
     * @param provider Landmark backend owned by this session
     * @param clock Frame timestamp source (steady_clock::now if empty)
     * @param wall_clock Envelope timestamp source (wall_clock_ms if empty)
     * @throws core::ConfigException if config is invalid
     * @throws core::Exception (ERROR_INVALID_PARAMETER) if provider is null
     */
    GestureSession(std::string id,
                   const gesture::DetectorConfig& config,
                   std::unique_ptr<face::ILandmarkProvider> provider,
                   Clock clock = Clock(),
                   WallClock wall_clock = WallClock());

    ~GestureSession();

    GestureSession(const GestureSession&) = delete;
    GestureSession& operator=(const GestureSession&) = delete;

    const std::string& id() const { return id_; }

    /**
     * @brief Greeting sent when the client connects
     */
    nlohmann::json open();

    /**
     * @brief Handle one raw client text message
     * @return The response message (never throws for malformed input)
     */
    nlohmann::json handle_text(const std::string& text);

    /**
     * @brief Handle one parsed client message
     */
    nlohmann::json handle_message(const ClientMessage& message);

    /**
     * @brief Run landmark + feature extraction + detection on one image
     * @throws core::Exception if the provider output does not fit its layout
     */
    gesture::DetectionResult process_image(const cv::Mat& image);

    /**
     * @brief Run detection on an already extracted feature frame
     */
    gesture::DetectionResult process_features(const gesture::FeatureFrame& frame);

    void reset();

    void set_gesture_callback(GestureCallback callback);

    GestureSessionStats stats() const;

private:
    class Impl;
    std::string id_;
    std::unique_ptr<Impl> pImpl;
};

} // namespace protocol
} // namespace facecue

#endif // FACECUE_PROTOCOL_GESTURE_SESSION_HPP
