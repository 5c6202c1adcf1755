/**
 * @file GestureSession.cpp
 * @brief Client message handling for one gesture session
 */

#include "facecue/protocol/GestureSession.hpp"
#include "facecue/protocol/FrameDecoder.hpp"
#include "facecue/face/FeatureExtractor.hpp"
#include "facecue/core/exception.h"
#include "facecue/core/Logger.hpp"

#include <mutex>

namespace facecue {
namespace protocol {

class GestureSession::Impl {
public:
    const std::string& id;
    gesture::SessionDetector detector;
    std::unique_ptr<face::ILandmarkProvider> provider;
    face::FeatureExtractor extractor;
    Clock clock;
    WallClock wall_clock;
    GestureCallback callback;

    mutable std::mutex mutex;
    uint64_t messages_received = 0;
    uint64_t errors_sent = 0;

    Impl(const std::string& session_id,
         const gesture::DetectorConfig& config,
         std::unique_ptr<face::ILandmarkProvider> landmark_provider,
         Clock frame_clock,
         WallClock envelope_clock)
        : id(session_id)
        , detector(config)
        , provider(std::move(landmark_provider))
        , extractor(provider ? provider->layout() : face::LandmarkLayout::ibug_68())
        , clock(std::move(frame_clock))
        , wall_clock(std::move(envelope_clock)) {
        if (!clock) {
            clock = [] { return std::chrono::steady_clock::now(); };
        }
        if (!wall_clock) {
            wall_clock = &wall_clock_ms;
        }
    }

    nlohmann::json error(const std::string& code, const std::string& message) {
        ++errors_sent;
        return make_error(code, message, wall_clock());
    }

    gesture::DetectionResult detect(const gesture::FeatureFrame& frame) {
        gesture::DetectionResult result = detector.process(frame);
        if (result.event && callback) {
            callback(id, *result.event);
        }
        return result;
    }

    gesture::DetectionResult process_image(const cv::Mat& image) {
        const core::Timestamp now = clock();
        face::FaceLandmarks landmarks;
        if (!provider->detect(image, landmarks)) {
            landmarks = face::FaceLandmarks();
        }
        return detect(extractor.extract(landmarks, now));
    }

    nlohmann::json handle_message(const ClientMessage& message) {
        switch (message.type) {
            case ClientMessageType::PING:
                return make_pong(wall_clock());

            case ClientMessageType::RESET:
                detector.reset();
                FACECUE_LOG_INFO("GestureSession") << id << ": state reset by client";
                return make_reset_complete(wall_clock());

            case ClientMessageType::FRAME: {
                cv::Mat image;
                try {
                    image = decode_frame(message.frame_data);
                } catch (const core::DecodeException& e) {
                    FACECUE_LOG_WARNING("GestureSession") << id << ": " << e.getMessage();
                    return error(ERROR_DECODE, "Failed to decode frame: " + e.getMessage());
                }
                const gesture::DetectionResult result = process_image(image);
                return make_face_state(result, wall_clock());
            }
        }
        return error(ERROR_UNKNOWN_TYPE, "Unhandled message type");
    }
};

GestureSession::GestureSession(std::string id,
                               const gesture::DetectorConfig& config,
                               std::unique_ptr<face::ILandmarkProvider> provider,
                               Clock clock,
                               WallClock wall_clock)
    : id_(std::move(id)) {
    if (!provider) {
        FACECUE_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                           "Session " + id_ + " needs a landmark provider");
    }
    pImpl = std::make_unique<Impl>(id_, config, std::move(provider),
                                   std::move(clock), std::move(wall_clock));
    FACECUE_LOG_DEBUG("GestureSession") << id_ << ": created with provider "
                                        << pImpl->provider->name();
}

GestureSession::~GestureSession() = default;

nlohmann::json GestureSession::open() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return make_connected(id_, pImpl->wall_clock());
}

nlohmann::json GestureSession::handle_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ++pImpl->messages_received;

    ClientMessage message;
    try {
        message = parse_client_message(text);
    } catch (const core::ProtocolException& e) {
        FACECUE_LOG_WARNING("GestureSession") << id_ << ": " << e.getErrorCode()
                                              << " " << e.getMessage();
        return pImpl->error(e.getErrorCode(), e.getMessage());
    }

    try {
        return pImpl->handle_message(message);
    } catch (const core::Exception& e) {
        FACECUE_LOG_ERROR("GestureSession") << id_ << ": frame processing failed: " << e.what();
        return pImpl->error(ERROR_PROCESSING, e.getMessage());
    } catch (const cv::Exception& e) {
        FACECUE_LOG_ERROR("GestureSession") << id_ << ": OpenCV error: " << e.what();
        return pImpl->error(ERROR_PROCESSING, e.what());
    }
}

nlohmann::json GestureSession::handle_message(const ClientMessage& message) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ++pImpl->messages_received;
    return pImpl->handle_message(message);
}

gesture::DetectionResult GestureSession::process_image(const cv::Mat& image) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->process_image(image);
}

gesture::DetectionResult GestureSession::process_features(const gesture::FeatureFrame& frame) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->detect(frame);
}

void GestureSession::reset() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->detector.reset();
}

void GestureSession::set_gesture_callback(GestureCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->callback = std::move(callback);
}

GestureSessionStats GestureSession::stats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    GestureSessionStats stats;
    stats.detection = pImpl->detector.stats();
    stats.messages_received = pImpl->messages_received;
    stats.errors_sent = pImpl->errors_sent;
    return stats;
}

} // namespace protocol
} // namespace facecue
