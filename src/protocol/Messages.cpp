/**
 * @file Messages.cpp
 * @brief JSON encoding and decoding of protocol messages
 */

#include "facecue/protocol/Messages.hpp"
#include "facecue/core/exception.h"

#include <chrono>
#include <cmath>
#include <limits>

namespace facecue {
namespace protocol {

namespace {

nlohmann::json envelope(const std::string& type, nlohmann::json payload, int64_t timestamp_ms) {
    nlohmann::json message;
    message["type"] = type;
    message["payload"] = std::move(payload);
    message["timestamp"] = timestamp_ms;
    return message;
}

// Client timestamps are informational; values that do not fit int64 are dropped
std::optional<int64_t> read_timestamp_ms(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const uint64_t ms = value.get<uint64_t>();
        if (ms > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(ms);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        const double ms = value.get<double>();
        const double limit = std::ldexp(1.0, 63);
        if (!std::isfinite(ms) || ms >= limit || ms < -limit) {
            return std::nullopt;
        }
        return static_cast<int64_t>(std::llround(ms));
    }
    return std::nullopt;
}

} // namespace

ClientMessage parse_client_message(const std::string& text) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        FACECUE_THROW_CODE(core::ProtocolException, ERROR_INVALID_JSON,
                           std::string("Invalid JSON: ") + e.what());
    }
    return parse_client_object(message);
}

ClientMessage parse_client_object(const nlohmann::json& message) {
    if (!message.is_object()) {
        FACECUE_THROW_CODE(core::ProtocolException, ERROR_INVALID_MESSAGE,
                           "Message must be a JSON object");
    }

    auto type_it = message.find("type");
    if (type_it == message.end() || !type_it->is_string()) {
        FACECUE_THROW_CODE(core::ProtocolException, ERROR_INVALID_MESSAGE,
                           "Message has no string \"type\"");
    }

    nlohmann::json payload = nlohmann::json::object();
    auto payload_it = message.find("payload");
    if (payload_it != message.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            FACECUE_THROW_CODE(core::ProtocolException, ERROR_INVALID_MESSAGE,
                               "\"payload\" must be an object");
        }
        payload = *payload_it;
    }

    const std::string type = type_it->get<std::string>();
    ClientMessage result;

    if (type == "ping") {
        result.type = ClientMessageType::PING;
    } else if (type == "reset") {
        result.type = ClientMessageType::RESET;
    } else if (type == "frame") {
        result.type = ClientMessageType::FRAME;
        auto data_it = payload.find("data");
        if (data_it == payload.end() || !data_it->is_string()) {
            FACECUE_THROW_CODE(core::ProtocolException, ERROR_INVALID_MESSAGE,
                               "Frame message has no string \"payload.data\"");
        }
        result.frame_data = data_it->get<std::string>();

        auto ts_it = payload.find("timestamp");
        if (ts_it != payload.end()) {
            result.client_timestamp_ms = read_timestamp_ms(*ts_it);
        }
    } else {
        FACECUE_THROW_CODE(core::ProtocolException, ERROR_UNKNOWN_TYPE,
                           "Unknown message type: " + type);
    }

    return result;
}

nlohmann::json make_connected(const std::string& session_id, int64_t timestamp_ms) {
    nlohmann::json payload;
    payload["session_id"] = session_id;
    payload["message"] = "Connected to gesture detection server";
    return envelope("connected", std::move(payload), timestamp_ms);
}

nlohmann::json make_face_state(const gesture::DetectionResult& result, int64_t timestamp_ms) {
    const gesture::FaceStateSnapshot& state = result.state;

    nlohmann::json payload;
    payload["face_detected"] = state.face_detected;
    payload["eyes_closed"] = state.eyes_closed;
    payload["left_eye_ar"] = round_to(state.left_eye_ar, 3);
    payload["right_eye_ar"] = round_to(state.right_eye_ar, 3);
    payload["mouth_open"] = state.mouth_open;
    payload["mouth_ar"] = round_to(state.mouth_ar, 3);
    payload["eyebrows_raised"] = state.eyebrows_raised;
    payload["eyebrow_position"] = round_to(state.eyebrow_position, 4);
    payload["head_tilt_angle"] = round_to(state.head_tilt_angle, 1);
    payload["head_tilt_left"] = state.head_tilt_left;
    payload["head_tilt_right"] = state.head_tilt_right;
    payload["head_tilt_center"] = state.head_tilt_center;

    nlohmann::json message = envelope("face_state", std::move(payload), timestamp_ms);

    if (result.event) {
        message["gesture"] = {
            {"type", gesture::gesture_type_to_string(result.event->type)},
            {"name", gesture::gesture_display_name(result.event->type)}
        };
    }
    return message;
}

nlohmann::json make_pong(int64_t timestamp_ms) {
    return envelope("pong", nlohmann::json::object(), timestamp_ms);
}

nlohmann::json make_reset_complete(int64_t timestamp_ms) {
    return envelope("reset_complete", nlohmann::json::object(), timestamp_ms);
}

nlohmann::json make_error(const std::string& code, const std::string& message, int64_t timestamp_ms) {
    nlohmann::json payload;
    payload["code"] = code;
    payload["message"] = message;
    return envelope("error", std::move(payload), timestamp_ms);
}

int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace protocol
} // namespace facecue
