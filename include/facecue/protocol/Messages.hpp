/**
 * @file Messages.hpp
 * @brief JSON message protocol between client and gesture server
 *
 * Every server message is an envelope
 * @code
 * { "type": "...", "payload": { ... }, "timestamp": <wall-clock ms> }
 * @endcode
 * Client messages are { "type": "frame" | "ping" | "reset", "payload": { ... } }.
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_PROTOCOL_MESSAGES_HPP
#define FACECUE_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <facecue/gesture/GestureTypes.hpp>

namespace facecue {
namespace protocol {

// Stable error codes reported in "error" messages
constexpr const char* ERROR_INVALID_JSON = "INVALID_JSON";
constexpr const char* ERROR_INVALID_MESSAGE = "INVALID_MESSAGE";
constexpr const char* ERROR_UNKNOWN_TYPE = "UNKNOWN_TYPE";
constexpr const char* ERROR_DECODE = "DECODE_ERROR";
constexpr const char* ERROR_PROCESSING = "PROCESSING_ERROR";

enum class ClientMessageType {
    FRAME,
    PING,
    RESET
};

struct ClientMessage {
    ClientMessageType type = ClientMessageType::PING;
    std::string frame_data;                     ///< Base64 or data URL (FRAME only)
    std::optional<int64_t> client_timestamp_ms; ///< Informational; never used for timing
};

/**
 * @brief Parse one client text message
 * @throws core::ProtocolException with INVALID_JSON, INVALID_MESSAGE or UNKNOWN_TYPE
 */
ClientMessage parse_client_message(const std::string& text);

/**
 * @brief Validate a parsed JSON value as a client message
 * @throws core::ProtocolException with INVALID_MESSAGE or UNKNOWN_TYPE
 */
ClientMessage parse_client_object(const nlohmann::json& message);

nlohmann::json make_connected(const std::string& session_id, int64_t timestamp_ms);

/**
 * @brief Per-frame face state, with a top-level "gesture" object when an
 *        event fired on this frame
 */
nlohmann::json make_face_state(const gesture::DetectionResult& result, int64_t timestamp_ms);

nlohmann::json make_pong(int64_t timestamp_ms);
nlohmann::json make_reset_complete(int64_t timestamp_ms);
nlohmann::json make_error(const std::string& code, const std::string& message, int64_t timestamp_ms);

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t wall_clock_ms();

/**
 * @brief Round to a fixed number of decimals for the wire
 */
double round_to(double value, int decimals);

} // namespace protocol
} // namespace facecue

#endif // FACECUE_PROTOCOL_MESSAGES_HPP
