/**
 * @file test_protocol_messages.cpp
 * @brief Frame payload codec and JSON message tests
 */

#include <gtest/gtest.h>
#include <facecue/protocol/FrameDecoder.hpp>
#include <facecue/protocol/Messages.hpp>
#include <facecue/core/exception.h>

#include <string>

using namespace facecue;
using namespace facecue::protocol;

namespace {
std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string error_code_of(const std::string& text) {
    try {
        parse_client_message(text);
    } catch (const core::ProtocolException& e) {
        return e.getErrorCode();
    }
    return "";
}
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("M")), "TQ==");
    EXPECT_EQ(base64_encode(bytes_of("Ma")), "TWE=");
    EXPECT_EQ(base64_encode(bytes_of("Man")), "TWFu");

    EXPECT_EQ(base64_decode("TWFu"), bytes_of("Man"));
    EXPECT_EQ(base64_decode("TWE="), bytes_of("Ma"));
    EXPECT_EQ(base64_decode("TQ"), bytes_of("M"));
    EXPECT_EQ(base64_decode("TW\nFu"), bytes_of("Man"));
}

TEST(Base64Test, RejectsInvalidInput) {
    EXPECT_THROW(base64_decode("TW*u"), core::DecodeException);
    EXPECT_THROW(base64_decode("TWFuT"), core::DecodeException);
    EXPECT_THROW(base64_decode("TQ==TQ"), core::DecodeException);
}

TEST(FrameDecoderTest, StripsDataUrlPrefix) {
    EXPECT_EQ(strip_data_url("data:image/jpeg;base64,AAAA"), "AAAA");
    EXPECT_EQ(strip_data_url("AAAA"), "AAAA");
    EXPECT_THROW(strip_data_url("data:image/jpeg;base64"), core::DecodeException);
}

TEST(FrameDecoderTest, DecodesEncodedImage) {
    cv::Mat image(48, 64, CV_8UC3, cv::Scalar(40, 120, 200));
    const std::string url = encode_frame(image);
    ASSERT_EQ(url.rfind("data:image/jpeg;base64,", 0), 0u);

    cv::Mat decoded = decode_frame(url);
    EXPECT_EQ(decoded.cols, 64);
    EXPECT_EQ(decoded.rows, 48);
    EXPECT_EQ(decoded.type(), CV_8UC3);

    // Plain base64 without the data URL prefix
    cv::Mat plain = decode_frame(strip_data_url(url));
    EXPECT_EQ(plain.size(), decoded.size());
}

TEST(FrameDecoderTest, RejectsNonImagePayloads) {
    EXPECT_THROW(decode_frame(""), core::DecodeException);
    EXPECT_THROW(decode_frame("aGVsbG8gd29ybGQ="), core::DecodeException);    // "hello world"
    EXPECT_THROW(decode_frame("data:image/jpeg;base64,%%%"), core::DecodeException);
}

TEST(MessagesTest, ParsesClientMessages) {
    EXPECT_EQ(parse_client_message(R"({"type":"ping"})").type, ClientMessageType::PING);
    EXPECT_EQ(parse_client_message(R"({"type":"reset","payload":{}})").type, ClientMessageType::RESET);

    ClientMessage frame = parse_client_message(
        R"({"type":"frame","payload":{"data":"data:image/jpeg;base64,AAAA","timestamp":1700000000000}})");
    EXPECT_EQ(frame.type, ClientMessageType::FRAME);
    EXPECT_EQ(frame.frame_data, "data:image/jpeg;base64,AAAA");
    ASSERT_TRUE(frame.client_timestamp_ms.has_value());
    EXPECT_EQ(*frame.client_timestamp_ms, 1700000000000LL);
}

TEST(MessagesTest, ClientTimestampOutOfRangeIsDropped) {
    auto timestamp_of = [](const std::string& value) {
        return parse_client_message(
            R"({"type":"frame","payload":{"data":"AAAA","timestamp":)" + value + "}}")
            .client_timestamp_ms;
    };

    EXPECT_EQ(timestamp_of("1700000000000.6"), std::optional<int64_t>(1700000000001LL));
    EXPECT_EQ(timestamp_of("-5"), std::optional<int64_t>(-5));
    EXPECT_FALSE(timestamp_of("1e30").has_value());
    EXPECT_FALSE(timestamp_of("-1e30").has_value());
    EXPECT_FALSE(timestamp_of("18446744073709551615").has_value());
    EXPECT_FALSE(timestamp_of("\"soon\"").has_value());
}

TEST(MessagesTest, ErrorCodes) {
    EXPECT_EQ(error_code_of("{not json"), ERROR_INVALID_JSON);
    EXPECT_EQ(error_code_of("[1,2,3]"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"payload":{}})"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"type":42})"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"type":"frame"})"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"type":"frame","payload":{"data":5}})"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"type":"ping","payload":"x"})"), ERROR_INVALID_MESSAGE);
    EXPECT_EQ(error_code_of(R"({"type":"dance"})"), ERROR_UNKNOWN_TYPE);
}

TEST(MessagesTest, EnvelopeShape) {
    nlohmann::json pong = make_pong(1234);
    EXPECT_EQ(pong["type"], "pong");
    EXPECT_EQ(pong["timestamp"], 1234);
    EXPECT_TRUE(pong["payload"].is_object());

    nlohmann::json connected = make_connected("abc", 1);
    EXPECT_EQ(connected["type"], "connected");
    EXPECT_EQ(connected["payload"]["session_id"], "abc");

    nlohmann::json error = make_error(ERROR_DECODE, "bad frame", 2);
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["payload"]["code"], "DECODE_ERROR");
    EXPECT_EQ(error["payload"]["message"], "bad frame");

    EXPECT_EQ(make_reset_complete(3)["type"], "reset_complete");
}

TEST(MessagesTest, FaceStateRoundsAndCarriesGesture) {
    gesture::DetectionResult result;
    result.state.face_detected = true;
    result.state.mouth_open = true;
    result.state.left_eye_ar = 0.28765f;
    result.state.mouth_ar = 0.41234f;
    result.state.eyebrow_position = -0.081234f;
    result.state.head_tilt_angle = -178.26f;

    nlohmann::json without = make_face_state(result, 10);
    EXPECT_EQ(without["type"], "face_state");
    EXPECT_FALSE(without.contains("gesture"));
    EXPECT_TRUE(without["payload"]["mouth_open"].get<bool>());
    EXPECT_DOUBLE_EQ(without["payload"]["left_eye_ar"].get<double>(), 0.288);
    EXPECT_DOUBLE_EQ(without["payload"]["mouth_ar"].get<double>(), 0.412);
    EXPECT_DOUBLE_EQ(without["payload"]["eyebrow_position"].get<double>(), -0.0812);
    EXPECT_DOUBLE_EQ(without["payload"]["head_tilt_angle"].get<double>(), -178.3);

    gesture::GestureEvent event;
    event.type = gesture::GestureType::MOUTH_OPEN;
    result.event = event;
    nlohmann::json with = make_face_state(result, 10);
    ASSERT_TRUE(with.contains("gesture"));
    EXPECT_EQ(with["gesture"]["type"], "MOUTH_OPEN");
    EXPECT_EQ(with["gesture"]["name"], gesture::gesture_display_name(gesture::GestureType::MOUTH_OPEN));
}

TEST(MessagesTest, WallClockIsEpochMilliseconds) {
    // 2020-01-01 in ms
    EXPECT_GT(wall_clock_ms(), 1577836800000LL);
}
