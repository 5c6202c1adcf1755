/**
 * @file FrameDecoder.cpp
 * @brief Image payload codec
 */

#include "facecue/protocol/FrameDecoder.hpp"
#include "facecue/core/exception.h"

#include <opencv2/imgcodecs.hpp>

#include <cctype>

namespace facecue {
namespace protocol {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::vector<uint8_t> base64_decode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            FACECUE_THROW(core::DecodeException, "Base64 data after padding");
        }
        const int value = decode_char(c);
        if (value < 0) {
            FACECUE_THROW(core::DecodeException,
                          "Invalid base64 character at symbol " + std::to_string(symbols));
        }
        ++symbols;
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    if (symbols % 4 == 1 || padding > 2) {
        FACECUE_THROW(core::DecodeException, "Truncated base64 data");
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t n = bytes[i] << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string strip_data_url(const std::string& data) {
    if (data.compare(0, 5, "data:") != 0) {
        return data;
    }
    const size_t comma = data.find(',');
    if (comma == std::string::npos) {
        FACECUE_THROW(core::DecodeException, "Data URL without payload");
    }
    return data.substr(comma + 1);
}

cv::Mat decode_frame(const std::string& data) {
    if (data.empty()) {
        FACECUE_THROW(core::DecodeException, "Empty frame payload");
    }

    const std::vector<uint8_t> bytes = base64_decode(strip_data_url(data));
    if (bytes.empty()) {
        FACECUE_THROW(core::DecodeException, "Empty frame payload");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        FACECUE_THROW(core::DecodeException, std::string("Image decode failed: ") + e.what());
    }
    if (image.empty()) {
        FACECUE_THROW(core::DecodeException,
                      "Payload is not a decodable image (" + std::to_string(bytes.size()) + " bytes)");
    }
    return image;
}

std::string encode_frame(const cv::Mat& image, int quality) {
    std::vector<uint8_t> buffer;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, quality};
    if (image.empty() || !cv::imencode(".jpg", image, buffer, params)) {
        FACECUE_THROW(core::DecodeException, "JPEG encoding failed");
    }
    return "data:image/jpeg;base64," + base64_encode(buffer);
}

} // namespace protocol
} // namespace facecue
