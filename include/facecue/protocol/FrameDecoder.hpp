/**
 * @file FrameDecoder.hpp
 * @brief Base64 / data-URL image payloads to and from cv::Mat
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_PROTOCOL_FRAME_DECODER_HPP
#define FACECUE_PROTOCOL_FRAME_DECODER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace facecue {
namespace protocol {

/**
 * @brief Decode standard base64 (RFC 4648, '=' padding optional, whitespace ignored)
 * @throws core::DecodeException on characters outside the alphabet or bad length
 */
std::vector<uint8_t> base64_decode(const std::string& text);

std::string base64_encode(const std::vector<uint8_t>& bytes);

/**
 * @brief Remove a "data:<mime>;base64," prefix if present
 */
std::string strip_data_url(const std::string& data);

/**
 * @brief Decode a base64 or data-URL encoded JPEG/PNG into a BGR image
 * @throws core::DecodeException if the payload is not a decodable image
 */
cv::Mat decode_frame(const std::string& data);

/**
 * @brief Encode an image as a "data:image/jpeg;base64," URL
 * @throws core::DecodeException if JPEG encoding fails
 */
std::string encode_frame(const cv::Mat& image, int quality = 80);

} // namespace protocol
} // namespace facecue

#endif // FACECUE_PROTOCOL_FRAME_DECODER_HPP
