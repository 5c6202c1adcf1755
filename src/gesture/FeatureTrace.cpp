#include "facecue/gesture/FeatureTrace.hpp"
#include "facecue/core/exception.h"
#include "facecue/core/Logger.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace facecue {
namespace gesture {

namespace {

constexpr const char* kHeader =
    "timestamp_s,face_detected,left_eye_ar,right_eye_ar,mouth_ar,eyebrow_position,head_tilt_angle";
constexpr size_t kColumns = 7;

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

float parse_float(const std::string& text, size_t line_number) {
    try {
        size_t consumed = 0;
        float value = std::stof(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Trace line " + std::to_string(line_number) +
                           ": invalid number '" + text + "'");
    }
}

double parse_seconds(const std::string& text, size_t line_number) {
    double value = 0.0;
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Trace line " + std::to_string(line_number) +
                           ": invalid timestamp '" + text + "'");
    }
    if (!std::isfinite(value)) {
        FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Trace line " + std::to_string(line_number) +
                           ": timestamp must be finite");
    }
    return value;
}

} // namespace

std::vector<FeatureFrame> read_feature_trace(std::istream& input, core::Timestamp origin) {
    std::vector<FeatureFrame> frames;
    std::string line;
    size_t line_number = 0;
    bool header_seen = false;

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_seen) {
            if (line != kHeader) {
                FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                                   "Trace line " + std::to_string(line_number) +
                                   ": expected header '" + std::string(kHeader) + "'");
            }
            header_seen = true;
            continue;
        }

        std::vector<std::string> fields = split_csv(line);
        if (fields.size() != kColumns) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                               "Trace line " + std::to_string(line_number) + ": expected " +
                               std::to_string(kColumns) + " columns, got " +
                               std::to_string(fields.size()));
        }

        FeatureFrame frame;
        frame.timestamp = origin + core::toClockDuration(parse_seconds(fields[0], line_number));
        frame.face_detected = fields[1] == "1" || fields[1] == "true";

        if (frame.face_detected) {
            frame.left_eye_ar = parse_float(fields[2], line_number);
            frame.right_eye_ar = parse_float(fields[3], line_number);
            frame.mouth_ar = parse_float(fields[4], line_number);
            frame.eyebrow_position = parse_float(fields[5], line_number);
            frame.head_tilt_angle = parse_float(fields[6], line_number);
        }

        if (!frames.empty() && frame.timestamp < frames.back().timestamp) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                               "Trace line " + std::to_string(line_number) +
                               ": timestamp goes backwards");
        }
        frames.push_back(frame);
    }

    return frames;
}

std::vector<FeatureFrame> load_feature_trace(const std::string& path, core::Timestamp origin) {
    std::ifstream file(path);
    if (!file.is_open()) {
        FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                           "Cannot open trace file: " + path);
    }
    std::vector<FeatureFrame> frames = read_feature_trace(file, origin);
    LOG_INFO("Loaded " + std::to_string(frames.size()) + " frames from " + path);
    return frames;
}

void write_feature_trace(std::ostream& output,
                         const std::vector<FeatureFrame>& frames,
                         core::Timestamp origin) {
    output << kHeader << "\n";
    for (const FeatureFrame& frame : frames) {
        const double seconds = core::Seconds(frame.timestamp - origin).count();
        output << std::fixed << std::setprecision(3) << seconds << ",";
        if (!frame.face_detected) {
            output << "0,,,,,\n";
            continue;
        }
        output << "1,"
               << std::setprecision(4) << frame.left_eye_ar << ","
               << frame.right_eye_ar << ","
               << frame.mouth_ar << ","
               << std::setprecision(5) << frame.eyebrow_position << ","
               << std::setprecision(2) << frame.head_tilt_angle << "\n";
    }
}

} // namespace gesture
} // namespace facecue
