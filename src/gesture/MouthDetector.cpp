#include "facecue/gesture/MouthDetector.hpp"

namespace facecue {
namespace gesture {

MouthDetector::MouthDetector(const MouthConfig& config)
    : config_(config) {
}

void MouthDetector::configure(const MouthConfig& config) {
    config_ = config;
    reset();
}

void MouthDetector::reset() {
    state_ = MouthState();
    open_ = false;
}

void MouthDetector::on_face_lost() {
    open_ = false;
    state_.confirm_frame_count = 0;
}

GestureType MouthDetector::update(float mouth_ar) {
    open_ = mouth_ar > config_.aspect_ratio_threshold;

    if (!open_) {
        state_.confirm_frame_count = 0;
        state_.fired = false;
        return GestureType::NONE;
    }

    ++state_.confirm_frame_count;
    if (state_.confirm_frame_count >= config_.confirm_frames && !state_.fired) {
        state_.fired = true;
        return GestureType::MOUTH_OPEN;
    }
    return GestureType::NONE;
}

} // namespace gesture
} // namespace facecue
