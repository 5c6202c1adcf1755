/**
 * @file EyebrowDetector.cpp
 * @brief Implementation of the eyebrow gesture state machine
 */

#include "facecue/gesture/EyebrowDetector.hpp"
#include "facecue/core/Logger.hpp"

#include <cmath>

namespace facecue {
namespace gesture {

EyebrowDetector::EyebrowDetector(const EyebrowConfig& config)
    : config_(config) {
}

void EyebrowDetector::configure(const EyebrowConfig& config) {
    config_ = config;
    reset();
}

void EyebrowDetector::reset() {
    state_ = EyebrowState();
    samples_.clear();
    sample_sum_ = 0.0;
    raised_ = false;
    suppressed_ = false;
}

void EyebrowDetector::on_face_lost() {
    raised_ = false;
    suppressed_ = false;
    state_.confirm_frame_count = 0;
}

void EyebrowDetector::add_baseline_sample(float position) {
    samples_.push_back(position);
    sample_sum_ += position;

    while (samples_.size() > static_cast<size_t>(config_.baseline_window)) {
        sample_sum_ -= samples_.front();
        samples_.pop_front();
    }

    if (samples_.size() >= static_cast<size_t>(config_.baseline_min_samples)) {
        state_.baseline = static_cast<float>(sample_sum_ / static_cast<double>(samples_.size()));
    }
}

GestureType EyebrowDetector::update(float eyebrow_position, float head_deviation) {
    raised_ = false;

    if (std::abs(head_deviation) >= config_.center_tolerance) {
        suppressed_ = true;
        return GestureType::NONE;
    }
    suppressed_ = false;

    if (state_.baseline) {
        raised_ = eyebrow_position - *state_.baseline > config_.raise_threshold;
    }

    if (!raised_) {
        state_.confirm_frame_count = 0;
        state_.fired = false;
        add_baseline_sample(eyebrow_position);
        return GestureType::NONE;
    }

    ++state_.confirm_frame_count;
    if (state_.confirm_frame_count >= config_.confirm_frames && !state_.fired) {
        state_.fired = true;
        FACECUE_LOG_DEBUG("EyebrowDetector") << "raise confirmed, delta="
                                             << (eyebrow_position - *state_.baseline);
        return GestureType::EYEBROWS_RAISED;
    }
    return GestureType::NONE;
}

} // namespace gesture
} // namespace facecue
