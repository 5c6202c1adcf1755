/**
 * @file test_mouth_detector.cpp
 * @brief Unit tests for MouthDetector
 */

#include <gtest/gtest.h>
#include <facecue/gesture/MouthDetector.hpp>

using namespace facecue::gesture;

namespace {
int count_events(MouthDetector& detector, float mar, int frames) {
    int events = 0;
    for (int i = 0; i < frames; ++i) {
        if (detector.update(mar) == GestureType::MOUTH_OPEN) {
            ++events;
        }
    }
    return events;
}
}

TEST(MouthDetectorTest, FiresOnConfirmFrame) {
    MouthDetector detector;
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(detector.update(0.5f), GestureType::NONE);
    }
    EXPECT_EQ(detector.update(0.5f), GestureType::MOUTH_OPEN);
    EXPECT_TRUE(detector.state().fired);
}

TEST(MouthDetectorTest, HeldOpenFiresExactlyOnce) {
    MouthDetector detector;
    EXPECT_EQ(count_events(detector, 0.5f, 1000), 1);
}

TEST(MouthDetectorTest, ShortOpeningDoesNotFire) {
    MouthDetector detector;
    EXPECT_EQ(count_events(detector, 0.5f, 4), 0);
    detector.update(0.1f);
    EXPECT_EQ(count_events(detector, 0.5f, 4), 0);
}

TEST(MouthDetectorTest, ThresholdIsStrict) {
    MouthDetector detector;
    EXPECT_EQ(count_events(detector, 0.30f, 10), 0);
    EXPECT_FALSE(detector.mouth_open());
}

TEST(MouthDetectorTest, ClosingRearms) {
    MouthDetector detector;
    EXPECT_EQ(count_events(detector, 0.5f, 20), 1);
    detector.update(0.1f);
    EXPECT_FALSE(detector.state().fired);
    EXPECT_EQ(count_events(detector, 0.5f, 20), 1);
}

TEST(MouthDetectorTest, FaceLossResetsRunButKeepsLatch) {
    MouthDetector detector;
    EXPECT_EQ(count_events(detector, 0.5f, 4), 0);
    detector.on_face_lost();
    EXPECT_EQ(detector.state().confirm_frame_count, 0);
    EXPECT_EQ(count_events(detector, 0.5f, 4), 0);

    EXPECT_EQ(count_events(detector, 0.5f, 1), 1);
    detector.on_face_lost();
    EXPECT_TRUE(detector.state().fired);
    EXPECT_EQ(count_events(detector, 0.5f, 10), 0);
}

TEST(MouthDetectorTest, CustomConfirmFrames) {
    MouthConfig config;
    config.confirm_frames = 1;
    config.aspect_ratio_threshold = 0.4f;
    MouthDetector detector(config);

    EXPECT_EQ(detector.update(0.35f), GestureType::NONE);
    EXPECT_EQ(detector.update(0.45f), GestureType::MOUTH_OPEN);
}
