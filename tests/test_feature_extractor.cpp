/**
 * @file test_feature_extractor.cpp
 * @brief Landmark geometry tests for FeatureExtractor and LandmarkLayout
 */

#include <gtest/gtest.h>
#include <facecue/face/FeatureExtractor.hpp>
#include <facecue/face/LandmarkProvider.hpp>
#include <facecue/gesture/HeadTiltDetector.hpp>
#include <facecue/core/exception.h>

using namespace facecue;
using namespace facecue::face;

namespace {

// Upright synthetic face in the iBUG 68 layout, everything else at the center
FaceLandmarks make_face(float eye_open = 0.03f, float mouth_open = 0.01f,
                        float brow_y = 0.35f, float nose_x = 0.5f) {
    const LandmarkLayout layout = LandmarkLayout::ibug_68();
    FaceLandmarks face;
    face.points.assign(68, cv::Point2f(0.5f, 0.5f));

    auto set_opening = [&](const LandmarkLayout::Opening& o, float cx, float cy,
                           float width, float height) {
        face.points[o.top] = cv::Point2f(cx, cy - height / 2);
        face.points[o.bottom] = cv::Point2f(cx, cy + height / 2);
        face.points[o.left] = cv::Point2f(cx - width / 2, cy);
        face.points[o.right] = cv::Point2f(cx + width / 2, cy);
    };

    set_opening(layout.right_eye, 0.40f, 0.42f, 0.10f, eye_open);
    set_opening(layout.left_eye, 0.60f, 0.42f, 0.10f, eye_open);
    set_opening(layout.mouth, 0.50f, 0.70f, 0.10f, mouth_open);

    face.points[layout.right_eyebrow] = cv::Point2f(0.40f, brow_y);
    face.points[layout.left_eyebrow] = cv::Point2f(0.60f, brow_y);
    face.points[layout.reference_point] = cv::Point2f(0.50f, 0.45f);
    face.points[layout.nose_tip] = cv::Point2f(nose_x, 0.55f);
    face.points[layout.chin] = cv::Point2f(0.50f, 0.85f);
    return face;
}

} // namespace

TEST(FeatureExtractorTest, EmptyLandmarksMeanNoFace) {
    FeatureExtractor extractor;
    core::Timestamp ts = core::Timestamp() + std::chrono::seconds(3);
    gesture::FeatureFrame frame = extractor.extract(FaceLandmarks(), ts);
    EXPECT_FALSE(frame.face_detected);
    EXPECT_EQ(frame.timestamp, ts);
}

TEST(FeatureExtractorTest, AspectRatios) {
    FeatureExtractor extractor;
    gesture::FeatureFrame frame = extractor.extract(make_face(0.03f, 0.05f), core::Timestamp());

    ASSERT_TRUE(frame.face_detected);
    EXPECT_NEAR(frame.left_eye_ar, 0.3f, 1e-5f);
    EXPECT_NEAR(frame.right_eye_ar, 0.3f, 1e-5f);
    EXPECT_NEAR(frame.mouth_ar, 0.5f, 1e-5f);
}

TEST(FeatureExtractorTest, EyebrowPositionGrowsWhenRaised) {
    FeatureExtractor extractor;
    const float rest = extractor.extract(make_face(0.03f, 0.01f, 0.35f), core::Timestamp()).eyebrow_position;
    const float raised = extractor.extract(make_face(0.03f, 0.01f, 0.32f), core::Timestamp()).eyebrow_position;

    EXPECT_NEAR(rest, 0.10f, 1e-5f);
    EXPECT_NEAR(raised - rest, 0.03f, 1e-5f);
}

TEST(FeatureExtractorTest, UprightHeadIsNear180) {
    FeatureExtractor extractor;
    gesture::FeatureFrame frame = extractor.extract(make_face(), core::Timestamp());
    EXPECT_NEAR(std::abs(frame.head_tilt_angle), 180.0f, 1e-3f);
    EXPECT_NEAR(gesture::HeadTiltDetector::normalize_deviation(frame.head_tilt_angle), 0.0f, 1e-3f);
}

TEST(FeatureExtractorTest, TiltDirectionFollowsNoseOffset) {
    FeatureExtractor extractor;
    const float left = gesture::HeadTiltDetector::normalize_deviation(
        extractor.extract(make_face(0.03f, 0.01f, 0.35f, 0.40f), core::Timestamp()).head_tilt_angle);
    const float right = gesture::HeadTiltDetector::normalize_deviation(
        extractor.extract(make_face(0.03f, 0.01f, 0.35f, 0.60f), core::Timestamp()).head_tilt_angle);

    // atan(0.1 / 0.3) = 18.43 degrees
    EXPECT_NEAR(left, -18.43f, 0.01f);
    EXPECT_NEAR(right, 18.43f, 0.01f);
}

TEST(FeatureExtractorTest, DegenerateWidthGivesZeroRatio) {
    EXPECT_FLOAT_EQ(FeatureExtractor::aspect_ratio(cv::Point2f(0.5f, 0.4f), cv::Point2f(0.5f, 0.5f),
                                                   cv::Point2f(0.5f, 0.45f), cv::Point2f(0.5f, 0.45f)),
                    0.0f);
}

TEST(FeatureExtractorTest, TooFewLandmarksThrows) {
    FeatureExtractor extractor(LandmarkLayout::mediapipe_face_mesh());
    try {
        extractor.extract(make_face(), core::Timestamp());
        FAIL() << "Expected core::Exception";
    } catch (const core::Exception& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_INVALID_PARAMETER);
    }
}

TEST(LandmarkLayoutTest, PresetsFitTheirPointCount) {
    const LandmarkLayout mesh = LandmarkLayout::mediapipe_face_mesh();
    const LandmarkLayout ibug = LandmarkLayout::ibug_68();
    EXPECT_LT(mesh.max_index(), static_cast<int>(mesh.point_count));
    EXPECT_LT(ibug.max_index(), static_cast<int>(ibug.point_count));
    EXPECT_EQ(mesh.right_eye.top, 159);
    EXPECT_EQ(mesh.chin, 152);
    EXPECT_EQ(ibug.nose_tip, 30);
}

TEST(LandmarkLayoutTest, FromName) {
    EXPECT_EQ(LandmarkLayout::from_name("ibug68").point_count, 68u);
    EXPECT_EQ(LandmarkLayout::from_name("mediapipe468").point_count, 468u);
    EXPECT_THROW(LandmarkLayout::from_name("dlib5"), core::ConfigException);
}

TEST(FaceLandmarksTest, FromPixelsNormalizes) {
    FaceLandmarks lm = FaceLandmarks::from_pixels({cv::Point2f(320.0f, 120.0f)}, cv::Size(640, 480));
    ASSERT_EQ(lm.size(), 1u);
    EXPECT_FLOAT_EQ(lm.points[0].x, 0.5f);
    EXPECT_FLOAT_EQ(lm.points[0].y, 0.25f);

    EXPECT_THROW(FaceLandmarks::from_pixels({}, cv::Size(0, 10)), core::Exception);
}

TEST(DetectionGrayTest, GrayInputIsNotModified) {
    cv::Mat image(16, 16, CV_8UC1);
    for (int y = 0; y < image.rows; ++y) {
        image.row(y).setTo(cv::Scalar(100 + y));
    }
    const cv::Mat original = image.clone();

    cv::Mat gray = to_detection_gray(image);
    EXPECT_EQ(cv::countNonZero(image != original), 0);
    EXPECT_NE(gray.data, image.data);

    // Equalization stretches the narrow 100..115 range
    double lo = 0.0;
    double hi = 0.0;
    cv::minMaxLoc(gray, &lo, &hi);
    EXPECT_GT(hi - lo, 15.0);
}

TEST(DetectionGrayTest, ColorInputGivesSingleChannel) {
    cv::Mat bgr(8, 8, CV_8UC3, cv::Scalar(10, 120, 200));
    cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(10, 120, 200, 255));
    EXPECT_EQ(to_detection_gray(bgr).type(), CV_8UC1);
    EXPECT_EQ(to_detection_gray(bgra).type(), CV_8UC1);
    EXPECT_EQ(to_detection_gray(bgr).size(), bgr.size());
}
