/**
 * @file LandmarkProvider.hpp
 * @brief Landmark extraction backends ("image -> landmarks or no face")
 *
 * @copyright 2025 FaceCue Project
 * @license MIT License
 */

#ifndef FACECUE_FACE_LANDMARK_PROVIDER_HPP
#define FACECUE_FACE_LANDMARK_PROVIDER_HPP

#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <facecue/face/FaceLandmarks.hpp>

namespace facecue {
namespace core {
class Configuration;
}

namespace face {

/**
 * @brief Abstract landmark extraction backend
 *
 * Implementations are used by one session at a time and need not be
 * thread-safe.
 */
class ILandmarkProvider {
public:
    virtual ~ILandmarkProvider() = default;

    /**
     * @brief Detect the primary face and its landmarks
     *
     * @param image BGR image (CV_8UC3)
     * @param landmarks Output landmarks, normalized to the image
     * @return True if a face was found, false otherwise (landmarks cleared)
     */
    virtual bool detect(const cv::Mat& image, FaceLandmarks& landmarks) = 0;

    /**
     * @brief Index layout of the produced landmarks
     */
    virtual const LandmarkLayout& layout() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Facemark provider settings
 */
struct FacemarkProviderConfig {
    std::string cascade_path = "haarcascade_frontalface_alt2.xml";
    std::string model_path = "lbfmodel.yaml";
    double scale_factor = 1.1;
    int min_neighbors = 3;
    int min_face_size = 80;         ///< Pixels

    static FacemarkProviderConfig from_configuration(const core::Configuration& config);
};

/**
 * @brief Histogram-equalized grayscale copy of a 1, 3 or 4 channel BGR image
 *
 * The result never shares memory with the input.
 */
cv::Mat to_detection_gray(const cv::Mat& image);

/**
 * @brief OpenCV Haar cascade + cv::face::FacemarkLBF (iBUG 68 points)
 *
 * The largest detected face is used.
 */
class FacemarkLandmarkProvider : public ILandmarkProvider {
public:
    /**
     * @brief Load the cascade and the LBF model
     * @throws core::FileException if either file cannot be loaded
     */
    explicit FacemarkLandmarkProvider(const FacemarkProviderConfig& config = FacemarkProviderConfig());
    ~FacemarkLandmarkProvider() override;

    FacemarkLandmarkProvider(const FacemarkLandmarkProvider&) = delete;
    FacemarkLandmarkProvider& operator=(const FacemarkLandmarkProvider&) = delete;

    bool detect(const cv::Mat& image, FaceLandmarks& landmarks) override;
    const LandmarkLayout& layout() const override;
    std::string name() const override { return "facemark_lbf"; }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace face
} // namespace facecue

#endif // FACECUE_FACE_LANDMARK_PROVIDER_HPP
