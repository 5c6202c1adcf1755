/**
 * @file FacemarkLandmarkProvider.cpp
 * @brief Haar cascade face detection + LBF landmark fitting
 */

#include "facecue/face/LandmarkProvider.hpp"
#include "facecue/core/Configuration.hpp"
#include "facecue/core/exception.h"
#include "facecue/core/Logger.hpp"

#include <opencv2/face.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <algorithm>
#include <fstream>

namespace facecue {
namespace face {

FacemarkProviderConfig FacemarkProviderConfig::from_configuration(const core::Configuration& config) {
    FacemarkProviderConfig result;
    result.cascade_path = config.getString("landmarks.cascade_path", result.cascade_path);
    result.model_path = config.getString("landmarks.model_path", result.model_path);
    result.scale_factor = config.getDouble("landmarks.scale_factor", result.scale_factor);
    result.min_neighbors = config.getInt("landmarks.min_neighbors", result.min_neighbors);
    result.min_face_size = config.getInt("landmarks.min_face_size", result.min_face_size);
    return result;
}

class FacemarkLandmarkProvider::Impl {
public:
    FacemarkProviderConfig config;
    LandmarkLayout layout = LandmarkLayout::ibug_68();
    cv::CascadeClassifier face_detector;
    cv::Ptr<cv::face::Facemark> facemark;

    explicit Impl(const FacemarkProviderConfig& cfg)
        : config(cfg) {
        if (!std::ifstream(config.cascade_path).good()) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                               "Face cascade not found: " + config.cascade_path);
        }
        if (!face_detector.load(config.cascade_path)) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                               "Failed to load face cascade: " + config.cascade_path);
        }

        if (!std::ifstream(config.model_path).good()) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                               "Facemark model not found: " + config.model_path);
        }
        facemark = cv::face::FacemarkLBF::create();
        try {
            facemark->loadModel(config.model_path);
        } catch (const cv::Exception& e) {
            FACECUE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                               "Failed to load facemark model " + config.model_path + ": " + e.what());
        }

        FACECUE_LOG_INFO("FacemarkLandmarkProvider") << "Loaded cascade " << config.cascade_path
                                                     << " and model " << config.model_path;
    }

    bool detect(const cv::Mat& image, FaceLandmarks& landmarks) {
        landmarks = FaceLandmarks();
        if (image.empty()) {
            return false;
        }

        const cv::Mat gray = to_detection_gray(image);

        std::vector<cv::Rect> faces;
        face_detector.detectMultiScale(gray, faces, config.scale_factor, config.min_neighbors, 0,
                                       cv::Size(config.min_face_size, config.min_face_size));
        if (faces.empty()) {
            return false;
        }

        // Largest face only
        const cv::Rect primary = *std::max_element(faces.begin(), faces.end(),
            [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });

        std::vector<cv::Rect> fit_faces{primary};
        std::vector<std::vector<cv::Point2f>> fitted;
        if (!facemark->fit(image, fit_faces, fitted) || fitted.empty() ||
            fitted.front().size() != layout.point_count) {
            FACECUE_LOG_DEBUG("FacemarkLandmarkProvider") << "Landmark fit failed";
            return false;
        }

        landmarks = FaceLandmarks::from_pixels(fitted.front(), image.size());
        landmarks.face_box = primary;
        return true;
    }
};

cv::Mat to_detection_gray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 1) {
        image.copyTo(gray);
    } else {
        cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    }
    cv::equalizeHist(gray, gray);
    return gray;
}

FacemarkLandmarkProvider::FacemarkLandmarkProvider(const FacemarkProviderConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

FacemarkLandmarkProvider::~FacemarkLandmarkProvider() = default;

bool FacemarkLandmarkProvider::detect(const cv::Mat& image, FaceLandmarks& landmarks) {
    return pImpl->detect(image, landmarks);
}

const LandmarkLayout& FacemarkLandmarkProvider::layout() const {
    return pImpl->layout;
}

} // namespace face
} // namespace facecue
