#include "affectscope/io/FaceDetector.h"

#include <glog/logging.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace affectscope {
namespace io {

bool accept_face_size(const BoundingBox& box, int frameWidth, int frameHeight, const FaceDetectorOptions& options) {
    const double side = static_cast<double>(std::min(frameWidth, frameHeight));
    const double minSide = std::max(static_cast<double>(options.minFacePixels), options.minFaceFraction * side);
    const double maxSide = options.maxFaceFraction * side;
    const int faceSide = std::min(box.width, box.height);
    const int faceLong = std::max(box.width, box.height);
    return faceSide >= minSide && faceLong <= maxSide;
}

YuNetFaceDetector::YuNetFaceDetector(const std::string& modelPath, FaceDetectorOptions options)
    : options_(options) {
    if (!std::filesystem::exists(modelPath)) {
        throw std::runtime_error("Face detector model not found: " + modelPath);
    }
    detector_ = cv::FaceDetectorYN::create(modelPath, "", cv::Size(320, 320), options_.scoreThreshold,
                                           options_.nmsThreshold, options_.topK);
    if (detector_.empty()) {
        throw std::runtime_error("Face detector initialization failed: " + modelPath);
    }
    LOG(INFO) << "Face detector loaded from " << modelPath;
}

std::vector<DetectedFace> YuNetFaceDetector::detect(const cv::Mat& frame) {
    std::vector<DetectedFace> faces;
    if (frame.empty()) return faces;

    cv::Mat bgr = frame;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    }

    cv::Mat faceMatrix;
    {
        std::scoped_lock lock(detectorMutex_);
        detector_->setInputSize(bgr.size());
        detector_->detect(bgr, faceMatrix);
    }
    if (faceMatrix.empty()) return faces;

    const cv::Rect frameRect(0, 0, bgr.cols, bgr.rows);
    for (int row = 0; row < faceMatrix.rows; ++row) {
        if (faceMatrix.cols < 15) continue;

        const float score = faceMatrix.at<float>(row, 14);
        if (score <= 0.0f) continue;

        cv::Rect rect(static_cast<int>(std::round(faceMatrix.at<float>(row, 0))),
                      static_cast<int>(std::round(faceMatrix.at<float>(row, 1))),
                      static_cast<int>(std::round(faceMatrix.at<float>(row, 2))),
                      static_cast<int>(std::round(faceMatrix.at<float>(row, 3))));
        rect &= frameRect;
        if (rect.empty()) continue;

        DetectedFace face;
        face.box = BoundingBox{rect.x, rect.y, rect.width, rect.height};
        face.score = std::clamp(static_cast<double>(score), 0.0, 1.0);
        if (!accept_face_size(face.box, bgr.cols, bgr.rows, options_)) {
            VLOG(1) << "Rejected face " << rect.width << "x" << rect.height << " by size policy";
            continue;
        }
        faces.push_back(face);
    }
    return faces;
}

}  // namespace io
}  // namespace affectscope
