#pragma once

#include "affectscope/EmotionTypes.h"

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace affectscope {
namespace io {

struct DetectedFace {
    BoundingBox box;    // clamped to the frame
    double score{0.0};  // [0,1]
};

/**
 * FaceDetector: locates faces in one BGR frame.
 * Results are in detection order; implementations must tolerate concurrent calls.
 */
class FaceDetector {
  public:
    virtual ~FaceDetector() = default;

    virtual std::vector<DetectedFace> detect(const cv::Mat& frame) = 0;
};

struct FaceDetectorOptions {
    float scoreThreshold{0.7f};
    float nmsThreshold{0.3f};
    int topK{5000};
    // Size policy relative to the shorter frame side.
    double minFaceFraction{0.05};
    double maxFaceFraction{0.95};
    int minFacePixels{24};
};

/**
 * YuNetFaceDetector: OpenCV FaceDetectorYN over an ONNX YuNet model.
 *
 * Boxes outside [max(minFacePixels, minFaceFraction * side), maxFaceFraction * side]
 * on either dimension are discarded.
 */
class YuNetFaceDetector : public FaceDetector {
  public:
    explicit YuNetFaceDetector(const std::string& modelPath, FaceDetectorOptions options = {});

    std::vector<DetectedFace> detect(const cv::Mat& frame) override;

  private:
    FaceDetectorOptions options_;
    std::mutex detectorMutex_;
    cv::Ptr<cv::FaceDetectorYN> detector_;
};

// Size policy used by YuNetFaceDetector, exposed for reuse by other detectors.
bool accept_face_size(const BoundingBox& box, int frameWidth, int frameHeight, const FaceDetectorOptions& options);

}  // namespace io
}  // namespace affectscope
