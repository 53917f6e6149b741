#pragma once

#include "affectscope/models/EmotionClassifier.h"

#include <opencv2/dnn.hpp>

#include <mutex>
#include <string>

namespace affectscope {
namespace models {

/**
 * DnnEmotionClassifier: ONNX emotion model run through OpenCV DNN.
 *
 * cv::dnn::Net is not re-entrant, so forward passes are serialized.
 */
class DnnEmotionClassifier : public EmotionClassifier {
  public:
    explicit DnnEmotionClassifier(const std::string& onnxPath);

    std::vector<float> infer(const cv::Mat& tensor) override;

  private:
    std::mutex netMutex_;
    cv::dnn::Net net_;
};

class DnnClassifierLoader : public ClassifierLoader {
  public:
    std::shared_ptr<EmotionClassifier> load(const ModelDescriptor& descriptor) override;
};

}  // namespace models
}  // namespace affectscope
