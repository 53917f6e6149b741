#pragma once

#include "affectscope/EmotionTypes.h"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace affectscope {
namespace models {

/**
 * EmotionClassifier: one emotion model behind a uniform contract.
 *
 * infer() receives a tensor already preprocessed for this model's InputShape
 * (CV_32F, values in [0,1]) and returns the raw output layer: kEmotionCount
 * scores in Emotion order, either probabilities or logits. Implementations may
 * throw; the ensemble treats a throw as a per-model failure.
 *
 * Implementations must tolerate concurrent infer() calls.
 */
class EmotionClassifier {
  public:
    virtual ~EmotionClassifier() = default;

    virtual std::vector<float> infer(const cv::Mat& tensor) = 0;
};

/**
 * ClassifierLoader: turns a descriptor into a live classifier.
 * Returns nullptr (or throws) when the artifact cannot be loaded.
 */
class ClassifierLoader {
  public:
    virtual ~ClassifierLoader() = default;

    virtual std::shared_ptr<EmotionClassifier> load(const ModelDescriptor& descriptor) = 0;
};

}  // namespace models
}  // namespace affectscope
