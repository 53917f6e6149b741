#include "affectscope/models/DnnEmotionClassifier.h"

#include <glog/logging.h>

#include <filesystem>
#include <stdexcept>

namespace affectscope {
namespace models {

DnnEmotionClassifier::DnnEmotionClassifier(const std::string& onnxPath) {
    if (!std::filesystem::exists(onnxPath)) {
        throw std::runtime_error("Model file not found: " + onnxPath);
    }
    net_ = cv::dnn::readNetFromONNX(onnxPath);
    if (net_.empty()) {
        throw std::runtime_error("Emotion model initialization failed: " + onnxPath);
    }
}

std::vector<float> DnnEmotionClassifier::infer(const cv::Mat& tensor) {
    cv::Mat output;
    {
        std::scoped_lock lock(netMutex_);
        net_.setInput(tensor);
        output = net_.forward();
    }
    if (output.empty()) {
        return {};
    }

    const cv::Mat flattened = output.reshape(1, 1);
    cv::Mat asFloat;
    flattened.convertTo(asFloat, CV_32F);
    std::vector<float> scores(static_cast<std::size_t>(asFloat.cols));
    for (int i = 0; i < asFloat.cols; ++i) {
        scores[static_cast<std::size_t>(i)] = asFloat.at<float>(0, i);
    }
    return scores;
}

std::shared_ptr<EmotionClassifier> DnnClassifierLoader::load(const ModelDescriptor& descriptor) {
    auto classifier = std::make_shared<DnnEmotionClassifier>(descriptor.artifactPath);
    LOG(INFO) << "Loaded emotion model '" << descriptor.name << "' from " << descriptor.artifactPath;
    return classifier;
}

}  // namespace models
}  // namespace affectscope
