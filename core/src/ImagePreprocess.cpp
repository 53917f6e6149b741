#include "affectscope/ImagePreprocess.h"

#include "affectscope/CoreContract.h"

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace affectscope {

cv::Mat to_intensity(const cv::Mat& image) {
    if (image.empty()) return {};

    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw std::invalid_argument("Unsupported channel count: " + std::to_string(image.channels()));
    }

    if (gray.depth() != CV_8U) {
        cv::Mat converted;
        double minVal = 0.0;
        double maxVal = 0.0;
        cv::minMaxLoc(gray, &minVal, &maxVal);
        // Float crops in [0,1] are rescaled; anything else is saturated.
        const double scale = (maxVal <= 1.0) ? 255.0 : 1.0;
        gray.convertTo(converted, CV_8U, scale);
        return converted;
    }
    return gray;
}

cv::Mat preprocess_face(const cv::Mat& image, const InputShape& shape) {
    if (image.empty()) {
        throw std::invalid_argument("Cannot preprocess an empty face crop");
    }
    if (shape.height <= 0 || shape.width <= 0 || (shape.channels != 1 && shape.channels != 3)) {
        throw std::invalid_argument("Unsupported model input shape");
    }

    cv::Mat gray = to_intensity(image);

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(shape.width, shape.height), 0.0, 0.0, cv::INTER_AREA);

    auto clahe = cv::createCLAHE(contract::CLAHE_CLIP_LIMIT,
                                 cv::Size(contract::CLAHE_TILE_GRID, contract::CLAHE_TILE_GRID));
    cv::Mat equalized;
    clahe->apply(resized, equalized);

    cv::Mat scaled;
    equalized.convertTo(scaled, CV_32F, 1.0 / 255.0);

    cv::Mat multi = scaled;
    if (shape.channels == 3) {
        cv::merge(std::vector<cv::Mat>{scaled, scaled, scaled}, multi);
    }

    switch (shape.rank) {
        case 2:
            if (shape.channels != 1) {
                throw std::invalid_argument("Rank-2 input requires a single channel");
            }
            return scaled;
        case 3:
            return multi.reshape(1, std::vector<int>{shape.height, shape.width, shape.channels}).clone();
        case 4:
            return cv::dnn::blobFromImage(multi, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
        default:
            throw std::invalid_argument("Unsupported tensor rank: " + std::to_string(shape.rank));
    }
}

EmotionDistribution peaked_distribution(Emotion label, double confidence) {
    EmotionDistribution dist{};
    const double rest = (1.0 - confidence) / static_cast<double>(kEmotionCount - 1);
    dist.fill(rest);
    dist[emotion_index(label)] = confidence;
    return dist;
}

HeuristicPrediction fallback_predict(const cv::Mat& image) {
    HeuristicPrediction out;
    out.label = Emotion::Neutral;
    out.confidence = contract::FALLBACK_DEFAULT_CONFIDENCE;

    const cv::Mat gray = image.empty() ? cv::Mat() : to_intensity(image);
    if (!gray.empty()) {
        cv::Scalar meanVal;
        cv::Scalar stdVal;
        cv::meanStdDev(gray, meanVal, stdVal);
        const double intensityMean = meanVal[0];
        const double intensityStd = stdVal[0];

        if (intensityMean < contract::FALLBACK_DARK_MEAN) {
            out.label = Emotion::Sad;
            out.confidence = contract::FALLBACK_DARK_CONFIDENCE;
        } else if (intensityStd < contract::FALLBACK_FLAT_STDDEV) {
            out.label = Emotion::Neutral;
            out.confidence = contract::FALLBACK_FLAT_CONFIDENCE;
        } else if (intensityMean > contract::FALLBACK_BRIGHT_MEAN) {
            out.label = Emotion::Happy;
            out.confidence = contract::FALLBACK_BRIGHT_CONFIDENCE;
        } else {
            cv::Mat gx;
            cv::Mat gy;
            cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
            cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
            cv::Mat magnitude;
            cv::magnitude(gx, gy, magnitude);
            if (cv::mean(magnitude)[0] > contract::FALLBACK_EDGE_MAGNITUDE) {
                out.label = Emotion::Surprise;
                out.confidence = contract::FALLBACK_EDGE_CONFIDENCE;
            }
        }
    }

    out.confidence = std::min(out.confidence, contract::FALLBACK_MAX_CONFIDENCE);
    out.distribution = peaked_distribution(out.label, out.confidence);
    return out;
}

}  // namespace affectscope
