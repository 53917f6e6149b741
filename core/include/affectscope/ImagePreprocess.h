#pragma once

#include "affectscope/EmotionTypes.h"

#include <opencv2/core.hpp>

namespace affectscope {

/**
 * Single-channel 8-bit intensity view of a BGR, BGRA or grayscale image.
 * Returns an empty Mat for an empty input.
 */
cv::Mat to_intensity(const cv::Mat& image);

/**
 * Build the input tensor one model expects:
 *   gray -> INTER_AREA resize to (width, height) -> CLAHE -> [0,1] float
 *   -> channel replication when channels == 3 -> reshape to rank.
 *
 * rank 2 yields an HxW CV_32F Mat, rank 3 an HxWxC Mat, rank 4 an NCHW blob.
 * Throws std::invalid_argument for an empty image or an unsupported shape.
 */
cv::Mat preprocess_face(const cv::Mat& image, const InputShape& shape);

struct HeuristicPrediction {
    Emotion label{Emotion::Neutral};
    double confidence{0.0};
    EmotionDistribution distribution{};
};

/**
 * Deterministic image-statistics classifier used when the ensemble has no
 * usable model output. Confidence never exceeds contract::FALLBACK_MAX_CONFIDENCE.
 */
HeuristicPrediction fallback_predict(const cv::Mat& image);

/// Put `confidence` on `label`, spread the rest evenly over the other labels.
EmotionDistribution peaked_distribution(Emotion label, double confidence);

}  // namespace affectscope
