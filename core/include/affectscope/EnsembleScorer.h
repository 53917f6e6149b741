#pragma once

#include "affectscope/CoreContract.h"
#include "affectscope/EmotionTypes.h"
#include "affectscope/models/EmotionClassifier.h"

#include <absl/status/statusor.h>
#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace affectscope {

/// Malformed ensemble configuration, raised by EnsembleScorer::load.
class EnsembleConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct EnsembleOptions {
    double smoothingEpsilon{contract::SMOOTHING_EPSILON};
    // Per-model inference budget; zero runs inference inline without a limit.
    std::chrono::milliseconds modelTimeout{0};
};

struct EnsemblePrediction {
    Emotion label{Emotion::Neutral};
    double confidence{0.0};
    EmotionDistribution distribution{};
    bool fromFallback{false};
    int modelsUsed{0};
};

/**
 * EnsembleScorer - weighted fusion of independent emotion classifiers
 *
 * Load:
 *   - validates every descriptor (weight in (0,1], positive shape, rank 2..4)
 *   - duplicate names: identical shape is ignored, conflicting shape throws
 *   - models that fail to load are discarded; surviving weights renormalize
 *
 * Inference, per face crop:
 *   - each model sees its own preprocessed tensor
 *   - a model that throws, times out or returns malformed output is left out
 *     of this prediction only and its failure counter increments
 *   - while a timed-out call of a model is still running, that model fails
 *     fast instead of starting another worker thread
 *   - outputs that are not probabilities go through a softmax
 *   - weighted average, epsilon smoothing toward uniform, renormalize
 *   - no usable output: image-statistics fallback (confidence <= 0.4)
 *
 * Immutable after load; safe to share across sessions and threads.
 */
class EnsembleScorer {
    // Only load() can name this, so only load() can construct.
    struct LoadKey {
        explicit LoadKey() = default;
    };

  public:
    EnsembleScorer(LoadKey, EnsembleOptions options);

    static std::unique_ptr<EnsembleScorer> load(const EnsembleConfig& config,
                                                models::ClassifierLoader& loader,
                                                EnsembleOptions options = {});

    std::pair<Emotion, double> predict(const cv::Mat& face) const;
    EmotionDistribution distribution(const cv::Mat& face) const;
    EnsemblePrediction score(const cv::Mat& face) const;

    std::size_t model_count() const { return members_.size(); }
    std::vector<std::string> model_names() const;
    // Normalized weight; 0 for a model that is not part of the ensemble.
    double weight_of(const std::string& name) const;
    int failure_count(const std::string& name) const;

    const EnsembleOptions& options() const { return options_; }

  private:
    struct Member {
        ModelDescriptor descriptor;
        double weight{0.0};
        std::shared_ptr<models::EmotionClassifier> classifier;
        mutable std::atomic<int> failures{0};
        // Timed-out calls whose worker thread is still running. Shared with
        // those threads, which may outlive the scorer.
        std::shared_ptr<std::atomic<int>> abandonedCalls{std::make_shared<std::atomic<int>>(0)};
    };

    absl::StatusOr<EmotionDistribution> run_member(const Member& member, const cv::Mat& face) const;

    EnsembleOptions options_;
    std::vector<std::unique_ptr<Member>> members_;
};

/**
 * Validate a raw output vector and turn it into a probability distribution.
 * Probability-like output is clamped and renormalized, anything else goes
 * through a softmax. Returns InvalidArgument for wrong length, non-finite
 * values or an all-zero vector.
 */
absl::StatusOr<EmotionDistribution> normalize_model_output(const std::vector<float>& raw);

}  // namespace affectscope
