#include "affectscope/EnsembleScorer.h"

#include "affectscope/ImagePreprocess.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <iterator>
#include <limits>
#include <thread>
#include <unordered_map>

namespace affectscope {

namespace {

bool looks_like_probabilities(const std::vector<float>& values) {
    double sum = 0.0;
    for (const float value : values) {
        if (value < -0.001f || value > 1.001f) return false;
        sum += value;
    }
    return sum > 0.85 && sum < 1.15;
}

void validate_descriptor(const ModelDescriptor& d) {
    if (d.name.empty()) {
        throw EnsembleConfigError("Model descriptor without a name (artifact " + d.artifactPath + ")");
    }
    if (!(d.weight > 0.0 && d.weight <= 1.0)) {
        throw EnsembleConfigError(absl::StrCat("Model '", d.name, "': weight ", d.weight, " outside (0,1]"));
    }
    const InputShape& s = d.inputShape;
    if (s.height <= 0 || s.width <= 0 || s.channels <= 0) {
        throw EnsembleConfigError(absl::StrCat("Model '", d.name, "': non-positive input shape ",
                                               s.height, "x", s.width, "x", s.channels));
    }
    if (s.channels != 1 && s.channels != 3) {
        throw EnsembleConfigError(absl::StrCat("Model '", d.name, "': unsupported channel count ", s.channels));
    }
    if (s.rank < 2 || s.rank > 4 || (s.rank == 2 && s.channels != 1)) {
        throw EnsembleConfigError(absl::StrCat("Model '", d.name, "': unsupported tensor rank ", s.rank));
    }
}

}  // namespace

absl::StatusOr<EmotionDistribution> normalize_model_output(const std::vector<float>& raw) {
    if (raw.size() != kEmotionCount) {
        return absl::InvalidArgumentError(
            absl::StrCat("expected ", kEmotionCount, " scores, got ", raw.size()));
    }
    bool anyNonZero = false;
    for (const float v : raw) {
        if (!std::isfinite(v)) return absl::InvalidArgumentError("non-finite score");
        if (v != 0.0f) anyNonZero = true;
    }
    if (!anyNonZero) return absl::InvalidArgumentError("all-zero output");

    EmotionDistribution probs{};
    double sum = 0.0;
    if (looks_like_probabilities(raw)) {
        for (std::size_t i = 0; i < kEmotionCount; ++i) {
            probs[i] = std::clamp(static_cast<double>(raw[i]), 0.0, 1.0);
            sum += probs[i];
        }
        if (sum > std::numeric_limits<double>::epsilon()) {
            for (double& p : probs) p /= sum;
            return probs;
        }
    }

    const double maxLogit = *std::max_element(raw.begin(), raw.end());
    sum = 0.0;
    for (std::size_t i = 0; i < kEmotionCount; ++i) {
        probs[i] = std::exp(static_cast<double>(raw[i]) - maxLogit);
        sum += probs[i];
    }
    for (double& p : probs) p /= sum;
    return probs;
}

EnsembleScorer::EnsembleScorer(LoadKey, EnsembleOptions options) : options_(options) {}

std::unique_ptr<EnsembleScorer> EnsembleScorer::load(const EnsembleConfig& config,
                                                     models::ClassifierLoader& loader,
                                                     EnsembleOptions options) {
    if (options.smoothingEpsilon < 0.0 || options.smoothingEpsilon >= 1.0) {
        throw EnsembleConfigError(absl::StrCat("Smoothing epsilon ", options.smoothingEpsilon, " outside [0,1)"));
    }

    // Validate the whole config before touching any artifact.
    std::vector<const ModelDescriptor*> accepted;
    std::unordered_map<std::string, InputShape> seen;
    for (const auto& d : config.models) {
        validate_descriptor(d);
        auto it = seen.find(d.name);
        if (it != seen.end()) {
            if (it->second != d.inputShape) {
                throw EnsembleConfigError("Model '" + d.name + "' declared twice with conflicting input shapes");
            }
            LOG(WARNING) << "Ignoring duplicate model entry '" << d.name << "'";
            continue;
        }
        seen.emplace(d.name, d.inputShape);
        accepted.push_back(&d);
    }

    auto scorer = std::make_unique<EnsembleScorer>(LoadKey{}, options);
    double totalWeight = 0.0;
    for (const ModelDescriptor* d : accepted) {
        std::shared_ptr<models::EmotionClassifier> classifier;
        try {
            classifier = loader.load(*d);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Discarding model '" << d->name << "': " << e.what();
            continue;
        }
        if (!classifier) {
            LOG(WARNING) << "Discarding model '" << d->name << "': loader returned no classifier";
            continue;
        }
        auto member = std::make_unique<Member>();
        member->descriptor = *d;
        member->weight = d->weight;
        member->classifier = std::move(classifier);
        totalWeight += d->weight;
        scorer->members_.push_back(std::move(member));
    }

    for (auto& m : scorer->members_) {
        m->weight /= totalWeight;
    }

    if (scorer->members_.empty()) {
        LOG(WARNING) << "Emotion ensemble is empty; every prediction will use the fallback heuristic";
    } else {
        LOG(INFO) << "Emotion ensemble ready with " << scorer->members_.size() << " of "
                  << config.models.size() << " configured model(s)";
    }
    return scorer;
}

absl::StatusOr<EmotionDistribution> EnsembleScorer::run_member(const Member& member, const cv::Mat& face) const {
    cv::Mat tensor;
    try {
        tensor = preprocess_face(face, member.descriptor.inputShape);
    } catch (const std::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("preprocessing failed: ", e.what()));
    }

    std::vector<float> raw;
    if (options_.modelTimeout.count() <= 0) {
        try {
            raw = member.classifier->infer(tensor);
        } catch (const std::exception& e) {
            return absl::InternalError(absl::StrCat("inference threw: ", e.what()));
        }
    } else {
        if (member.abandonedCalls->load() > 0) {
            return absl::DeadlineExceededError("previous inference still running");
        }

        // The worker owns copies of everything it touches so an abandoned run
        // can finish after this call returns. state: 0 running, 1 done, 2 abandoned.
        auto promise = std::make_shared<std::promise<std::vector<float>>>();
        auto state = std::make_shared<std::atomic<int>>(0);
        std::future<std::vector<float>> future = promise->get_future();
        std::thread([classifier = member.classifier, input = tensor.clone(), promise, state,
                     abandoned = member.abandonedCalls]() {
            try {
                promise->set_value(classifier->infer(input));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            if (state->exchange(1) == 2) {
                abandoned->fetch_sub(1);
            }
        }).detach();

        if (future.wait_for(options_.modelTimeout) != std::future_status::ready) {
            member.abandonedCalls->fetch_add(1);
            int running = 0;
            if (!state->compare_exchange_strong(running, 2)) {
                // Finished between the wait and here.
                member.abandonedCalls->fetch_sub(1);
            }
            return absl::DeadlineExceededError(
                absl::StrCat("inference exceeded ", options_.modelTimeout.count(), " ms"));
        }
        try {
            raw = future.get();
        } catch (const std::exception& e) {
            return absl::InternalError(absl::StrCat("inference threw: ", e.what()));
        }
    }

    return normalize_model_output(raw);
}

EnsemblePrediction EnsembleScorer::score(const cv::Mat& face) const {
    EnsemblePrediction out;

    EmotionDistribution fused{};
    double usedWeight = 0.0;
    if (!face.empty()) {
        for (const auto& member : members_) {
            absl::StatusOr<EmotionDistribution> probs = run_member(*member, face);
            if (!probs.ok()) {
                member->failures.fetch_add(1, std::memory_order_relaxed);
                VLOG(1) << "Model '" << member->descriptor.name << "' excluded: " << probs.status().message();
                continue;
            }
            for (std::size_t i = 0; i < kEmotionCount; ++i) {
                fused[i] += member->weight * (*probs)[i];
            }
            usedWeight += member->weight;
            ++out.modelsUsed;
        }
    }

    if (out.modelsUsed == 0) {
        const HeuristicPrediction fallback = fallback_predict(face);
        out.label = fallback.label;
        out.confidence = fallback.confidence;
        out.distribution = fallback.distribution;
        out.fromFallback = true;
        return out;
    }

    const double eps = options_.smoothingEpsilon;
    const double uniform = 1.0 / static_cast<double>(kEmotionCount);
    double sum = 0.0;
    for (std::size_t i = 0; i < kEmotionCount; ++i) {
        fused[i] = (1.0 - eps) * (fused[i] / usedWeight) + eps * uniform;
        sum += fused[i];
    }
    for (double& p : fused) p /= sum;

    const auto top = std::max_element(fused.begin(), fused.end());
    out.label = static_cast<Emotion>(std::distance(fused.begin(), top));
    out.confidence = *top;
    out.distribution = fused;
    return out;
}

std::pair<Emotion, double> EnsembleScorer::predict(const cv::Mat& face) const {
    const EnsemblePrediction p = score(face);
    return {p.label, p.confidence};
}

EmotionDistribution EnsembleScorer::distribution(const cv::Mat& face) const {
    return score(face).distribution;
}

std::vector<std::string> EnsembleScorer::model_names() const {
    std::vector<std::string> names;
    names.reserve(members_.size());
    for (const auto& m : members_) names.push_back(m->descriptor.name);
    return names;
}

double EnsembleScorer::weight_of(const std::string& name) const {
    for (const auto& m : members_) {
        if (m->descriptor.name == name) return m->weight;
    }
    return 0.0;
}

int EnsembleScorer::failure_count(const std::string& name) const {
    for (const auto& m : members_) {
        if (m->descriptor.name == name) return m->failures.load(std::memory_order_relaxed);
    }
    return 0;
}

}  // namespace affectscope
