#include "affectscope/Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace affectscope {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    const std::size_t n = v.size();
    std::nth_element(v.begin(), v.begin() + n/2, v.end());
    double med = v[n/2];
    if (n % 2 == 0) {
        auto it = std::max_element(v.begin(), v.begin() + n/2);
        med = 0.5 * (med + *it);
    }
    return med;
}

double stddev(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

ConfidenceSummary summarize(const std::vector<double>& values) {
    ConfidenceSummary s;
    if (values.empty()) return s;
    s.count = static_cast<int>(values.size());
    s.mean = mean(values);
    s.median = median(values);
    s.stddev = stddev(values);
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    s.min = *lo;
    s.max = *hi;
    return s;
}

FilterOutcome filter_by_confidence(const std::vector<FrameResult>& frames, double threshold) {
    FilterOutcome out;
    out.frames.reserve(frames.size());
    for (const auto& frame : frames) {
        FrameResult kept;
        kept.frameId = frame.frameId;
        kept.timestampSeconds = frame.timestampSeconds;
        for (const auto& face : frame.faces) {
            if (face.confidence >= threshold) {
                kept.faces.push_back(face);
            } else {
                out.droppedDetections++;
            }
        }
        if (!kept.faces.empty()) {
            out.frames.push_back(std::move(kept));
        }
    }
    return out;
}

EmotionStatistics compute_statistics(const std::vector<FrameResult>& filteredFrames,
                                     int framesAnalyzed,
                                     int droppedDetections) {
    EmotionStatistics stats;
    stats.framesAnalyzed = framesAnalyzed;
    stats.droppedDetections = droppedDetections;

    std::array<std::vector<double>, kEmotionCount> confidences;
    for (const auto& frame : filteredFrames) {
        if (!frame.faces.empty()) stats.framesWithFaces++;
        for (const auto& face : frame.faces) {
            const std::size_t idx = emotion_index(face.label);
            stats.counts[idx]++;
            stats.totalDetections++;
            confidences[idx].push_back(face.confidence);
        }
    }

    for (std::size_t i = 0; i < kEmotionCount; ++i) {
        stats.confidence[i] = summarize(confidences[i]);
    }

    if (stats.totalDetections > 0) {
        // First maximum in label order wins ties.
        std::size_t best = 0;
        for (std::size_t i = 1; i < kEmotionCount; ++i) {
            if (stats.counts[i] > stats.counts[best]) best = i;
        }
        stats.predominant = kAllEmotions[best];
        stats.predominantShare = static_cast<double>(stats.counts[best]) / static_cast<double>(stats.totalDetections);
    }
    return stats;
}

double emotion_share(const EmotionStatistics& stats, Emotion emotion) {
    if (stats.totalDetections <= 0) return 0.0;
    return static_cast<double>(stats.counts[emotion_index(emotion)]) / static_cast<double>(stats.totalDetections);
}

double negative_share(const EmotionStatistics& stats) {
    if (stats.totalDetections <= 0) return 0.0;
    int negative = 0;
    for (Emotion e : kAllEmotions) {
        if (is_negative(e)) negative += stats.counts[emotion_index(e)];
    }
    return static_cast<double>(negative) / static_cast<double>(stats.totalDetections);
}

}  // namespace affectscope
