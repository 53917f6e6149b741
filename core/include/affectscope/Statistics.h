#pragma once

#include "affectscope/EmotionTypes.h"

#include <vector>

namespace affectscope {

// ---------- descriptive statistics ----------
double mean(const std::vector<double>& v);
double median(std::vector<double> v);                 // copy by value
double stddev(const std::vector<double>& v);          // population (ddof = 0)

ConfidenceSummary summarize(const std::vector<double>& values);

// ---------- confidence filtering ----------
struct FilterOutcome {
    std::vector<FrameResult> frames;   // frames with >= 1 surviving detection
    int droppedDetections{0};
};

// Drops detections with confidence < threshold. Idempotent for a fixed threshold.
FilterOutcome filter_by_confidence(const std::vector<FrameResult>& frames, double threshold);

// ---------- per-session aggregation ----------
EmotionStatistics compute_statistics(const std::vector<FrameResult>& filteredFrames,
                                     int framesAnalyzed,
                                     int droppedDetections);

// Share of `emotion` among all filtered detections, 0 when there are none.
double emotion_share(const EmotionStatistics& stats, Emotion emotion);
double negative_share(const EmotionStatistics& stats);

}  // namespace affectscope
