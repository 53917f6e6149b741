#include "affectscope/Statistics.h"

#include "TestDoubles.h"

#include <gtest/gtest.h>

using namespace affectscope;
using namespace affectscope::test;

namespace {

std::vector<FrameResult> sample_frames() {
    std::vector<FrameResult> frames(3);
    frames[0].frameId = 0;
    frames[0].faces = {detection(Emotion::Happy, 0.9, 0), detection(Emotion::Sad, 0.3, 0)};
    frames[1].frameId = 30;
    frames[1].timestampSeconds = 1.0;
    frames[1].faces = {detection(Emotion::Fear, 0.2, 30)};
    frames[2].frameId = 60;
    frames[2].timestampSeconds = 2.0;
    frames[2].faces = {detection(Emotion::Happy, 0.5, 60), detection(Emotion::Angry, 0.7, 60)};
    return frames;
}

}  // namespace

TEST(DescriptiveStatistics, MeanMedianPopulationStddev) {
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
    EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 6.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_DOUBLE_EQ(stddev({1.0, 3.0}), 1.0);
    EXPECT_DOUBLE_EQ(stddev({7.0}), 0.0);

    const ConfidenceSummary s = summarize({0.5, 0.9, 0.7});
    EXPECT_EQ(s.count, 3);
    EXPECT_DOUBLE_EQ(s.min, 0.5);
    EXPECT_DOUBLE_EQ(s.max, 0.9);
    EXPECT_NEAR(s.mean, 0.7, 1e-12);
    EXPECT_DOUBLE_EQ(s.median, 0.7);
}

TEST(FilterByConfidence, DropsDetectionsBelowThresholdAndEmptyFrames) {
    const FilterOutcome out = filter_by_confidence(sample_frames(), 0.5);
    EXPECT_EQ(out.droppedDetections, 2);
    ASSERT_EQ(out.frames.size(), 2u);
    EXPECT_EQ(out.frames[0].frameId, 0);
    EXPECT_EQ(out.frames[0].faces.size(), 1u);
    EXPECT_EQ(out.frames[1].frameId, 60);
    EXPECT_EQ(out.frames[1].faces.size(), 2u);  // 0.5 is kept: threshold is inclusive
}

TEST(FilterByConfidence, IsIdempotent) {
    const FilterOutcome once = filter_by_confidence(sample_frames(), 0.5);
    const FilterOutcome twice = filter_by_confidence(once.frames, 0.5);
    EXPECT_EQ(twice.droppedDetections, 0);
    ASSERT_EQ(twice.frames.size(), once.frames.size());
    for (std::size_t i = 0; i < once.frames.size(); ++i) {
        EXPECT_EQ(twice.frames[i].frameId, once.frames[i].frameId);
        ASSERT_EQ(twice.frames[i].faces.size(), once.frames[i].faces.size());
        for (std::size_t j = 0; j < once.frames[i].faces.size(); ++j) {
            EXPECT_EQ(twice.frames[i].faces[j].label, once.frames[i].faces[j].label);
            EXPECT_DOUBLE_EQ(twice.frames[i].faces[j].confidence, once.frames[i].faces[j].confidence);
        }
    }
}

TEST(ComputeStatistics, CountsSharesAndConfidence) {
    const FilterOutcome filtered = filter_by_confidence(sample_frames(), 0.5);
    const EmotionStatistics stats = compute_statistics(filtered.frames, 3, filtered.droppedDetections);

    EXPECT_EQ(stats.framesAnalyzed, 3);
    EXPECT_EQ(stats.framesWithFaces, 2);
    EXPECT_EQ(stats.totalDetections, 3);
    EXPECT_EQ(stats.droppedDetections, 2);
    EXPECT_EQ(stats.counts[emotion_index(Emotion::Happy)], 2);
    EXPECT_EQ(stats.counts[emotion_index(Emotion::Angry)], 1);
    ASSERT_TRUE(stats.predominant.has_value());
    EXPECT_EQ(*stats.predominant, Emotion::Happy);
    EXPECT_NEAR(stats.predominantShare, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(stats.confidence[emotion_index(Emotion::Happy)].mean, 0.7, 1e-12);
    EXPECT_NEAR(negative_share(stats), 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(emotion_share(stats, Emotion::Angry), 1.0 / 3.0, 1e-12);
}

TEST(ComputeStatistics, TiesResolveInLabelOrder) {
    std::vector<FrameResult> frames(1);
    frames[0].faces = {detection(Emotion::Sad, 0.8), detection(Emotion::Angry, 0.8)};
    const EmotionStatistics stats = compute_statistics(frames, 1, 0);
    ASSERT_TRUE(stats.predominant.has_value());
    EXPECT_EQ(*stats.predominant, Emotion::Angry);
    EXPECT_DOUBLE_EQ(stats.predominantShare, 0.5);
}

TEST(ComputeStatistics, NoDetectionsHasNoPredominantEmotion) {
    const EmotionStatistics stats = compute_statistics({}, 12, 4);
    EXPECT_FALSE(stats.predominant.has_value());
    EXPECT_EQ(stats.totalDetections, 0);
    EXPECT_EQ(stats.framesAnalyzed, 12);
    EXPECT_DOUBLE_EQ(negative_share(stats), 0.0);
}
