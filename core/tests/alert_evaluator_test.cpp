#include "affectscope/AlertEvaluator.h"

#include "affectscope/DiagnosisMatcher.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace affectscope;
using namespace affectscope::test;

namespace {

int count_alerts(const std::vector<Alert>& alerts, AlertType type, AlertLevel level) {
    return static_cast<int>(std::count_if(alerts.begin(), alerts.end(), [&](const Alert& a) {
        return a.type == type && a.level == level;
    }));
}

AudioResult audio_with(int words, int attempts) {
    AudioResult audio;
    audio.wordCount = words;
    audio.attempts = attempts;
    return audio;
}

const DiagnosisProfile& default_profile() { return profile_for(DiagnosisCategory::Default); }

}  // namespace

TEST(AlertEvaluator, NegativeShareBoundaryIsStrict) {
    const AlertEvaluator evaluator;
    const AudioResult speaking = audio_with(12, 10);

    const auto atSixty =
        evaluator.evaluate(stats_with({{Emotion::Sad, 6000}, {Emotion::Happy, 4000}}), speaking, true, 0,
                           default_profile());
    EXPECT_EQ(count_alerts(atSixty, AlertType::Emotional, AlertLevel::Alto), 0);

    const auto aboveSixty =
        evaluator.evaluate(stats_with({{Emotion::Sad, 6001}, {Emotion::Happy, 3999}}), speaking, true, 0,
                           default_profile());
    EXPECT_EQ(count_alerts(aboveSixty, AlertType::Emotional, AlertLevel::Alto), 1);
    EXPECT_EQ(derive_priority(aboveSixty), SessionPriority::Critico);
}

TEST(AlertEvaluator, ProfileAlertEmotionsRaiseMediumAlerts) {
    const AlertEvaluator evaluator;
    const DiagnosisProfile& autism = profile_for(DiagnosisCategory::Autism);  // alerts on Fear, Angry

    const auto alerts = evaluator.evaluate(
        stats_with({{Emotion::Fear, 31}, {Emotion::Angry, 30}, {Emotion::Happy, 39}}), audio_with(12, 10), true, 0,
        autism);
    EXPECT_EQ(count_alerts(alerts, AlertType::DiagnosisSpecific, AlertLevel::Medio), 1);
    EXPECT_EQ(count_alerts(alerts, AlertType::Emotional, AlertLevel::Alto), 1);  // 61% negative
}

TEST(AlertEvaluator, CommunicationAlertsFollowAudioResult) {
    const AlertEvaluator evaluator;
    const EmotionStatistics calm = stats_with({{Emotion::Happy, 5}});

    const auto silent = evaluator.evaluate(calm, audio_with(0, 0), true, 0, default_profile());
    EXPECT_EQ(count_alerts(silent, AlertType::Communication, AlertLevel::Alto), 1);
    EXPECT_EQ(derive_priority(silent), SessionPriority::Critico);

    const auto limited = evaluator.evaluate(calm, audio_with(1, 1), true, 0, default_profile());
    EXPECT_EQ(count_alerts(limited, AlertType::Communication, AlertLevel::Medio), 1);
    EXPECT_EQ(derive_priority(limited), SessionPriority::Moderado);

    const auto preVerbalAtThreshold = evaluator.evaluate(calm, audio_with(2, 2), true, 0, default_profile());
    EXPECT_TRUE(preVerbalAtThreshold.empty());

    const auto noAudio = evaluator.evaluate(calm, audio_with(0, 0), false, 0, default_profile());
    EXPECT_TRUE(noAudio.empty());
    EXPECT_EQ(derive_priority(noAudio), SessionPriority::Normal);
}

TEST(AlertEvaluator, TechnicalAlertAfterMoreThanTwoStageErrors) {
    const AlertEvaluator evaluator;
    const EmotionStatistics calm = stats_with({{Emotion::Happy, 5}});

    EXPECT_EQ(count_alerts(evaluator.evaluate(calm, audio_with(12, 10), true, 2, default_profile()),
                           AlertType::Technical, AlertLevel::Medio),
              0);
    EXPECT_EQ(count_alerts(evaluator.evaluate(calm, audio_with(12, 10), true, 3, default_profile()),
                           AlertType::Technical, AlertLevel::Medio),
              1);
}

TEST(AlertEvaluator, ThresholdsAreOverridable) {
    AlertThresholds thresholds;
    thresholds.negativeShare = 0.25;
    const AlertEvaluator evaluator(thresholds);

    const auto alerts = evaluator.evaluate(stats_with({{Emotion::Sad, 3}, {Emotion::Happy, 7}}), audio_with(12, 10),
                                           true, 0, default_profile());
    EXPECT_EQ(count_alerts(alerts, AlertType::Emotional, AlertLevel::Alto), 1);
}

TEST(AlertEvaluator, AlertsCarryTimestampAndText) {
    const AlertEvaluator evaluator;
    const auto now = std::chrono::system_clock::now();
    const auto alerts = evaluator.evaluate(stats_with({{Emotion::Sad, 9}}), audio_with(0, 0), true, 0,
                                           default_profile(), now);
    ASSERT_FALSE(alerts.empty());
    for (const auto& a : alerts) {
        EXPECT_EQ(a.timestamp, now);
        EXPECT_FALSE(a.message.empty());
        EXPECT_FALSE(a.recommendation.empty());
    }
}

TEST(DerivePriority, HighestLevelWins) {
    EXPECT_EQ(derive_priority({}), SessionPriority::Normal);

    Alert low;
    low.level = AlertLevel::Bajo;
    Alert medium;
    medium.level = AlertLevel::Medio;
    Alert high;
    high.level = AlertLevel::Alto;
    EXPECT_EQ(derive_priority({low}), SessionPriority::Normal);
    EXPECT_EQ(derive_priority({low, medium}), SessionPriority::Moderado);
    EXPECT_EQ(derive_priority({medium, high, low}), SessionPriority::Critico);
}
