#include "affectscope/RecommendationEngine.h"

#include "affectscope/AudioAnalyzer.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <vector>

using namespace affectscope;
using namespace affectscope::test;

namespace {

const std::string kSadness = "Se detectó tristeza frecuente; se recomienda acompañamiento emocional cercano.";
const std::string kAugmentative =
    "Introducir sistemas aumentativos y alternativos de comunicación (SAAC) con pictogramas.";
const std::string kPreVerbal = "Baja frecuencia de intentos verbales, se sugiere estimular comunicación verbal.";

AudioResult fluent_audio() {
    return aggregate_transcript(transcript_of("mamá quiero jugar con la pelota grande en casa ahora"), "es-ES");
}

bool has_duplicates(const std::vector<std::string>& items) {
    return std::set<std::string>(items.begin(), items.end()).size() != items.size();
}

}  // namespace

TEST(Deduplicate, KeepsFirstOccurrenceOrder) {
    const std::vector<std::string> out = deduplicate({"b", "a", "b", "c", "a"});
    EXPECT_EQ(out, (std::vector<std::string>{"b", "a", "c"}));
}

TEST(RecommendationEngineGenerate, SadnessRuleFires) {
    const RecommendationEngine engine(nullptr, nullptr);
    const auto recs = engine.generate("", stats_with({{Emotion::Sad, 8}, {Emotion::Neutral, 2}}), fluent_audio());
    EXPECT_TRUE(contains(recs, kSadness));
    EXPECT_FALSE(has_duplicates(recs));
}

TEST(RecommendationEngineGenerate, NonVerbalSuggestsAugmentativeCommunication) {
    const RecommendationEngine engine(nullptr, nullptr);
    const AudioResult silent = aggregate_transcript(io::Transcript{}, "es-ES");
    const auto recs = engine.generate("", stats_with({{Emotion::Happy, 4}}), silent, true);
    EXPECT_TRUE(contains(recs, kAugmentative));

    const auto withoutAudio = engine.generate("", stats_with({{Emotion::Happy, 4}}), silent, false);
    EXPECT_FALSE(contains(withoutAudio, kAugmentative));
}

TEST(RecommendationEngineGenerate, PreVerbalRule) {
    const RecommendationEngine engine(nullptr, nullptr);
    const AudioResult babble = aggregate_transcript(transcript_of("ma pa agua"), "es-ES");
    ASSERT_EQ(babble.attempts, 3);
    const AudioResult twoWords = aggregate_transcript(transcript_of("agua a"), "es-ES");
    ASSERT_EQ(twoWords.attempts, 1);

    EXPECT_FALSE(contains(engine.generate("", stats_with({{Emotion::Happy, 4}}), babble), kPreVerbal));
    EXPECT_TRUE(contains(engine.generate("", stats_with({{Emotion::Happy, 4}}), twoWords), kPreVerbal));
}

TEST(RecommendationEngineGenerate, DiagnosisRecommendationsComeFirst) {
    const RecommendationEngine engine(nullptr, nullptr);
    const auto recs = engine.generate("autismo", stats_with({{Emotion::Happy, 4}}), fluent_audio());
    const auto& autism = diagnosis_recommendations(DiagnosisCategory::Autism);
    ASSERT_GE(recs.size(), autism.size());
    EXPECT_TRUE(std::equal(autism.begin(), autism.end(), recs.begin()));
}

TEST(RecommendationEngineGenerate, NeverEmptyAndNeverDuplicated) {
    const RecommendationEngine engine(nullptr, nullptr);
    const std::vector<EmotionStatistics> cases = {
        EmotionStatistics{},
        stats_with({{Emotion::Happy, 3}, {Emotion::Neutral, 3}}),
        stats_with({{Emotion::Angry, 5}, {Emotion::Sad, 5}, {Emotion::Fear, 5}}),
    };
    for (const auto& diagnosis : {"", "tdah", "down", "parálisis cerebral", "discapacidad intelectual"}) {
        for (const auto& stats : cases) {
            for (bool audioAvailable : {true, false}) {
                const auto recs = engine.generate(diagnosis, stats, AudioResult{}, audioAvailable);
                EXPECT_FALSE(recs.empty()) << diagnosis;
                EXPECT_FALSE(has_duplicates(recs)) << diagnosis;
            }
        }
    }
}

TEST(RecommendationEngineGenerate, NegativeAndNonVerbalSuggestsCommunicativeFrustration) {
    const RecommendationEngine engine(nullptr, nullptr);
    const auto recs = engine.generate("", stats_with({{Emotion::Angry, 6}, {Emotion::Happy, 1}}), AudioResult{}, true);
    const auto& integrated = integrated_rules();
    ASSERT_FALSE(integrated.empty());
    EXPECT_TRUE(contains(recs, integrated.front().recommendations.front()));
}

TEST(RecommendationEngineGenerate, NoDetectionsSuggestsNewRecording) {
    const RecommendationEngine engine(nullptr, nullptr);
    const auto recs = engine.generate("", EmotionStatistics{}, fluent_audio());
    bool mentionsRecording = false;
    for (const auto& r : recs) {
        if (r.find("grabación") != std::string::npos) mentionsRecording = true;
    }
    EXPECT_TRUE(mentionsRecording);
}

TEST(RecommendationEngineContextual, CachesServiceResponses) {
    StructuredRecommendations response;
    response.immediateActions = {"Acción inmediata"};
    response.strategies = {"Estrategia", "Acción inmediata"};
    response.activities = {"Actividad"};
    auto service = std::make_shared<FakeRecommendationService>(response);
    auto cache = std::make_shared<RecommendationCache>();
    const RecommendationEngine engine(service, cache);

    const EmotionStatistics stats = stats_with({{Emotion::Happy, 4}});
    auto first = engine.contextual("autismo", ParticipantContext{}, stats, fluent_audio());
    auto second = engine.contextual("autismo", ParticipantContext{}, stats, fluent_audio());
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(service->calls(), 1);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(*first, (std::vector<std::string>{"Acción inmediata", "Estrategia", "Actividad"}));
    EXPECT_EQ(cache->size(), 1u);

    ParticipantContext toddler;
    toddler.ageMonths = 24;
    ASSERT_TRUE(engine.contextual("autismo", toddler, stats, fluent_audio()).ok());
    EXPECT_EQ(service->calls(), 2);
}

TEST(RecommendationEngineContextual, ForwardsSummaries) {
    auto service = std::make_shared<FakeRecommendationService>(StructuredRecommendations{});
    const RecommendationEngine engine(service, nullptr);

    ASSERT_TRUE(engine.contextual("", ParticipantContext{}, stats_with({{Emotion::Sad, 3}, {Emotion::Happy, 1}}),
                                  AudioResult{}, false)
                    .ok());
    EXPECT_EQ(service->last_emotion().totalDetections, 4);
    EXPECT_NEAR(service->last_emotion().negativeShare, 0.75, 1e-12);
    EXPECT_FALSE(service->last_audio().available);
}

TEST(RecommendationEngineContextual, ServiceErrorsPropagateAndAreNotCached) {
    auto service = std::make_shared<FakeRecommendationService>(absl::UnavailableError("service down"));
    auto cache = std::make_shared<RecommendationCache>();
    std::vector<std::chrono::milliseconds> sleeps;
    const RecommendationEngine engine(service, cache, RetryPolicy{},
                                      [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    auto result = engine.contextual("", ParticipantContext{}, EmotionStatistics{}, AudioResult{});
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(service->calls(), 3);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(cache->size(), 0u);
}

TEST(RecommendationEngineContextual, RetriesTransientServiceFailures) {
    StructuredRecommendations response;
    response.strategies = {"Estrategia"};
    auto service = std::make_shared<FakeRecommendationService>(std::vector<absl::StatusOr<StructuredRecommendations>>{
        absl::UnavailableError("connection reset"), response});
    auto cache = std::make_shared<RecommendationCache>();
    std::vector<std::chrono::milliseconds> sleeps;
    RetryPolicy retry;
    retry.initialBackoff = std::chrono::milliseconds(200);
    const RecommendationEngine engine(service, cache, retry,
                                      [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    auto result = engine.contextual("tdah", ParticipantContext{}, stats_with({{Emotion::Happy, 2}}), fluent_audio());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(*result, (std::vector<std::string>{"Estrategia"}));
    EXPECT_EQ(service->calls(), 2);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(200));
    EXPECT_EQ(cache->size(), 1u);
}

TEST(RecommendationEngineContextual, PermanentServiceErrorsAreNotRetried) {
    auto service = std::make_shared<FakeRecommendationService>(absl::PermissionDeniedError("bad token"));
    int sleeps = 0;
    const RecommendationEngine engine(service, nullptr, RetryPolicy{},
                                      [&sleeps](std::chrono::milliseconds) { ++sleeps; });

    auto result = engine.contextual("", ParticipantContext{}, EmotionStatistics{}, AudioResult{});
    EXPECT_EQ(result.status().code(), absl::StatusCode::kPermissionDenied);
    EXPECT_EQ(service->calls(), 1);
    EXPECT_EQ(sleeps, 0);
}

TEST(RecommendationEngineContextual, MissingServiceIsAnError) {
    const RecommendationEngine engine(nullptr, nullptr);
    auto result = engine.contextual("", ParticipantContext{}, EmotionStatistics{}, AudioResult{});
    EXPECT_EQ(result.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(LocalRecommendationService, TailorsToDiagnosisAgeAndAudio) {
    LocalRecommendationService service;
    ParticipantContext toddler;
    toddler.ageMonths = 30;

    AudioSummary silent;
    silent.available = true;
    auto recs = service.get_recommendations("TDAH", toddler, summarize_emotions(stats_with({{Emotion::Sad, 4}})),
                                            silent);
    ASSERT_TRUE(recs.ok());
    EXPECT_FALSE(recs->strategies.empty());
    EXPECT_EQ(recs->activities.size(), 2u);
    EXPECT_EQ(recs->immediateActions.size(), 2u);  // negative share and pictograms
}
