#include "affectscope/StageOrchestrator.h"

#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <thread>

using namespace affectscope;
using namespace affectscope::test;

namespace {

const std::string kSadnessRecommendation =
    "Se detectó tristeza frecuente; se recomienda acompañamiento emocional cercano.";
const std::string kAacRecommendation =
    "Introducir sistemas aumentativos y alternativos de comunicación (SAAC) con pictogramas.";

std::shared_ptr<const EnsembleScorer> sad_scorer() {
    FakeLoader loader;
    loader.add("sad_model", std::make_shared<FakeClassifier>(peaked_output(Emotion::Sad, 0.8f)));
    EnsembleConfig config;
    config.models = {descriptor("sad_model", 1.0)};
    EnsembleOptions options;
    options.smoothingEpsilon = 0.0;
    return EnsembleScorer::load(config, loader, options);
}

std::shared_ptr<const EnsembleScorer> empty_scorer() {
    FakeLoader loader;
    return EnsembleScorer::load(EnsembleConfig{}, loader);
}

cv::Mat gray_frame() { return cv::Mat(96, 96, CV_8UC3, cv::Scalar(128, 128, 128)); }

std::vector<io::DetectedFace> one_face() {
    io::DetectedFace face;
    face.box = BoundingBox{16, 16, 48, 48};
    face.score = 0.95;
    return {face};
}

StructuredRecommendations service_recs() {
    StructuredRecommendations r;
    r.immediateActions = {"Ofrecer un objeto de apego durante la sesión."};
    r.strategies = {"Anticipar los cambios de actividad con apoyos visuales."};
    return r;
}

class StageOrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        video_ = dir_.write_file("sesion.mp4", "not really a video");
        frames_ = std::make_shared<FakeFrameSource>(10, gray_frame());
        faces_ = std::make_shared<FakeFaceDetector>(one_face());
        extractor_ = std::make_shared<FakeAudioExtractor>(small_clip());
        speech_ = std::make_shared<FakeSpeechToText>(std::vector<absl::StatusOr<io::Transcript>>{
            transcript_of("hola mamá quiero jugar con la pelota grande ahora mismo")});
        service_ = std::make_shared<FakeRecommendationService>(service_recs());
        store_ = std::make_shared<SessionStore>((dir_.path() / "sesiones.db").string());
        store_->initialize();
    }

    PipelineComponents components(std::shared_ptr<const EnsembleScorer> scorer) {
        PipelineComponents c;
        c.scorer = std::move(scorer);
        c.frameSource = frames_;
        c.faceDetector = faces_;
        c.audioAnalyzer = std::make_shared<AudioAnalyzer>(extractor_, speech_, AudioAnalyzerOptions{},
                                                          [](std::chrono::milliseconds) {});
        c.recommendations = std::make_shared<RecommendationEngine>(
            service_, std::make_shared<RecommendationCache>(), RetryPolicy{}, [](std::chrono::milliseconds) {});
        c.reportWriter = std::make_shared<ReportWriter>((dir_.path() / "resultados").string());
        c.store = store_;
        return c;
    }

    ScopedTempDir dir_;
    std::string video_;
    std::shared_ptr<FakeFrameSource> frames_;
    std::shared_ptr<FakeFaceDetector> faces_;
    std::shared_ptr<FakeAudioExtractor> extractor_;
    std::shared_ptr<FakeSpeechToText> speech_;
    std::shared_ptr<FakeRecommendationService> service_;
    std::shared_ptr<SessionStore> store_;
};

}  // namespace

TEST_F(StageOrchestratorTest, PersistentSadnessRaisesEmotionalAlert) {
    StageOrchestrator orchestrator(components(sad_scorer()));

    auto result = orchestrator.run(video_, "");
    ASSERT_TRUE(result.ok()) << result.status();

    EXPECT_TRUE(result->errors.empty());
    EXPECT_EQ(result->completedStages,
              (std::vector<std::string>{stage::kFacialAnalysis, stage::kConfidenceFiltering, stage::kAudioAnalysis,
                                        stage::kGenericRecommendations, stage::kContextualRecommendations,
                                        stage::kReportGeneration}));
    EXPECT_EQ(result->config.profile.key, "default");
    EXPECT_EQ(frames_->last_interval_ms(), 1000);

    ASSERT_EQ(result->rawFrames.size(), 10u);
    EXPECT_EQ(result->statistics.totalDetections, 10);
    ASSERT_TRUE(result->statistics.predominant.has_value());
    EXPECT_EQ(*result->statistics.predominant, Emotion::Sad);
    EXPECT_DOUBLE_EQ(result->statistics.predominantShare, 1.0);
    EXPECT_NEAR(result->rawFrames.front().faces.front().confidence, 0.8, 1e-6);

    ASSERT_EQ(result->alerts.size(), 1u);
    EXPECT_EQ(result->alerts[0].type, AlertType::Emotional);
    EXPECT_EQ(result->alerts[0].level, AlertLevel::Alto);
    EXPECT_EQ(result->priority, SessionPriority::Critico);

    EXPECT_TRUE(contains(result->recommendations, kSadnessRecommendation));
    EXPECT_TRUE(contains(result->recommendations, "Ofrecer un objeto de apego durante la sesión."));
    EXPECT_EQ(service_->calls(), 1);

    EXPECT_TRUE(std::filesystem::is_regular_file(result->reports.textReportPath));
    EXPECT_TRUE(std::filesystem::is_regular_file(result->reports.csvPath));

    const auto stored = store_->find_session(result->sessionId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->detections, 10);
    EXPECT_EQ(stored->keptDetections, 10);
    EXPECT_EQ(stored->priority, "critico");
    EXPECT_EQ(stored->stageMarkers, 6);
}

TEST_F(StageOrchestratorTest, EmptyEnsembleFallsBackToImageHeuristic) {
    StageOrchestrator orchestrator(components(empty_scorer()));

    auto result = orchestrator.run(video_, "");
    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_EQ(result->rawFrames.size(), 10u);
    for (const auto& frame : result->rawFrames) {
        ASSERT_EQ(frame.faces.size(), 1u);
        EXPECT_TRUE(frame.faces[0].fromFallback);
        EXPECT_LE(frame.faces[0].confidence, 0.4 + 1e-9);
    }
    // Heuristic confidence never reaches the default threshold
    EXPECT_EQ(result->statistics.totalDetections, 0);
    EXPECT_EQ(result->statistics.droppedDetections, 10);
    EXPECT_FALSE(result->statistics.predominant.has_value());
    EXPECT_FALSE(result->recommendations.empty());
}

TEST_F(StageOrchestratorTest, SilentRecordingRaisesCommunicationAlert) {
    speech_ = std::make_shared<FakeSpeechToText>(std::vector<absl::StatusOr<io::Transcript>>{transcript_of("")});
    StageOrchestrator orchestrator(components(sad_scorer()));

    auto result = orchestrator.run(video_, "");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->audioAvailable);
    EXPECT_EQ(result->audio.attempts, 0);

    const bool hasCommunicationAlert =
        std::any_of(result->alerts.begin(), result->alerts.end(), [](const Alert& a) {
            return a.type == AlertType::Communication && a.level == AlertLevel::Alto;
        });
    EXPECT_TRUE(hasCommunicationAlert);
    EXPECT_TRUE(contains(result->recommendations, kAacRecommendation));
}

TEST_F(StageOrchestratorTest, InvalidVideoAbortsWithoutPersisting) {
    StageOrchestrator orchestrator(components(sad_scorer()));

    auto result = orchestrator.run((dir_.path() / "missing.mp4").string(), "");
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
    EXPECT_EQ(frames_->delivered(), 0);
    EXPECT_EQ(extractor_->calls(), 0);
    EXPECT_EQ(store_->session_count(), 0);
}

TEST_F(StageOrchestratorTest, MaxFramesStopsSamplingEarly) {
    StageOrchestrator orchestrator(components(sad_scorer()));
    SessionOverrides overrides;
    overrides.maxFrames = 3;

    auto result = orchestrator.run(video_, "", overrides);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->rawFrames.size(), 3u);
    EXPECT_TRUE(result->cancelled);
    EXPECT_TRUE(contains(result->completedStages, stage::kFacialAnalysis));
}

TEST_F(StageOrchestratorTest, CancelledTokenKeepsPartialSession) {
    StageOrchestrator orchestrator(components(sad_scorer()));
    CancellationToken token;
    token.cancel();

    auto result = orchestrator.run(video_, "", {}, {}, &token);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->rawFrames.empty());
    EXPECT_TRUE(result->cancelled);
    EXPECT_EQ(faces_->calls(), 0);
    EXPECT_EQ(store_->session_count(), 1);
}

TEST_F(StageOrchestratorTest, FailingStagesAreIsolated) {
    frames_ = std::make_shared<FakeFrameSource>(2, gray_frame(), absl::InternalError("decoder crashed"));
    extractor_ = std::make_shared<FakeAudioExtractor>(absl::NotFoundError("no audio track"));
    service_ = std::make_shared<FakeRecommendationService>(absl::UnavailableError("service down"));
    StageOrchestrator orchestrator(components(sad_scorer()));

    auto result = orchestrator.run(video_, "autismo");
    ASSERT_TRUE(result.ok()) << result.status();

    ASSERT_EQ(result->errors.size(), 3u);
    EXPECT_EQ(result->errors[0], "facial_analysis: decoder crashed");
    EXPECT_EQ(result->errors[1], "audio_analysis: no audio track");
    EXPECT_EQ(result->errors[2], "contextual_recommendations: service down");
    EXPECT_EQ(service_->calls(), 3);
    EXPECT_EQ(result->completedStages,
              (std::vector<std::string>{stage::kConfidenceFiltering, stage::kGenericRecommendations,
                                        stage::kReportGeneration}));

    EXPECT_TRUE(result->rawFrames.empty());
    EXPECT_FALSE(result->audioAvailable);
    EXPECT_FALSE(result->recommendations.empty());

    const bool hasTechnicalAlert = std::any_of(result->alerts.begin(), result->alerts.end(),
                                               [](const Alert& a) { return a.type == AlertType::Technical; });
    EXPECT_TRUE(hasTechnicalAlert);
    const bool hasCommunicationAlert = std::any_of(result->alerts.begin(), result->alerts.end(),
                                                   [](const Alert& a) { return a.type == AlertType::Communication; });
    EXPECT_FALSE(hasCommunicationAlert);

    const auto stored = store_->find_session(result->sessionId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->stageErrors, 3);
}

TEST_F(StageOrchestratorTest, ProfileIntervalReachesFrameSource) {
    StageOrchestrator orchestrator(components(sad_scorer()));

    auto result = orchestrator.run(video_, "Trastorno del espectro autista");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->config.profile.key, "autismo");
    EXPECT_EQ(frames_->last_interval_ms(), 500);
    EXPECT_DOUBLE_EQ(result->rawFrames[1].timestampSeconds, 0.5);
}

TEST_F(StageOrchestratorTest, ParallelScoringKeepsFrameOrder) {
    frames_ = std::make_shared<FakeFrameSource>(25, gray_frame());
    OrchestratorOptions options;
    options.workerThreads = 4;
    StageOrchestrator orchestrator(components(sad_scorer()), options);

    auto result = orchestrator.run(video_, "");
    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_EQ(result->rawFrames.size(), 25u);
    for (std::size_t i = 0; i < result->rawFrames.size(); ++i) {
        EXPECT_EQ(result->rawFrames[i].frameId, static_cast<int64_t>(i) * 15);
    }
    EXPECT_EQ(faces_->calls(), 25);
}

TEST_F(StageOrchestratorTest, SessionIdsAreUnique) {
    StageOrchestrator orchestrator(components(sad_scorer()));
    auto first = orchestrator.run(video_, "");
    auto second = orchestrator.run(video_, "");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_NE(first->sessionId, second->sessionId);
    EXPECT_EQ(first->sessionId.rfind("sesion_", 0), 0u);
    EXPECT_EQ(store_->session_count(), 2);
}

TEST_F(StageOrchestratorTest, ConcurrentSessionsShareScorerCacheAndStore) {
    const PipelineComponents shared = components(sad_scorer());

    constexpr int kOrchestrators = 2;
    constexpr int kSessionsEach = 3;
    std::vector<std::vector<std::string>> ids(kOrchestrators);
    std::vector<std::string> failures(kOrchestrators);
    std::vector<std::thread> threads;
    for (int t = 0; t < kOrchestrators; ++t) {
        // Per-session collaborators are private; everything else is shared.
        PipelineComponents c = shared;
        c.frameSource = std::make_shared<FakeFrameSource>(10, gray_frame());
        c.audioAnalyzer = std::make_shared<AudioAnalyzer>(
            std::make_shared<FakeAudioExtractor>(small_clip()),
            std::make_shared<FakeSpeechToText>(std::vector<absl::StatusOr<io::Transcript>>{
                transcript_of("hola mamá quiero jugar con la pelota grande ahora mismo")}),
            AudioAnalyzerOptions{}, [](std::chrono::milliseconds) {});
        OrchestratorOptions options;
        options.workerThreads = 2;
        threads.emplace_back([c = std::move(c), options, t, &ids, &failures, this]() {
            StageOrchestrator orchestrator(c, options);
            for (int i = 0; i < kSessionsEach; ++i) {
                auto result = orchestrator.run(video_, "TEA");
                if (!result.ok()) {
                    failures[t] = result.status().ToString();
                    return;
                }
                if (!result->errors.empty()) {
                    failures[t] = result->errors.front();
                    return;
                }
                ids[t].push_back(result->sessionId);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> unique;
    for (int t = 0; t < kOrchestrators; ++t) {
        EXPECT_TRUE(failures[t].empty()) << failures[t];
        EXPECT_EQ(ids[t].size(), static_cast<std::size_t>(kSessionsEach));
        unique.insert(ids[t].begin(), ids[t].end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kOrchestrators * kSessionsEach));
    EXPECT_EQ(store_->session_count(), kOrchestrators * kSessionsEach);
    for (const auto& id : unique) {
        const auto stored = store_->find_session(id);
        ASSERT_TRUE(stored.has_value()) << id;
        EXPECT_EQ(stored->profileKey, "autismo");
        EXPECT_EQ(stored->detections, 10);
    }
    // Identical inputs hit the shared cache after the first answer.
    EXPECT_GE(service_->calls(), 1);
    EXPECT_LE(service_->calls(), kOrchestrators);
    EXPECT_EQ(faces_->calls(), kOrchestrators * kSessionsEach * 10);
}

TEST(StageOrchestrator, RequiresCoreCollaborators) {
    EXPECT_THROW(StageOrchestrator{PipelineComponents{}}, std::invalid_argument);
}
