#pragma once

#include "affectscope/AlertEvaluator.h"
#include "affectscope/AudioAnalyzer.h"
#include "affectscope/EmotionTypes.h"
#include "affectscope/EnsembleScorer.h"
#include "affectscope/RecommendationEngine.h"
#include "affectscope/ReportWriter.h"
#include "affectscope/SessionStore.h"
#include "affectscope/VideoValidator.h"
#include "affectscope/io/FaceDetector.h"
#include "affectscope/io/FrameSource.h"

#include <absl/status/statusor.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace affectscope {

namespace stage {
constexpr const char* kFacialAnalysis = "facial_analysis";
constexpr const char* kConfidenceFiltering = "confidence_filtering";
constexpr const char* kAudioAnalysis = "audio_analysis";
constexpr const char* kGenericRecommendations = "generic_recommendations";
constexpr const char* kContextualRecommendations = "contextual_recommendations";
constexpr const char* kReportGeneration = "report_generation";
}  // namespace stage

// Cooperative stop signal for stage 1; safe to trigger from any thread.
class CancellationToken {
  public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

  private:
    std::atomic<bool> cancelled_{false};
};

struct OrchestratorOptions {
    int workerThreads{1};          // stage 1 face scoring
    VideoLimits videoLimits;
    AlertThresholds alertThresholds;
};

// Collaborators; scorer, frameSource and faceDetector are required. A null
// reportWriter skips the files, a null store skips persistence.
struct PipelineComponents {
    std::shared_ptr<const EnsembleScorer> scorer;
    std::shared_ptr<io::FrameSource> frameSource;
    std::shared_ptr<io::FaceDetector> faceDetector;
    std::shared_ptr<AudioAnalyzer> audioAnalyzer;
    std::shared_ptr<RecommendationEngine> recommendations;
    std::shared_ptr<ReportWriter> reportWriter;
    std::shared_ptr<SessionStore> store;
};

/**
 * StageOrchestrator: six-stage analysis of one recorded session.
 *
 *   1. facial_analysis             sample frames, detect faces, score each face
 *   2. confidence_filtering        threshold filter + statistics
 *   3. audio_analysis              extract, transcribe, aggregate
 *   4. generic_recommendations     rule tables
 *   5. contextual_recommendations  recommendation service via cache
 *   6. report_generation           alerts, priority, report files
 *
 * Stages run in order on the calling thread. A failing stage leaves an
 * "<stage>: <message>" entry in SessionResult::errors and its default output
 * in place; later stages still run. Only video validation aborts the run,
 * before any stage and without persisting anything.
 *
 * The finished record is saved once through the SessionStore; store errors
 * propagate as exceptions.
 */
class StageOrchestrator {
  public:
    explicit StageOrchestrator(PipelineComponents components, OrchestratorOptions options = {});

    absl::StatusOr<SessionResult> run(const std::string& videoPath,
                                      const std::string& diagnosis,
                                      const SessionOverrides& overrides = {},
                                      const ParticipantContext& participant = {},
                                      const CancellationToken* cancel = nullptr);

  private:
    struct FacialOutput {
        std::vector<FrameResult> frames;
        bool cancelled{false};
    };

    absl::StatusOr<FacialOutput> analyze_faces(const std::string& videoPath,
                                               const SessionConfig& config,
                                               const CancellationToken* cancel) const;
    FrameResult score_frame(const io::SampledFrame& frame) const;
    void score_batch(const std::vector<io::SampledFrame>& batch, std::vector<FrameResult>& out) const;

    std::string next_session_id();

    PipelineComponents components_;
    OrchestratorOptions options_;
    AlertEvaluator alertEvaluator_;
};

}  // namespace affectscope
