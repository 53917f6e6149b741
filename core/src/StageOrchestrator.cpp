#include "affectscope/StageOrchestrator.h"

#include "affectscope/DiagnosisMatcher.h"
#include "affectscope/Statistics.h"
#include "affectscope/Utility.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <glog/logging.h>

#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>

namespace affectscope {

namespace {

constexpr std::size_t kFramesPerWorker = 4;

// Shared by every orchestrator in the process so ids never collide.
std::atomic<int> g_sessionCounter{0};

/**
 * Run one stage body. Success appends the stage marker and returns the value;
 * a non-OK status or an exception records "<stage>: <message>" and returns
 * the stage default.
 */
template <typename T>
T run_stage(SessionResult& session, const char* name, const std::function<absl::StatusOr<T>()>& body, T fallback) {
    LOG(INFO) << "Stage " << name << " started";
    absl::StatusOr<T> out = absl::InternalError("stage did not run");
    try {
        out = body();
    } catch (const std::exception& e) {
        out = absl::InternalError(e.what());
    }

    if (!out.ok()) {
        LOG(ERROR) << "Stage " << name << " failed: " << out.status();
        session.errors.push_back(absl::StrCat(name, ": ", out.status().message()));
        return fallback;
    }
    session.completedStages.emplace_back(name);
    LOG(INFO) << "Stage " << name << " completed";
    return *std::move(out);
}

std::string compact_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf, n);
}

}  // namespace

StageOrchestrator::StageOrchestrator(PipelineComponents components, OrchestratorOptions options)
    : components_(std::move(components)),
      options_(std::move(options)),
      alertEvaluator_(options_.alertThresholds) {
    if (!components_.scorer || !components_.frameSource || !components_.faceDetector) {
        throw std::invalid_argument("StageOrchestrator requires a scorer, a frame source and a face detector");
    }
}

std::string StageOrchestrator::next_session_id() {
    const int seq = g_sessionCounter.fetch_add(1) + 1;
    return absl::StrFormat("sesion_%s_%04d", compact_timestamp(std::chrono::system_clock::now()), seq);
}

FrameResult StageOrchestrator::score_frame(const io::SampledFrame& frame) const {
    FrameResult result;
    result.frameId = frame.frameId;
    result.timestampSeconds = frame.timestampSeconds;

    const std::vector<io::DetectedFace> faces = components_.faceDetector->detect(frame.image);
    const cv::Rect bounds(0, 0, frame.image.cols, frame.image.rows);
    for (const auto& face : faces) {
        const cv::Rect roi = cv::Rect(face.box.x, face.box.y, face.box.width, face.box.height) & bounds;
        if (roi.empty()) continue;

        const EnsemblePrediction p = components_.scorer->score(frame.image(roi));
        FaceDetection det;
        det.box = BoundingBox{roi.x, roi.y, roi.width, roi.height};
        det.frameId = frame.frameId;
        det.distribution = p.distribution;
        det.label = p.label;
        det.confidence = p.confidence;
        det.quality = std::clamp(face.score, 0.0, 1.0);
        det.fromFallback = p.fromFallback;
        result.faces.push_back(det);
    }
    return result;
}

void StageOrchestrator::score_batch(const std::vector<io::SampledFrame>& batch, std::vector<FrameResult>& out) const {
    const std::size_t workers = std::min<std::size_t>(std::max(options_.workerThreads, 1), batch.size());
    if (workers <= 1) {
        for (const auto& frame : batch) out.push_back(score_frame(frame));
        return;
    }

    std::vector<FrameResult> scored(batch.size());
    std::vector<std::exception_ptr> failures(workers);
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&, w]() {
            try {
                for (std::size_t i = next.fetch_add(1); i < batch.size(); i = next.fetch_add(1)) {
                    scored[i] = score_frame(batch[i]);
                }
            } catch (...) {
                failures[w] = std::current_exception();
            }
        });
    }
    for (auto& t : threads) t.join();
    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
    for (auto& frame : scored) out.push_back(std::move(frame));
}

absl::StatusOr<StageOrchestrator::FacialOutput> StageOrchestrator::analyze_faces(const std::string& videoPath,
                                                                                 const SessionConfig& config,
                                                                                 const CancellationToken* cancel) const {
    FacialOutput output;
    const std::size_t batchSize = static_cast<std::size_t>(std::max(options_.workerThreads, 1)) * kFramesPerWorker;
    std::vector<io::SampledFrame> pending;
    int sampled = 0;

    const absl::Status status = components_.frameSource->sample(
        videoPath, config.profile.frameIntervalMs, [&](io::SampledFrame&& frame) {
            if ((cancel && cancel->cancelled()) || (config.maxFrames > 0 && sampled >= config.maxFrames)) {
                output.cancelled = true;
                return false;
            }
            ++sampled;
            pending.push_back(std::move(frame));
            if (pending.size() >= batchSize) {
                score_batch(pending, output.frames);
                pending.clear();
            }
            return true;
        });
    if (!pending.empty()) {
        score_batch(pending, output.frames);
    }
    if (!status.ok()) {
        return status;
    }

    std::stable_sort(output.frames.begin(), output.frames.end(),
                     [](const FrameResult& a, const FrameResult& b) { return a.frameId < b.frameId; });
    if (output.cancelled) {
        LOG(WARNING) << "Facial analysis stopped early after " << output.frames.size() << " frame(s)";
    }
    return output;
}

absl::StatusOr<SessionResult> StageOrchestrator::run(const std::string& videoPath,
                                                     const std::string& diagnosis,
                                                     const SessionOverrides& overrides,
                                                     const ParticipantContext& participant,
                                                     const CancellationToken* cancel) {
    if (absl::Status valid = validate_video(videoPath, options_.videoLimits); !valid.ok()) {
        LOG(ERROR) << "Rejected video " << videoPath << ": " << valid;
        return valid;
    }

    SessionResult session;
    session.sessionId = next_session_id();
    session.videoPath = videoPath;
    session.config = resolve_session_config(diagnosis, overrides);
    session.participant = participant;
    session.startedAt = std::chrono::system_clock::now();
    LOG(INFO) << "Session " << session.sessionId << ": profile " << session.config.profile.key << ", interval "
              << session.config.profile.frameIntervalMs << " ms, threshold "
              << session.config.profile.confidenceThreshold;

    // 1. Facial-emotion analysis
    FacialOutput facial = run_stage<FacialOutput>(
        session, stage::kFacialAnalysis,
        [&]() { return analyze_faces(videoPath, session.config, cancel); }, FacialOutput{});
    session.rawFrames = std::move(facial.frames);
    session.cancelled = facial.cancelled;

    // 2. Confidence filtering and statistics
    FilterOutcome filtered = run_stage<FilterOutcome>(
        session, stage::kConfidenceFiltering,
        [&]() -> absl::StatusOr<FilterOutcome> {
            return filter_by_confidence(session.rawFrames, session.config.profile.confidenceThreshold);
        },
        FilterOutcome{});
    session.filteredFrames = std::move(filtered.frames);
    session.statistics = compute_statistics(session.filteredFrames, static_cast<int>(session.rawFrames.size()),
                                            filtered.droppedDetections);

    // 3. Audio analysis
    std::optional<AudioResult> audio = run_stage<std::optional<AudioResult>>(
        session, stage::kAudioAnalysis,
        [&]() -> absl::StatusOr<std::optional<AudioResult>> {
            if (!components_.audioAnalyzer) {
                return absl::FailedPreconditionError("no audio analyzer configured");
            }
            absl::StatusOr<AudioResult> r = components_.audioAnalyzer->analyze(videoPath);
            if (!r.ok()) return r.status();
            return std::optional<AudioResult>(*std::move(r));
        },
        std::nullopt);
    session.audioAvailable = audio.has_value();
    if (audio) session.audio = std::move(*audio);

    // 4. Generic rule-based recommendations
    std::vector<std::string> generic = run_stage<std::vector<std::string>>(
        session, stage::kGenericRecommendations,
        [&]() -> absl::StatusOr<std::vector<std::string>> {
            if (!components_.recommendations) {
                return absl::FailedPreconditionError("no recommendation engine configured");
            }
            return components_.recommendations->generate(diagnosis, session.statistics, session.audio,
                                                         session.audioAvailable);
        },
        {});

    // 5. Contextual recommendations
    std::vector<std::string> contextual = run_stage<std::vector<std::string>>(
        session, stage::kContextualRecommendations,
        [&]() -> absl::StatusOr<std::vector<std::string>> {
            if (!components_.recommendations) {
                return absl::FailedPreconditionError("no recommendation engine configured");
            }
            return components_.recommendations->contextual(diagnosis, participant, session.statistics,
                                                           session.audio, session.audioAvailable);
        },
        {});

    std::vector<std::string> merged = std::move(generic);
    merged.insert(merged.end(), contextual.begin(), contextual.end());
    session.recommendations = deduplicate(merged);
    if (session.recommendations.empty()) {
        session.recommendations = default_recommendations();
    }

    // 6. Alerts, priority and report files
    auto evaluate = [&]() {
        session.alerts = alertEvaluator_.evaluate(session.statistics, session.audio, session.audioAvailable,
                                                  static_cast<int>(session.errors.size()), session.config.profile);
        session.priority = derive_priority(session.alerts);
    };
    evaluate();
    const std::size_t errorsBeforeReport = session.errors.size();
    session.reports = run_stage<ReportArtifacts>(
        session, stage::kReportGeneration,
        [&]() -> absl::StatusOr<ReportArtifacts> {
            if (!components_.reportWriter) return ReportArtifacts{};
            return components_.reportWriter->write(session);
        },
        ReportArtifacts{});
    if (session.errors.size() != errorsBeforeReport) {
        evaluate();
    }

    session.finishedAt = std::chrono::system_clock::now();
    LOG(INFO) << "Session " << session.sessionId << " finished: " << session.completedStages.size()
              << " stage(s) completed, " << session.errors.size() << " error(s), " << session.alerts.size()
              << " alert(s), priority " << priority_to_string(session.priority);

    if (components_.store) {
        components_.store->save_session(session);
    }
    return session;
}

}  // namespace affectscope
