/**
 * affectscope_cli: analyze one recorded session from the command line.
 *
 * Usage:
 *   affectscope_cli --video=session.mp4 --diagnosis="TEA nivel 1" \
 *       --models_dir=models --face_model=models/face_detection_yunet.onnx
 *
 *   affectscope_cli --video=session.mp4 --diagnosis=TDAH \
 *       --recommendation_url=http://localhost:8000 --recommendation_token=...
 *
 *   affectscope_cli --check --models_dir=models --face_model=... --db_path=...
 *
 * glog output goes to stderr; the session summary is printed to stdout.
 */

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/status/status.h>
#include <glog/logging.h>

#include "affectscope/AudioAnalyzer.h"
#include "affectscope/EnsembleScorer.h"
#include "affectscope/RecommendationCache.h"
#include "affectscope/RecommendationEngine.h"
#include "affectscope/RecommendationService.h"
#include "affectscope/ReportWriter.h"
#include "affectscope/SessionStore.h"
#include "affectscope/StageOrchestrator.h"
#include "affectscope/Utility.h"
#include "affectscope/io/AudioIO.h"
#include "affectscope/io/FaceDetector.h"
#include "affectscope/io/FrameSource.h"
#include "affectscope/io/HttpRecommendationService.h"
#include "affectscope/models/DnnEmotionClassifier.h"
#include "affectscope/models/ModelCatalog.h"

ABSL_FLAG(std::string, video, "", "Session video to analyze (.mp4, .avi, .mov, .mkv).");
ABSL_FLAG(std::string, diagnosis, "", "Free-text diagnosis, e.g. 'autismo' or 'TDAH'.");
ABSL_FLAG(int, age_months, 0, "Participant age in months; 0 leaves it unset.");
ABSL_FLAG(std::string, notes, "", "Free-form participant notes forwarded to the report.");

ABSL_FLAG(std::string, models_dir, "",
          "Directory holding ensemble.manifest and the classifier artifacts. "
          "Falls back to AFFECTSCOPE_MODELS_DIR, then ./models.");
ABSL_FLAG(std::string, face_model, "", "YuNet face detection model; defaults to <models_dir>/face_detection_yunet.onnx.");
ABSL_FLAG(std::string, db_path, "",
          "SQLite database for finished sessions. Falls back to AFFECTSCOPE_DB_PATH, then ./affectscope.db.");
ABSL_FLAG(std::string, output_dir, "resultados", "Directory for text reports and CSV exports.");

ABSL_FLAG(std::string, language, "es-ES", "Speech-to-text language code.");
ABSL_FLAG(std::string, stt_command, "",
          "Speech-to-text command, called as '<cmd> <wav> <language>'. Falls back to AFFECTSCOPE_STT_COMMAND.");
ABSL_FLAG(int, stt_max_attempts, 3, "Speech-to-text attempts on transient failures.");

ABSL_FLAG(int, interval_ms, 0, "Frame sampling interval override; 0 keeps the diagnosis profile value.");
ABSL_FLAG(double, confidence_threshold, -1.0, "Confidence threshold override; negative keeps the profile value.");
ABSL_FLAG(int, max_frames, 0, "Stop facial analysis after this many sampled frames; 0 = unlimited.");
ABSL_FLAG(int, worker_threads, 1, "Threads scoring faces during facial analysis.");
ABSL_FLAG(int, model_timeout_ms, 0, "Per-model inference budget; 0 = no limit.");
ABSL_FLAG(int, cache_ttl_s, 3600, "Lifetime of cached contextual recommendations, in seconds.");
ABSL_FLAG(std::string, recommendation_url, "",
          "Base URL of the contextual recommendation API (POST <url>/recomendaciones). "
          "Falls back to AFFECTSCOPE_RECOMMENDATION_URL; empty uses the built-in recommendations.");
ABSL_FLAG(std::string, recommendation_token, "",
          "Bearer token for the recommendation API. Falls back to AFFECTSCOPE_RECOMMENDATION_TOKEN.");

ABSL_FLAG(bool, check, false, "Verify models, face model and database, then exit.");

namespace {

affectscope::CancellationToken g_cancel;

void signal_handler(int) { g_cancel.cancel(); }

std::string flag_or_env(const std::string& flagValue, const char* envName, const std::string& fallback) {
    if (!flagValue.empty()) return flagValue;
    const char* env = std::getenv(envName);
    if (env && env[0] != '\0') return std::string(env);
    return fallback;
}

std::string resolve_models_dir() {
    return flag_or_env(absl::GetFlag(FLAGS_models_dir), "AFFECTSCOPE_MODELS_DIR", "models");
}

std::string resolve_face_model(const std::string& modelsDir) {
    const std::string flag = absl::GetFlag(FLAGS_face_model);
    if (!flag.empty()) return flag;
    return (std::filesystem::path(modelsDir) / "face_detection_yunet.onnx").string();
}

std::string resolve_db_path() {
    return flag_or_env(absl::GetFlag(FLAGS_db_path), "AFFECTSCOPE_DB_PATH", "affectscope.db");
}

std::shared_ptr<affectscope::RecommendationService> make_recommendation_service() {
    const std::string url =
        flag_or_env(absl::GetFlag(FLAGS_recommendation_url), "AFFECTSCOPE_RECOMMENDATION_URL", "");
    if (url.empty()) {
        return std::make_shared<affectscope::LocalRecommendationService>();
    }
    affectscope::io::HttpRecommendationOptions options;
    options.baseUrl = url;
    options.bearerToken =
        flag_or_env(absl::GetFlag(FLAGS_recommendation_token), "AFFECTSCOPE_RECOMMENDATION_TOKEN", "");
    return std::make_shared<affectscope::io::HttpRecommendationService>(options);
}

std::unique_ptr<affectscope::EnsembleScorer> load_scorer(const std::string& modelsDir) {
    affectscope::EnsembleOptions options;
    options.modelTimeout = std::chrono::milliseconds(std::max(0, absl::GetFlag(FLAGS_model_timeout_ms)));

    affectscope::models::DnnClassifierLoader loader;
    return affectscope::EnsembleScorer::load(affectscope::models::load_catalog(modelsDir), loader, options);
}

int run_check() {
    bool ok = true;
    const std::string modelsDir = resolve_models_dir();

    try {
        auto scorer = load_scorer(modelsDir);
        std::cout << "Modelos de emoción cargados: " << scorer->model_count() << "\n";
        for (const auto& name : scorer->model_names()) {
            std::cout << "  " << name << " (peso " << scorer->weight_of(name) << ")\n";
        }
        if (scorer->model_count() == 0) {
            std::cout << "  sin modelos: se usará la heurística de respaldo\n";
        }
    } catch (const std::exception& e) {
        std::cout << "Catálogo de modelos inválido: " << e.what() << "\n";
        ok = false;
    }

    const std::string faceModel = resolve_face_model(modelsDir);
    if (std::filesystem::is_regular_file(faceModel)) {
        std::cout << "Modelo de detección facial: " << faceModel << "\n";
    } else {
        std::cout << "Modelo de detección facial no encontrado: " << faceModel << "\n";
        ok = false;
    }

    const std::string dbPath = resolve_db_path();
    try {
        affectscope::SessionStore store(dbPath);
        store.initialize();
        std::cout << "Base de datos: " << dbPath << " (" << store.session_count() << " sesiones)\n";
    } catch (const std::exception& e) {
        std::cout << "Base de datos no disponible: " << e.what() << "\n";
        ok = false;
    }

    std::cout << (ok ? "Sistema listo" : "Sistema con errores") << std::endl;
    return ok ? 0 : 1;
}

void print_summary(const affectscope::SessionResult& s) {
    using namespace affectscope;
    std::cout << "Sesión: " << s.sessionId << "\n";
    std::cout << "Perfil: " << s.config.profile.key << "\n";
    std::cout << "Frames analizados: " << s.statistics.framesAnalyzed << ", detecciones: "
              << s.statistics.totalDetections << " (descartadas " << s.statistics.droppedDetections << ")\n";
    if (s.statistics.predominant) {
        std::cout << "Emoción predominante: " << emotion_to_string(*s.statistics.predominant) << "\n";
    }
    std::cout << "Audio: " << (s.audioAvailable ? clarity_to_string(s.audio.quality) : "no disponible") << "\n";
    std::cout << "Prioridad: " << priority_to_string(s.priority) << "\n";
    for (const auto& a : s.alerts) {
        std::cout << "Alerta [" << alert_level_to_string(a.level) << "] " << a.message << "\n";
    }
    for (const auto& r : s.recommendations) {
        std::cout << "- " << r << "\n";
    }
    for (const auto& e : s.errors) {
        std::cout << "Error: " << e << "\n";
    }
    if (s.cancelled) std::cout << "Análisis interrumpido\n";
    if (!s.reports.textReportPath.empty()) {
        std::cout << "Informe: " << s.reports.textReportPath << "\n";
        std::cout << "Datos: " << s.reports.csvPath << "\n";
    }
    std::cout.flush();
}

}  // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    absl::SetProgramUsageMessage(
        "AffectScope: multimodal emotion analysis of recorded child sessions.\n\n"
        "Analyze: affectscope_cli --video=session.mp4 --diagnosis=autismo\n"
        "Check:   affectscope_cli --check");
    absl::ParseCommandLine(argc, argv);

    if (absl::GetFlag(FLAGS_check)) {
        return run_check();
    }

    const std::string video = absl::GetFlag(FLAGS_video);
    if (video.empty()) {
        std::cerr << "--video is required (or use --check)" << std::endl;
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        using namespace affectscope;
        const std::string modelsDir = resolve_models_dir();

        PipelineComponents components;
        components.scorer = load_scorer(modelsDir);
        components.frameSource = std::make_shared<io::VideoFrameSource>();
        components.faceDetector = std::make_shared<io::YuNetFaceDetector>(resolve_face_model(modelsDir));

        AudioAnalyzerOptions audioOptions;
        audioOptions.languageCode = absl::GetFlag(FLAGS_language);
        audioOptions.retry.maxAttempts = absl::GetFlag(FLAGS_stt_max_attempts);
        components.audioAnalyzer = std::make_shared<AudioAnalyzer>(
            std::make_shared<io::FfmpegAudioExtractor>(),
            std::make_shared<io::CommandSpeechToTextClient>(
                flag_or_env(absl::GetFlag(FLAGS_stt_command), "AFFECTSCOPE_STT_COMMAND", "")),
            audioOptions);

        CacheOptions cacheOptions;
        cacheOptions.ttl = std::chrono::seconds(absl::GetFlag(FLAGS_cache_ttl_s));
        components.recommendations = std::make_shared<RecommendationEngine>(
            make_recommendation_service(), std::make_shared<RecommendationCache>(cacheOptions));

        components.reportWriter = std::make_shared<ReportWriter>(absl::GetFlag(FLAGS_output_dir));
        auto store = std::make_shared<SessionStore>(resolve_db_path());
        store->initialize();
        components.store = store;

        OrchestratorOptions options;
        options.workerThreads = std::max(1, absl::GetFlag(FLAGS_worker_threads));
        StageOrchestrator orchestrator(std::move(components), options);

        SessionOverrides overrides;
        if (absl::GetFlag(FLAGS_interval_ms) > 0) overrides.frameIntervalMs = absl::GetFlag(FLAGS_interval_ms);
        if (absl::GetFlag(FLAGS_confidence_threshold) >= 0.0) {
            overrides.confidenceThreshold = absl::GetFlag(FLAGS_confidence_threshold);
        }
        if (absl::GetFlag(FLAGS_max_frames) > 0) overrides.maxFrames = absl::GetFlag(FLAGS_max_frames);

        ParticipantContext participant;
        if (absl::GetFlag(FLAGS_age_months) > 0) participant.ageMonths = absl::GetFlag(FLAGS_age_months);
        participant.notes = absl::GetFlag(FLAGS_notes);

        absl::StatusOr<SessionResult> result =
            orchestrator.run(video, absl::GetFlag(FLAGS_diagnosis), overrides, participant, &g_cancel);
        if (!result.ok()) {
            LOG(ERROR) << "Video rejected: " << result.status();
            std::cerr << "Video no válido: " << result.status().message() << std::endl;
            return 1;
        }
        print_summary(*result);
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        return 1;
    }
}
