#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace affectscope {

// ========== Emotion labels ==========
// Order matches the output layer of the FER-2013 family of models.
enum class Emotion {
    Angry = 0,
    Disgust = 1,
    Fear = 2,
    Happy = 3,
    Sad = 4,
    Surprise = 5,
    Neutral = 6
};

constexpr std::size_t kEmotionCount = 7;

constexpr std::array<Emotion, kEmotionCount> kAllEmotions = {
    Emotion::Angry, Emotion::Disgust, Emotion::Fear, Emotion::Happy,
    Emotion::Sad,   Emotion::Surprise, Emotion::Neutral};

inline std::size_t emotion_index(Emotion e) { return static_cast<std::size_t>(e); }

inline bool is_negative(Emotion e) {
    return e == Emotion::Sad || e == Emotion::Angry || e == Emotion::Fear || e == Emotion::Disgust;
}

inline bool is_positive(Emotion e) { return e == Emotion::Happy || e == Emotion::Surprise; }

// Probabilities indexed by emotion_index(); sums to 1 (±1e-6).
using EmotionDistribution = std::array<double, kEmotionCount>;

using EmotionCounts = std::array<int, kEmotionCount>;

// ========== Face detection ==========
struct BoundingBox {
    int x{0};
    int y{0};
    int width{0};
    int height{0};
};

struct FaceDetection {
    BoundingBox box;
    int64_t frameId{0};
    EmotionDistribution distribution{};
    Emotion label{Emotion::Neutral};
    double confidence{0.0};        // distribution[label]
    double quality{0.0};           // detector score in [0,1]
    bool fromFallback{false};      // produced by the image-statistics heuristic
};

struct FrameResult {
    int64_t frameId{0};
    double timestampSeconds{0.0};
    std::vector<FaceDetection> faces;  // detection order within this frame
};

// ========== Ensemble configuration ==========
struct InputShape {
    int height{0};
    int width{0};
    int channels{1};
    int rank{4};                   // 2 = HxW, 3 = HxWxC, 4 = NCHW blob
};

inline bool operator==(const InputShape& a, const InputShape& b) {
    return a.height == b.height && a.width == b.width && a.channels == b.channels && a.rank == b.rank;
}
inline bool operator!=(const InputShape& a, const InputShape& b) { return !(a == b); }

struct ModelDescriptor {
    std::string name;
    std::string artifactPath;
    double weight{1.0};            // (0,1]
    InputShape inputShape;
};

struct EnsembleConfig {
    std::vector<ModelDescriptor> models;
};

// ========== Diagnosis profiles ==========
enum class DiagnosisCategory {
    Default,
    Autism,
    Adhd,
    DownSyndrome,
    CerebralPalsy,
    IntellectualDisability
};

struct DiagnosisProfile {
    DiagnosisCategory category{DiagnosisCategory::Default};
    std::string key;               // "default", "autismo", ...
    int frameIntervalMs{1000};
    double confidenceThreshold{0.5};
    std::vector<Emotion> priorityEmotions;
    std::vector<Emotion> alertEmotions;
};

// Caller overrides; any engaged field wins over the matched profile.
struct SessionOverrides {
    std::optional<int> frameIntervalMs;
    std::optional<double> confidenceThreshold;
    std::optional<std::vector<Emotion>> priorityEmotions;
    std::optional<std::vector<Emotion>> alertEmotions;
    std::optional<int> maxFrames;
};

struct SessionConfig {
    std::string diagnosis;         // raw caller text, may be empty
    DiagnosisProfile profile;
    int maxFrames{0};              // 0 = unlimited
};

// Free-form participant context forwarded to the recommendation service and report.
struct ParticipantContext {
    std::optional<int> ageMonths;
    std::string notes;
};

// ========== Audio ==========
enum class CommunicationClarity {
    Inaudible,
    VeryLimited,
    Limited,
    Clear
};

struct AudioSegmentResult {
    double startSeconds{0.0};
    double endSeconds{0.0};
    std::string transcript;
    int wordCount{0};
    int attempts{0};
    CommunicationClarity quality{CommunicationClarity::Inaudible};
};

struct AudioResult {
    std::string languageCode;
    std::string transcript;
    std::vector<std::string> words;
    int wordCount{0};
    int attempts{0};               // words longer than one character
    std::vector<AudioSegmentResult> segments;
    CommunicationClarity quality{CommunicationClarity::Inaudible};
};

// ========== Statistics ==========
struct ConfidenceSummary {
    double mean{0.0};
    double median{0.0};
    double stddev{0.0};
    double min{0.0};
    double max{0.0};
    int count{0};
};

struct EmotionStatistics {
    EmotionCounts counts{};
    int totalDetections{0};        // after filtering
    int droppedDetections{0};      // removed by the confidence threshold
    int framesAnalyzed{0};
    int framesWithFaces{0};        // after filtering
    std::optional<Emotion> predominant;
    double predominantShare{0.0};  // [0,1]
    std::array<ConfidenceSummary, kEmotionCount> confidence{};
};

// ========== Alerts ==========
enum class AlertType {
    Emotional,
    DiagnosisSpecific,
    Communication,
    Technical
};

enum class AlertLevel {
    Alto,
    Medio,
    Bajo
};

struct Alert {
    AlertType type{AlertType::Technical};
    AlertLevel level{AlertLevel::Bajo};
    std::string message;
    std::string recommendation;
    std::chrono::system_clock::time_point timestamp;
};

enum class SessionPriority {
    Normal,
    Moderado,
    Critico
};

// ========== Session ==========
struct ReportArtifacts {
    std::string textReportPath;
    std::string csvPath;
};

struct SessionResult {
    std::string sessionId;
    std::string videoPath;
    SessionConfig config;
    ParticipantContext participant;
    std::vector<FrameResult> rawFrames;       // ordered by frameId
    std::vector<FrameResult> filteredFrames;  // ordered by frameId
    EmotionStatistics statistics;
    AudioResult audio;
    bool audioAvailable{false};
    std::vector<Alert> alerts;
    std::vector<std::string> recommendations;
    std::vector<std::string> completedStages;
    std::vector<std::string> errors;
    SessionPriority priority{SessionPriority::Normal};
    bool cancelled{false};
    ReportArtifacts reports;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
};

}  // namespace affectscope
