#pragma once

#include "affectscope/EmotionTypes.h"

#include <absl/status/statusor.h>

#include <optional>
#include <string>
#include <vector>

namespace affectscope {

struct EmotionSummary {
    std::optional<Emotion> predominant;
    double predominantShare{0.0};
    double negativeShare{0.0};
    int totalDetections{0};
};

struct AudioSummary {
    bool available{false};
    int wordCount{0};
    int attempts{0};
    CommunicationClarity quality{CommunicationClarity::Inaudible};
};

struct StructuredRecommendations {
    std::vector<std::string> immediateActions;
    std::vector<std::string> strategies;
    std::vector<std::string> activities;
};

// Immediate actions, then strategies, then activities.
std::vector<std::string> flatten(const StructuredRecommendations& recs);

EmotionSummary summarize_emotions(const EmotionStatistics& stats);
AudioSummary summarize_audio(const AudioResult& audio, bool available);

/**
 * RecommendationService: contextual recommendation backend.
 * Transient failures should be reported as Unavailable / DeadlineExceeded.
 */
class RecommendationService {
  public:
    virtual ~RecommendationService() = default;

    virtual absl::StatusOr<StructuredRecommendations> get_recommendations(const std::string& diagnosis,
                                                                          const ParticipantContext& userContext,
                                                                          const EmotionSummary& emotionSummary,
                                                                          const AudioSummary& audioSummary) = 0;
};

/// Built-in simulation used when no remote service is configured.
class LocalRecommendationService : public RecommendationService {
  public:
    absl::StatusOr<StructuredRecommendations> get_recommendations(const std::string& diagnosis,
                                                                  const ParticipantContext& userContext,
                                                                  const EmotionSummary& emotionSummary,
                                                                  const AudioSummary& audioSummary) override;
};

}  // namespace affectscope
