#pragma once

#include "affectscope/ContextClassifier.h"
#include "affectscope/EmotionTypes.h"
#include "affectscope/RecommendationCache.h"
#include "affectscope/RecommendationService.h"
#include "affectscope/Retry.h"

#include <absl/status/statusor.h>

#include <memory>
#include <string>
#include <vector>

namespace affectscope {

// Everything a rule predicate may look at.
struct RuleContext {
    DiagnosisCategory category{DiagnosisCategory::Default};
    EmotionalContext emotional;
    CommunicativeContext communicative;
    bool audioAvailable{true};
    int totalDetections{0};
};

struct RecommendationRule {
    const char* name;
    bool (*applies)(const RuleContext& ctx);
    std::vector<std::string> recommendations;
};

// Static rule tables, evaluated in this order.
const std::vector<std::string>& diagnosis_recommendations(DiagnosisCategory category);
const std::vector<RecommendationRule>& emotional_rules();
const std::vector<RecommendationRule>& communicative_rules();
const std::vector<RecommendationRule>& integrated_rules();

// Diagnosis-agnostic list returned when no rule fires.
const std::vector<std::string>& default_recommendations();

// Exact-string dedup keeping first-seen order.
std::vector<std::string> deduplicate(const std::vector<std::string>& items);

/**
 * RecommendationEngine
 *
 * generate(): rule-based guidance from emotions and audio only. Never empty,
 * never contains the same string twice.
 *
 * contextual(): asks the injected RecommendationService through the shared
 * cache. The service call happens outside any cache lock and transient
 * failures are retried with backoff. Errors are never cached.
 */
class RecommendationEngine {
  public:
    RecommendationEngine(std::shared_ptr<RecommendationService> service,
                         std::shared_ptr<RecommendationCache> cache,
                         RetryPolicy retry = {},
                         Sleeper sleeper = thread_sleeper());

    std::vector<std::string> generate(const std::string& diagnosis,
                                      const EmotionStatistics& stats,
                                      const AudioResult& audio,
                                      bool audioAvailable = true) const;

    absl::StatusOr<std::vector<std::string>> contextual(const std::string& diagnosis,
                                                        const ParticipantContext& userContext,
                                                        const EmotionStatistics& stats,
                                                        const AudioResult& audio,
                                                        bool audioAvailable = true) const;

  private:
    std::shared_ptr<RecommendationService> service_;
    std::shared_ptr<RecommendationCache> cache_;
    RetryPolicy retry_;
    Sleeper sleeper_;
};

}  // namespace affectscope
