#pragma once

#include "affectscope/CoreContract.h"
#include "affectscope/EmotionTypes.h"

#include <chrono>
#include <vector>

namespace affectscope {

struct AlertThresholds {
    double negativeShare{contract::NEGATIVE_SHARE_ALERT};
    double alertEmotionShare{contract::ALERT_EMOTION_SHARE};
    int limitedCommunicationAttempts{contract::LIMITED_COMMUNICATION_ATTEMPTS};
    int technicalErrorCount{contract::TECHNICAL_ERROR_COUNT};
};

/**
 * AlertEvaluator: pure alert table over one session's outcome.
 *
 *   negative share > negativeShare              -> emotional / alto
 *   each profile alert emotion > share          -> diagnosis_specific / medio
 *   no_verbal                                   -> communication / alto
 *   pre_verbal and attempts < limit             -> communication / medio
 *   stage errors > technicalErrorCount          -> technical / medio
 *
 * Communication rows are skipped when the audio stage failed.
 */
class AlertEvaluator {
  public:
    explicit AlertEvaluator(AlertThresholds thresholds = {});

    std::vector<Alert> evaluate(const EmotionStatistics& stats,
                                const AudioResult& audio,
                                bool audioAvailable,
                                int stageErrorCount,
                                const DiagnosisProfile& profile,
                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    const AlertThresholds& thresholds() const { return thresholds_; }

  private:
    AlertThresholds thresholds_;
};

// critico if any alto, else moderado if any medio, else normal.
SessionPriority derive_priority(const std::vector<Alert>& alerts);

}  // namespace affectscope
