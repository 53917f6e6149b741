#include "affectscope/AlertEvaluator.h"

#include "affectscope/ContextClassifier.h"
#include "affectscope/Statistics.h"
#include "affectscope/Utility.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace affectscope {

namespace {

Alert make_alert(AlertType type, AlertLevel level, std::string message, std::string recommendation,
                 std::chrono::system_clock::time_point now) {
    Alert a;
    a.type = type;
    a.level = level;
    a.message = std::move(message);
    a.recommendation = std::move(recommendation);
    a.timestamp = now;
    return a;
}

std::string percent(double share) { return absl::StrFormat("%.1f%%", share * 100.0); }

}  // namespace

AlertEvaluator::AlertEvaluator(AlertThresholds thresholds) : thresholds_(thresholds) {}

std::vector<Alert> AlertEvaluator::evaluate(const EmotionStatistics& stats,
                                            const AudioResult& audio,
                                            bool audioAvailable,
                                            int stageErrorCount,
                                            const DiagnosisProfile& profile,
                                            std::chrono::system_clock::time_point now) const {
    std::vector<Alert> alerts;

    const double negShare = negative_share(stats);
    if (negShare > thresholds_.negativeShare) {
        alerts.push_back(make_alert(AlertType::Emotional, AlertLevel::Alto,
                                    absl::StrCat("Emociones negativas en el ", percent(negShare),
                                                 " de las detecciones"),
                                    "Revisar el bienestar emocional del niño y consultar con el equipo terapéutico.",
                                    now));
    }

    for (Emotion e : profile.alertEmotions) {
        const double share = emotion_share(stats, e);
        if (share > thresholds_.alertEmotionShare) {
            alerts.push_back(make_alert(AlertType::DiagnosisSpecific, AlertLevel::Medio,
                                        absl::StrCat(emotion_to_string(e), " en el ", percent(share),
                                                     " de las detecciones (perfil ", profile.key, ")"),
                                        "Observar los desencadenantes de esta emoción durante las actividades.",
                                        now));
        }
    }

    if (audioAvailable) {
        const CommunicationLevel level = classify_communication_level(audio.attempts, audio.wordCount);
        if (level == CommunicationLevel::NoVerbal) {
            alerts.push_back(make_alert(AlertType::Communication, AlertLevel::Alto,
                                        "No se detectó comunicación verbal en la sesión",
                                        "Evaluar la incorporación de sistemas aumentativos de comunicación.", now));
        } else if (level == CommunicationLevel::PreVerbal && audio.attempts < thresholds_.limitedCommunicationAttempts) {
            alerts.push_back(make_alert(AlertType::Communication, AlertLevel::Medio,
                                        absl::StrCat("Comunicación verbal limitada (", audio.attempts, " intento(s))"),
                                        "Estimular los intentos verbales con juegos de interacción.", now));
        }
    }

    if (stageErrorCount > thresholds_.technicalErrorCount) {
        alerts.push_back(make_alert(AlertType::Technical, AlertLevel::Medio,
                                    absl::StrCat(stageErrorCount, " etapas del análisis fallaron"),
                                    "Revisar la calidad del video y la configuración del sistema.", now));
    }
    return alerts;
}

SessionPriority derive_priority(const std::vector<Alert>& alerts) {
    SessionPriority priority = SessionPriority::Normal;
    for (const auto& a : alerts) {
        if (a.level == AlertLevel::Alto) return SessionPriority::Critico;
        if (a.level == AlertLevel::Medio) priority = SessionPriority::Moderado;
    }
    return priority;
}

}  // namespace affectscope
