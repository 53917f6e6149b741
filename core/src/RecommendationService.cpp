#include "affectscope/RecommendationService.h"

#include "affectscope/ContextClassifier.h"
#include "affectscope/DiagnosisMatcher.h"
#include "affectscope/Statistics.h"

#include <glog/logging.h>

namespace affectscope {

std::vector<std::string> flatten(const StructuredRecommendations& recs) {
    std::vector<std::string> out;
    out.reserve(recs.immediateActions.size() + recs.strategies.size() + recs.activities.size());
    out.insert(out.end(), recs.immediateActions.begin(), recs.immediateActions.end());
    out.insert(out.end(), recs.strategies.begin(), recs.strategies.end());
    out.insert(out.end(), recs.activities.begin(), recs.activities.end());
    return out;
}

EmotionSummary summarize_emotions(const EmotionStatistics& stats) {
    EmotionSummary s;
    s.predominant = stats.predominant;
    s.predominantShare = stats.predominantShare;
    s.negativeShare = negative_share(stats);
    s.totalDetections = stats.totalDetections;
    return s;
}

AudioSummary summarize_audio(const AudioResult& audio, bool available) {
    AudioSummary s;
    s.available = available;
    s.wordCount = audio.wordCount;
    s.attempts = audio.attempts;
    s.quality = audio.quality;
    return s;
}

absl::StatusOr<StructuredRecommendations> LocalRecommendationService::get_recommendations(
    const std::string& diagnosis,
    const ParticipantContext& userContext,
    const EmotionSummary& emotionSummary,
    const AudioSummary& audioSummary) {
    StructuredRecommendations recs;

    if (emotionSummary.negativeShare > 0.5) {
        recs.immediateActions.push_back("Ofrecer un espacio tranquilo y acompañamiento del adulto de referencia.");
    }
    if (emotionSummary.predominant == Emotion::Fear) {
        recs.immediateActions.push_back("Anticipar verbal y visualmente cada cambio de actividad.");
    }
    if (audioSummary.available &&
        classify_communication_level(audioSummary.attempts, audioSummary.wordCount) == CommunicationLevel::NoVerbal) {
        recs.immediateActions.push_back("Ofrecer opciones con pictogramas para que el niño pueda elegir.");
    }

    switch (match_diagnosis(diagnosis)) {
        case DiagnosisCategory::Autism:
            recs.strategies.push_back("Usar agendas visuales para estructurar la sesión.");
            recs.activities.push_back("Juego de turnos con objetos de interés del niño.");
            break;
        case DiagnosisCategory::Adhd:
            recs.strategies.push_back("Alternar actividades cortas con movimiento.");
            recs.activities.push_back("Circuitos motores con consignas de una sola instrucción.");
            break;
        case DiagnosisCategory::DownSyndrome:
            recs.strategies.push_back("Acompañar las palabras con signos y gestos.");
            recs.activities.push_back("Canciones con gestos para nombrar partes del cuerpo.");
            break;
        case DiagnosisCategory::CerebralPalsy:
            recs.strategies.push_back("Asegurar una postura cómoda antes de iniciar la actividad.");
            recs.activities.push_back("Juegos de causa y efecto con pulsadores adaptados.");
            break;
        case DiagnosisCategory::IntellectualDisability:
            recs.strategies.push_back("Dividir cada tarea en pasos concretos y secuenciados.");
            recs.activities.push_back("Clasificación de objetos cotidianos por color y forma.");
            break;
        case DiagnosisCategory::Default:
            recs.strategies.push_back("Reforzar positivamente la participación en cada actividad.");
            recs.activities.push_back("Juego libre guiado con materiales sensoriales.");
            break;
    }

    if (userContext.ageMonths && *userContext.ageMonths < 36) {
        recs.activities.push_back("Lectura compartida de cuentos con imágenes grandes.");
    }

    VLOG(1) << "Local recommendation service produced " << flatten(recs).size() << " item(s)";
    return recs;
}

}  // namespace affectscope
