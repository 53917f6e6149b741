#include "affectscope/RecommendationEngine.h"

#include "affectscope/DiagnosisMatcher.h"

#include <glog/logging.h>

#include <unordered_set>

namespace affectscope {

namespace {

bool level_is(const RuleContext& c, CommunicationLevel level) {
    return c.audioAvailable && c.communicative.level == level;
}

bool predominant_is(const RuleContext& c, Emotion e) {
    return c.emotional.predominant && *c.emotional.predominant == e;
}

bool pattern_is(const RuleContext& c, EmotionalPattern p) {
    return c.totalDetections > 0 && c.emotional.pattern == p;
}

}  // namespace

const std::vector<std::string>& diagnosis_recommendations(DiagnosisCategory category) {
    static const std::vector<std::string> kAutism = {
        "Mantener rutinas estructuradas y anticipar los cambios con apoyos visuales.",
        "Reducir los estímulos sensoriales intensos durante las actividades."};
    static const std::vector<std::string> kAdhd = {
        "Dividir las tareas en pasos cortos con pausas activas frecuentes.",
        "Reforzar de inmediato las conductas de atención sostenida."};
    static const std::vector<std::string> kDown = {
        "Favorecer el aprendizaje con apoyos visuales y repetición.",
        "Estimular la comunicación con juegos de imitación y canciones."};
    static const std::vector<std::string> kCerebralPalsy = {
        "Adaptar la postura y el entorno para facilitar la expresión facial y gestual.",
        "Coordinar las actividades con el equipo de fisioterapia."};
    static const std::vector<std::string> kIntellectual = {
        "Presentar las instrucciones de una en una con lenguaje sencillo.",
        "Reforzar los logros con retroalimentación positiva inmediata."};
    static const std::vector<std::string> kNone;

    switch (category) {
        case DiagnosisCategory::Autism:
            return kAutism;
        case DiagnosisCategory::Adhd:
            return kAdhd;
        case DiagnosisCategory::DownSyndrome:
            return kDown;
        case DiagnosisCategory::CerebralPalsy:
            return kCerebralPalsy;
        case DiagnosisCategory::IntellectualDisability:
            return kIntellectual;
        case DiagnosisCategory::Default:
            return kNone;
    }
    return kNone;
}

const std::vector<RecommendationRule>& emotional_rules() {
    static const std::vector<RecommendationRule> kRules = {
        {"tristeza_predominante",
         [](const RuleContext& c) { return predominant_is(c, Emotion::Sad); },
         {"Se detectó tristeza frecuente; se recomienda acompañamiento emocional cercano."}},
        {"enojo_predominante",
         [](const RuleContext& c) { return predominant_is(c, Emotion::Angry); },
         {"Se observó enojo predominante; identificar los desencadenantes y ofrecer estrategias de regulación."}},
        {"miedo_predominante",
         [](const RuleContext& c) { return predominant_is(c, Emotion::Fear); },
         {"Se detectó miedo recurrente; proporcionar un entorno seguro y predecible."}},
        {"patron_negativo",
         [](const RuleContext& c) { return pattern_is(c, EmotionalPattern::PredominioNegativo); },
         {"Predominan las emociones negativas; revisar el entorno y las rutinas del niño."}},
        {"patron_positivo",
         [](const RuleContext& c) { return pattern_is(c, EmotionalPattern::PredominioPositivo); },
         {"Predominan las emociones positivas; mantener las actividades que las favorecen."}},
        {"variabilidad_alta",
         [](const RuleContext& c) {
             return c.emotional.variability == EmotionalVariability::Alta &&
                    c.emotional.stability == EmotionalStability::Baja;
         },
         {"Alta variabilidad emocional; registrar los cambios de estado a lo largo del día."}},
        {"sin_detecciones",
         [](const RuleContext& c) { return c.totalDetections == 0; },
         {"No se detectaron rostros con suficiente confianza; repetir la grabación con mejor iluminación y encuadre."}},
    };
    return kRules;
}

const std::vector<RecommendationRule>& communicative_rules() {
    static const std::vector<RecommendationRule> kRules = {
        {"no_verbal",
         [](const RuleContext& c) { return level_is(c, CommunicationLevel::NoVerbal); },
         {"Introducir sistemas aumentativos y alternativos de comunicación (SAAC) con pictogramas.",
          "Responder a gestos, miradas y vocalizaciones como intentos comunicativos."}},
        {"pre_verbal",
         [](const RuleContext& c) { return level_is(c, CommunicationLevel::PreVerbal); },
         {"Baja frecuencia de intentos verbales, se sugiere estimular comunicación verbal."}},
        {"verbal_emergente",
         [](const RuleContext& c) { return level_is(c, CommunicationLevel::VerbalEmergente); },
         {"Ampliar el vocabulario con juegos de nombrar objetos y acciones cotidianas."}},
        {"claridad_reducida",
         [](const RuleContext& c) {
             return c.audioAvailable && (c.communicative.clarity == CommunicationClarity::VeryLimited ||
                                         c.communicative.clarity == CommunicationClarity::Limited);
         },
         {"Modelar frases cortas y claras para favorecer la articulación."}},
        {"vocabulario_edad",
         [](const RuleContext& c) {
             return c.audioAvailable && c.communicative.wordCount > 0 && c.communicative.vocabularyRatio < 0.3;
         },
         {"Incorporar vocabulario funcional propio de la edad en las rutinas diarias."}},
    };
    return kRules;
}

const std::vector<RecommendationRule>& integrated_rules() {
    static const std::vector<RecommendationRule> kRules = {
        {"frustracion_comunicativa",
         [](const RuleContext& c) {
             return pattern_is(c, EmotionalPattern::PredominioNegativo) && level_is(c, CommunicationLevel::NoVerbal);
         },
         {"La combinación de emociones negativas y ausencia de lenguaje oral puede reflejar frustración "
          "comunicativa; ofrecer alternativas para expresar necesidades."}},
        {"acompanar_intentos",
         [](const RuleContext& c) {
             return pattern_is(c, EmotionalPattern::PredominioNegativo) && level_is(c, CommunicationLevel::PreVerbal);
         },
         {"Validar las emociones del niño y acompañar cada intento comunicativo con refuerzo positivo."}},
        {"bienestar_verbal",
         [](const RuleContext& c) {
             return pattern_is(c, EmotionalPattern::PredominioPositivo) &&
                    level_is(c, CommunicationLevel::VerbalFuncional);
         },
         {"Aprovechar los momentos de bienestar para conversar y ampliar la expresión verbal."}},
    };
    return kRules;
}

const std::vector<std::string>& default_recommendations() {
    static const std::vector<std::string> kDefaults = {
        "Continuar con la observación regular del niño en distintos contextos.",
        "Mantener una comunicación cercana con la familia y el equipo terapéutico."};
    return kDefaults;
}

std::vector<std::string> deduplicate(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (seen.insert(item).second) {
            out.push_back(item);
        }
    }
    return out;
}

RecommendationEngine::RecommendationEngine(std::shared_ptr<RecommendationService> service,
                                           std::shared_ptr<RecommendationCache> cache,
                                           RetryPolicy retry,
                                           Sleeper sleeper)
    : service_(std::move(service)),
      cache_(std::move(cache)),
      retry_(retry),
      sleeper_(std::move(sleeper)) {}

std::vector<std::string> RecommendationEngine::generate(const std::string& diagnosis,
                                                        const EmotionStatistics& stats,
                                                        const AudioResult& audio,
                                                        bool audioAvailable) const {
    RuleContext ctx;
    ctx.category = match_diagnosis(diagnosis);
    ctx.emotional = classify_emotional_context(stats);
    ctx.communicative = classify_communicative_context(audio);
    ctx.audioAvailable = audioAvailable;
    ctx.totalDetections = stats.totalDetections;

    std::vector<std::string> fired = diagnosis_recommendations(ctx.category);
    for (const auto* table : {&emotional_rules(), &communicative_rules(), &integrated_rules()}) {
        for (const auto& rule : *table) {
            if (rule.applies(ctx)) {
                VLOG(1) << "Recommendation rule fired: " << rule.name;
                fired.insert(fired.end(), rule.recommendations.begin(), rule.recommendations.end());
            }
        }
    }

    std::vector<std::string> out = deduplicate(fired);
    if (out.empty()) {
        out = default_recommendations();
    }
    return out;
}

absl::StatusOr<std::vector<std::string>> RecommendationEngine::contextual(const std::string& diagnosis,
                                                                         const ParticipantContext& userContext,
                                                                         const EmotionStatistics& stats,
                                                                         const AudioResult& audio,
                                                                         bool audioAvailable) const {
    if (!service_) {
        return absl::FailedPreconditionError("No recommendation service configured");
    }

    const EmotionSummary emotionSummary = summarize_emotions(stats);
    const AudioSummary audioSummary = summarize_audio(audio, audioAvailable);
    const std::string key = recommendation_cache_key(diagnosis, userContext, emotionSummary, audioSummary);

    if (cache_) {
        if (auto cached = cache_->get(key)) {
            VLOG(1) << "Recommendation cache hit " << key;
            return deduplicate(flatten(*cached));
        }
    }

    absl::StatusOr<StructuredRecommendations> response = retry_with_backoff<StructuredRecommendations>(
        retry_, sleeper_, "Recommendation service",
        [&]() { return service_->get_recommendations(diagnosis, userContext, emotionSummary, audioSummary); });
    if (!response.ok()) {
        return response.status();
    }
    if (cache_) {
        cache_->put(key, *response);
    }
    return deduplicate(flatten(*response));
}

}  // namespace affectscope
