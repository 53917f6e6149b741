#pragma once

#include "affectscope/EmotionTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace affectscope {

// ========== Emotional context ==========
enum class EmotionalPattern {
    PredominioNegativo,
    PredominioPositivo,
    PredominioNeutral,
    Equilibrado
};

enum class EmotionalStability { Alta, Media, Baja };

enum class EmotionalVariability { Baja, Media, Alta };

struct EmotionalContext {
    EmotionalPattern pattern{EmotionalPattern::Equilibrado};
    EmotionalStability stability{EmotionalStability::Baja};
    EmotionalVariability variability{EmotionalVariability::Baja};
    int positiveCount{0};
    int negativeCount{0};
    int neutralCount{0};
    int distinctEmotions{0};
    std::optional<Emotion> predominant;
    double predominantShare{0.0};
};

/**
 * Pattern checks run in order: negative > 1.5 x positive, positive > 1.5 x
 * negative, neutral > positive + negative, otherwise balanced. With no
 * detections at all the pattern is balanced and stability low.
 */
EmotionalContext classify_emotional_context(const EmotionStatistics& stats);

// ========== Communicative context ==========
enum class CommunicationLevel {
    NoVerbal,
    PreVerbal,
    VerbalEmergente,
    VerbalFuncional
};

enum class LanguageComplexity {
    SinLenguaje,
    PalabrasSimples,
    FrasesBasicas,
    LenguajeElaborado
};

struct CommunicativeContext {
    CommunicationLevel level{CommunicationLevel::NoVerbal};
    CommunicationClarity clarity{CommunicationClarity::Inaudible};
    LanguageComplexity complexity{LanguageComplexity::SinLenguaje};
    double vocabularyRatio{0.0};   // age-appropriate words / max(words, 1)
    int wordCount{0};
    int attempts{0};
};

CommunicationLevel classify_communication_level(int attempts, int wordCount);
CommunicationClarity classify_clarity(const std::string& transcript);
LanguageComplexity classify_complexity(int wordCount);

// Fixed early-childhood Spanish lexicon, in fold_case_and_accents() form.
const std::vector<std::string>& early_childhood_lexicon();
double vocabulary_ratio(const std::vector<std::string>& words);

CommunicativeContext classify_communicative_context(const AudioResult& audio);

std::string pattern_to_string(EmotionalPattern pattern);
std::string stability_to_string(EmotionalStability stability);
std::string variability_to_string(EmotionalVariability variability);
std::string communication_level_to_string(CommunicationLevel level);
std::string complexity_to_string(LanguageComplexity complexity);

}  // namespace affectscope
