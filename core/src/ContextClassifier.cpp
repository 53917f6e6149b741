#include "affectscope/ContextClassifier.h"

#include "affectscope/CoreContract.h"
#include "affectscope/Utility.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/strip.h>

#include <algorithm>
#include <unordered_set>

namespace affectscope {

EmotionalContext classify_emotional_context(const EmotionStatistics& stats) {
    EmotionalContext ctx;
    for (Emotion e : kAllEmotions) {
        const int n = stats.counts[emotion_index(e)];
        if (n > 0) ++ctx.distinctEmotions;
        if (is_positive(e)) {
            ctx.positiveCount += n;
        } else if (is_negative(e)) {
            ctx.negativeCount += n;
        } else {
            ctx.neutralCount += n;
        }
    }
    ctx.predominant = stats.predominant;
    ctx.predominantShare = stats.predominantShare;

    const double pos = static_cast<double>(ctx.positiveCount);
    const double neg = static_cast<double>(ctx.negativeCount);
    if (neg > contract::PATTERN_DOMINANCE_RATIO * pos) {
        ctx.pattern = EmotionalPattern::PredominioNegativo;
    } else if (pos > contract::PATTERN_DOMINANCE_RATIO * neg) {
        ctx.pattern = EmotionalPattern::PredominioPositivo;
    } else if (ctx.neutralCount > ctx.positiveCount + ctx.negativeCount) {
        ctx.pattern = EmotionalPattern::PredominioNeutral;
    } else {
        ctx.pattern = EmotionalPattern::Equilibrado;
    }

    if (stats.predominantShare > contract::STABILITY_HIGH_SHARE) {
        ctx.stability = EmotionalStability::Alta;
    } else if (stats.predominantShare > contract::STABILITY_MEDIUM_SHARE) {
        ctx.stability = EmotionalStability::Media;
    } else {
        ctx.stability = EmotionalStability::Baja;
    }

    const auto distinct = static_cast<std::size_t>(ctx.distinctEmotions);
    if (distinct <= contract::VARIABILITY_LOW_MAX) {
        ctx.variability = EmotionalVariability::Baja;
    } else if (distinct <= contract::VARIABILITY_MEDIUM_MAX) {
        ctx.variability = EmotionalVariability::Media;
    } else {
        ctx.variability = EmotionalVariability::Alta;
    }
    return ctx;
}

CommunicationLevel classify_communication_level(int attempts, int wordCount) {
    if (attempts == 0 && wordCount == 0) return CommunicationLevel::NoVerbal;
    if (attempts < contract::PRE_VERBAL_MAX_ATTEMPTS) return CommunicationLevel::PreVerbal;
    if (attempts < contract::EMERGING_VERBAL_MAX_ATTEMPTS) return CommunicationLevel::VerbalEmergente;
    return CommunicationLevel::VerbalFuncional;
}

CommunicationClarity classify_clarity(const std::string& transcript) {
    const std::size_t chars = utf8_length(transcript);
    if (chars == 0) return CommunicationClarity::Inaudible;
    if (chars < contract::CLARITY_VERY_LIMITED_CHARS) return CommunicationClarity::VeryLimited;
    if (chars < contract::CLARITY_LIMITED_CHARS) return CommunicationClarity::Limited;
    return CommunicationClarity::Clear;
}

LanguageComplexity classify_complexity(int wordCount) {
    if (wordCount == 0) return LanguageComplexity::SinLenguaje;
    if (wordCount < contract::COMPLEXITY_SIMPLE_WORDS) return LanguageComplexity::PalabrasSimples;
    if (wordCount < contract::COMPLEXITY_BASIC_WORDS) return LanguageComplexity::FrasesBasicas;
    return LanguageComplexity::LenguajeElaborado;
}

const std::vector<std::string>& early_childhood_lexicon() {
    static const std::vector<std::string> kLexicon = {
        "mama", "papa", "agua", "leche", "pan", "mas", "no", "si", "hola", "adios", "bebe", "perro",
        "gato", "casa", "pelota", "coche", "carro", "libro", "zapato", "quiero", "dame", "mio", "ya",
        "comer", "jugar", "dormir", "baño", "abrazo", "beso", "yo", "tu", "ven", "mira", "esto", "eso",
        "abuela", "abuelo", "tata", "nene", "nena", "niño", "niña", "gracias", "ayuda", "arriba",
        "abajo", "fuera", "otra", "otro", "bien", "mal", "grande", "pequeño", "caca", "pis"};
    return kLexicon;
}

namespace {

std::string normalize_word(const std::string& word) {
    absl::string_view view = word;
    // Spanish opening marks are two-byte UTF-8 sequences.
    for (bool stripped = true; stripped;) {
        stripped = absl::ConsumePrefix(&view, "¿") || absl::ConsumePrefix(&view, "¡");
    }
    while (!view.empty() && absl::ascii_ispunct(static_cast<unsigned char>(view.front()))) view.remove_prefix(1);
    while (!view.empty() && absl::ascii_ispunct(static_cast<unsigned char>(view.back()))) view.remove_suffix(1);
    return fold_case_and_accents(std::string(view));
}

}  // namespace

double vocabulary_ratio(const std::vector<std::string>& words) {
    static const std::unordered_set<std::string> kLookup(early_childhood_lexicon().begin(),
                                                         early_childhood_lexicon().end());
    int appropriate = 0;
    for (const auto& w : words) {
        if (kLookup.count(normalize_word(w)) > 0) ++appropriate;
    }
    return static_cast<double>(appropriate) / static_cast<double>(std::max<std::size_t>(words.size(), 1));
}

CommunicativeContext classify_communicative_context(const AudioResult& audio) {
    CommunicativeContext ctx;
    ctx.wordCount = audio.wordCount;
    ctx.attempts = audio.attempts;
    ctx.level = classify_communication_level(audio.attempts, audio.wordCount);
    ctx.clarity = classify_clarity(audio.transcript);
    ctx.complexity = classify_complexity(audio.wordCount);
    ctx.vocabularyRatio = vocabulary_ratio(audio.words);
    return ctx;
}

std::string pattern_to_string(EmotionalPattern pattern) {
    switch (pattern) {
        case EmotionalPattern::PredominioNegativo:
            return "predominio_negativo";
        case EmotionalPattern::PredominioPositivo:
            return "predominio_positivo";
        case EmotionalPattern::PredominioNeutral:
            return "predominio_neutral";
        case EmotionalPattern::Equilibrado:
            return "equilibrado";
    }
    return "equilibrado";
}

std::string stability_to_string(EmotionalStability stability) {
    switch (stability) {
        case EmotionalStability::Alta:
            return "alta";
        case EmotionalStability::Media:
            return "media";
        case EmotionalStability::Baja:
            return "baja";
    }
    return "baja";
}

std::string variability_to_string(EmotionalVariability variability) {
    switch (variability) {
        case EmotionalVariability::Baja:
            return "baja";
        case EmotionalVariability::Media:
            return "media";
        case EmotionalVariability::Alta:
            return "alta";
    }
    return "baja";
}

std::string communication_level_to_string(CommunicationLevel level) {
    switch (level) {
        case CommunicationLevel::NoVerbal:
            return "no_verbal";
        case CommunicationLevel::PreVerbal:
            return "pre_verbal";
        case CommunicationLevel::VerbalEmergente:
            return "verbal_emergente";
        case CommunicationLevel::VerbalFuncional:
            return "verbal_funcional";
    }
    return "no_verbal";
}

std::string complexity_to_string(LanguageComplexity complexity) {
    switch (complexity) {
        case LanguageComplexity::SinLenguaje:
            return "sin_lenguaje";
        case LanguageComplexity::PalabrasSimples:
            return "palabras_simples";
        case LanguageComplexity::FrasesBasicas:
            return "frases_basicas";
        case LanguageComplexity::LenguajeElaborado:
            return "lenguaje_elaborado";
    }
    return "sin_lenguaje";
}

}  // namespace affectscope
