#include "affectscope/Utility.h"

#include <cctype>
#include <ctime>
#include <stdexcept>

namespace affectscope {

std::string emotion_to_string(Emotion emotion) {
    switch (emotion) {
        case Emotion::Angry:
            return "Angry";
        case Emotion::Disgust:
            return "Disgust";
        case Emotion::Fear:
            return "Fear";
        case Emotion::Happy:
            return "Happy";
        case Emotion::Sad:
            return "Sad";
        case Emotion::Surprise:
            return "Surprise";
        case Emotion::Neutral:
            return "Neutral";
    }
    return "Neutral";
}

Emotion emotion_from_string(const std::string& value) {
    for (Emotion e : kAllEmotions) {
        if (emotion_to_string(e) == value) {
            return e;
        }
    }
    throw std::runtime_error("Unknown emotion label: " + value);
}

std::string clarity_to_string(CommunicationClarity clarity) {
    switch (clarity) {
        case CommunicationClarity::Inaudible:
            return "inaudible";
        case CommunicationClarity::VeryLimited:
            return "muy_limitada";
        case CommunicationClarity::Limited:
            return "limitada";
        case CommunicationClarity::Clear:
            return "clara";
    }
    return "inaudible";
}

std::string alert_type_to_string(AlertType type) {
    switch (type) {
        case AlertType::Emotional:
            return "emotional";
        case AlertType::DiagnosisSpecific:
            return "diagnosis_specific";
        case AlertType::Communication:
            return "communication";
        case AlertType::Technical:
            return "technical";
    }
    return "technical";
}

std::string alert_level_to_string(AlertLevel level) {
    switch (level) {
        case AlertLevel::Alto:
            return "alto";
        case AlertLevel::Medio:
            return "medio";
        case AlertLevel::Bajo:
            return "bajo";
    }
    return "bajo";
}

std::string priority_to_string(SessionPriority priority) {
    switch (priority) {
        case SessionPriority::Normal:
            return "normal";
        case SessionPriority::Moderado:
            return "moderado";
        case SessionPriority::Critico:
            return "critico";
    }
    return "normal";
}

std::string diagnosis_category_to_string(DiagnosisCategory category) {
    switch (category) {
        case DiagnosisCategory::Default:
            return "default";
        case DiagnosisCategory::Autism:
            return "autismo";
        case DiagnosisCategory::Adhd:
            return "tdah";
        case DiagnosisCategory::DownSyndrome:
            return "sindrome_down";
        case DiagnosisCategory::CerebralPalsy:
            return "paralisis_cerebral";
        case DiagnosisCategory::IntellectualDisability:
            return "discapacidad_intelectual";
    }
    return "default";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

std::string fold_case_and_accents(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xC3 && i + 1 < text.size()) {
            // Latin-1 supplement, second byte of U+00C0..U+00FF
            switch (static_cast<unsigned char>(text[i + 1])) {
                case 0x81: case 0xA1: out += 'a'; ++i; continue;  // Á á
                case 0x89: case 0xA9: out += 'e'; ++i; continue;  // É é
                case 0x8D: case 0xAD: out += 'i'; ++i; continue;  // Í í
                case 0x93: case 0xB3: out += 'o'; ++i; continue;  // Ó ó
                case 0x9A: case 0xBA:                             // Ú ú
                case 0x9C: case 0xBC: out += 'u'; ++i; continue;  // Ü ü
                case 0x91: out += "\xC3\xB1"; ++i; continue;      // Ñ
                default: break;
            }
        }
        out += (c < 0x80) ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    }
    return out;
}

std::size_t utf8_length(const std::string& text) {
    std::size_t count = 0;
    for (const unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace affectscope
