#pragma once

#include "affectscope/EmotionTypes.h"

#include <cstddef>
#include <string>

namespace affectscope {

std::string emotion_to_string(Emotion emotion);
Emotion emotion_from_string(const std::string& value);

std::string clarity_to_string(CommunicationClarity clarity);
std::string alert_type_to_string(AlertType type);
std::string alert_level_to_string(AlertLevel level);
std::string priority_to_string(SessionPriority priority);
std::string diagnosis_category_to_string(DiagnosisCategory category);

// Code points in a UTF-8 string (continuation bytes are not counted).
std::size_t utf8_length(const std::string& text);

// ASCII lower-case plus the Spanish accented vowels folded to their plain
// lower-case letter; Ñ becomes ñ. Other bytes pass through unchanged.
std::string fold_case_and_accents(const std::string& text);

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace affectscope
