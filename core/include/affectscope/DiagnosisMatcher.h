#pragma once

#include "affectscope/EmotionTypes.h"

#include <string>
#include <vector>

namespace affectscope {

/**
 * Diagnosis matching shared by config resolution and the recommendation engine.
 *
 * The matcher table is ordered; the first category whose keyword set occurs
 * anywhere in the free-text diagnosis wins. Both sides are compared after
 * fold_case_and_accents(), so "PARÁLISIS" matches "paralisis". Abbreviations
 * that are also common syllables ("tea") must match a whole word.
 * Unmatched or empty text maps to DiagnosisCategory::Default.
 */
struct DiagnosisMatcher {
    DiagnosisCategory category;
    std::vector<std::string> keywords;   // folded, substring match
    std::vector<std::string> words;      // folded, whole-word match
};

const std::vector<DiagnosisMatcher>& diagnosis_matchers();

DiagnosisCategory match_diagnosis(const std::string& diagnosis);

// Profile table lookup; every category has exactly one profile.
const DiagnosisProfile& profile_for(DiagnosisCategory category);

/**
 * Resolve the configuration for one session (pure).
 *
 * default profile -> first matching diagnosis profile -> caller overrides.
 */
SessionConfig resolve_session_config(const std::string& diagnosis, const SessionOverrides& overrides);

}  // namespace affectscope
