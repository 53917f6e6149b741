#include "affectscope/DiagnosisMatcher.h"

#include "affectscope/Utility.h"

#include <absl/strings/match.h>
#include <absl/strings/str_split.h>
#include <absl/strings/string_view.h>

#include <algorithm>

namespace affectscope {

namespace {

std::vector<DiagnosisProfile> build_profiles() {
    std::vector<DiagnosisProfile> profiles;

    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::Default, "default", 1000, 0.5,
        {Emotion::Happy, Emotion::Sad, Emotion::Angry},
        {Emotion::Angry, Emotion::Fear}});

    // Shorter interval: short-lived expressions and sensory overload episodes.
    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::Autism, "autismo", 500, 0.4,
        {Emotion::Fear, Emotion::Angry, Emotion::Surprise, Emotion::Neutral},
        {Emotion::Fear, Emotion::Angry}});

    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::Adhd, "tdah", 500, 0.5,
        {Emotion::Angry, Emotion::Surprise, Emotion::Happy},
        {Emotion::Angry}});

    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::DownSyndrome, "sindrome_down", 1000, 0.45,
        {Emotion::Happy, Emotion::Sad, Emotion::Neutral},
        {Emotion::Sad}});

    // Facial motor involvement lowers classifier confidence across the board.
    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::CerebralPalsy, "paralisis_cerebral", 1000, 0.4,
        {Emotion::Sad, Emotion::Fear, Emotion::Neutral},
        {Emotion::Sad, Emotion::Fear}});

    profiles.push_back(DiagnosisProfile{
        DiagnosisCategory::IntellectualDisability, "discapacidad_intelectual", 1000, 0.45,
        {Emotion::Sad, Emotion::Fear, Emotion::Happy},
        {Emotion::Fear}});

    return profiles;
}

}  // namespace

const std::vector<DiagnosisMatcher>& diagnosis_matchers() {
    static const std::vector<DiagnosisMatcher> matchers = {
        {DiagnosisCategory::Autism, {"autis", "asperger", "espectro autista"}, {"tea", "asd"}},
        {DiagnosisCategory::Adhd, {"tdah", "tdha", "hiperactiv", "deficit de atenc", "adhd"}, {}},
        {DiagnosisCategory::DownSyndrome, {"down", "trisomia"}, {}},
        {DiagnosisCategory::CerebralPalsy, {"paralisis cerebral"}, {}},
        {DiagnosisCategory::IntellectualDisability, {"intelectual", "cognitiv"}, {}},
    };
    return matchers;
}

DiagnosisCategory match_diagnosis(const std::string& diagnosis) {
    if (diagnosis.empty()) return DiagnosisCategory::Default;
    const std::string folded = fold_case_and_accents(diagnosis);
    const std::vector<absl::string_view> tokens =
        absl::StrSplit(folded, absl::ByAnyChar(" \t\r\n,.;:()/-"), absl::SkipEmpty());
    for (const auto& matcher : diagnosis_matchers()) {
        for (const auto& keyword : matcher.keywords) {
            if (absl::StrContains(folded, keyword)) {
                return matcher.category;
            }
        }
        for (const auto& word : matcher.words) {
            if (std::find(tokens.begin(), tokens.end(), word) != tokens.end()) {
                return matcher.category;
            }
        }
    }
    return DiagnosisCategory::Default;
}

const DiagnosisProfile& profile_for(DiagnosisCategory category) {
    static const std::vector<DiagnosisProfile> profiles = build_profiles();
    for (const auto& p : profiles) {
        if (p.category == category) return p;
    }
    return profiles.front();
}

SessionConfig resolve_session_config(const std::string& diagnosis, const SessionOverrides& overrides) {
    SessionConfig config;
    config.diagnosis = diagnosis;
    config.profile = profile_for(match_diagnosis(diagnosis));

    if (overrides.frameIntervalMs) config.profile.frameIntervalMs = *overrides.frameIntervalMs;
    if (overrides.confidenceThreshold) config.profile.confidenceThreshold = *overrides.confidenceThreshold;
    if (overrides.priorityEmotions) config.profile.priorityEmotions = *overrides.priorityEmotions;
    if (overrides.alertEmotions) config.profile.alertEmotions = *overrides.alertEmotions;
    if (overrides.maxFrames) config.maxFrames = *overrides.maxFrames;

    return config;
}

}  // namespace affectscope
