#include "affectscope/DiagnosisMatcher.h"

#include "affectscope/Utility.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace affectscope;

TEST(MatchDiagnosis, RecognizesSpanishAndEnglishKeywords) {
    EXPECT_EQ(match_diagnosis("Trastorno del Espectro Autista"), DiagnosisCategory::Autism);
    EXPECT_EQ(match_diagnosis("AUTISMO nivel 2"), DiagnosisCategory::Autism);
    EXPECT_EQ(match_diagnosis("TDAH combinado"), DiagnosisCategory::Adhd);
    EXPECT_EQ(match_diagnosis("hiperactividad"), DiagnosisCategory::Adhd);
    EXPECT_EQ(match_diagnosis("Síndrome de Down"), DiagnosisCategory::DownSyndrome);
    EXPECT_EQ(match_diagnosis("parálisis cerebral espástica"), DiagnosisCategory::CerebralPalsy);
    EXPECT_EQ(match_diagnosis("discapacidad intelectual leve"), DiagnosisCategory::IntellectualDisability);
}

TEST(MatchDiagnosis, FoldsAccentedCapitals) {
    EXPECT_EQ(match_diagnosis("PARÁLISIS CEREBRAL"), DiagnosisCategory::CerebralPalsy);
    EXPECT_EQ(match_diagnosis("DÉFICIT DE ATENCIÓN"), DiagnosisCategory::Adhd);
    EXPECT_EQ(match_diagnosis("TRISOMÍA 21"), DiagnosisCategory::DownSyndrome);
    EXPECT_EQ(match_diagnosis("paralisis cerebral"), DiagnosisCategory::CerebralPalsy);
    EXPECT_EQ(resolve_session_config("PARÁLISIS CEREBRAL", {}).profile.key, "paralisis_cerebral");
}

TEST(MatchDiagnosis, AbbreviationsMatchWholeWordsOnly) {
    EXPECT_EQ(match_diagnosis("TEA nivel 1"), DiagnosisCategory::Autism);
    EXPECT_EQ(match_diagnosis("sospecha de TEA."), DiagnosisCategory::Autism);
    EXPECT_EQ(match_diagnosis("dificultades en la teatralización"), DiagnosisCategory::Default);
}

TEST(FoldCaseAndAccents, SpanishLetters) {
    EXPECT_EQ(fold_case_and_accents("ÁÉÍÓÚÜ áéíóúü"), "aeiouu aeiouu");
    EXPECT_EQ(fold_case_and_accents("NIÑO Niño"), "niño niño");
    EXPECT_EQ(fold_case_and_accents("TDAH-2"), "tdah-2");
}

TEST(MatchDiagnosis, UnmatchedOrEmptyIsDefault) {
    EXPECT_EQ(match_diagnosis(""), DiagnosisCategory::Default);
    EXPECT_EQ(match_diagnosis("retraso del lenguaje"), DiagnosisCategory::Default);
}

TEST(MatchDiagnosis, FirstCategoryInTableOrderWins) {
    EXPECT_EQ(match_diagnosis("autismo con discapacidad intelectual"), DiagnosisCategory::Autism);
    EXPECT_EQ(match_diagnosis("discapacidad intelectual y TDAH"), DiagnosisCategory::Adhd);
}

TEST(ProfileFor, EveryCategoryHasOneDistinctProfile) {
    std::set<std::string> keys;
    for (DiagnosisCategory c : {DiagnosisCategory::Default, DiagnosisCategory::Autism, DiagnosisCategory::Adhd,
                                DiagnosisCategory::DownSyndrome, DiagnosisCategory::CerebralPalsy,
                                DiagnosisCategory::IntellectualDisability}) {
        const DiagnosisProfile& p = profile_for(c);
        EXPECT_EQ(p.category, c);
        EXPECT_GT(p.frameIntervalMs, 0);
        EXPECT_GT(p.confidenceThreshold, 0.0);
        EXPECT_LT(p.confidenceThreshold, 1.0);
        keys.insert(p.key);
    }
    EXPECT_EQ(keys.size(), 6u);
}

TEST(ResolveSessionConfig, IsDeterministic) {
    const SessionConfig a = resolve_session_config("autismo", {});
    const SessionConfig b = resolve_session_config("autismo", {});
    EXPECT_EQ(a.profile.key, b.profile.key);
    EXPECT_EQ(a.profile.frameIntervalMs, b.profile.frameIntervalMs);
    EXPECT_DOUBLE_EQ(a.profile.confidenceThreshold, b.profile.confidenceThreshold);
    EXPECT_EQ(a.profile.alertEmotions, b.profile.alertEmotions);
    EXPECT_EQ(a.profile.key, "autismo");
    EXPECT_EQ(a.diagnosis, "autismo");
}

TEST(ResolveSessionConfig, DefaultProfileForUnknownDiagnosis) {
    const SessionConfig config = resolve_session_config("sin diagnóstico", {});
    EXPECT_EQ(config.profile.category, DiagnosisCategory::Default);
    EXPECT_EQ(config.profile.frameIntervalMs, 1000);
    EXPECT_DOUBLE_EQ(config.profile.confidenceThreshold, 0.5);
    EXPECT_EQ(config.maxFrames, 0);
}

TEST(ResolveSessionConfig, OverridesWinOverProfile) {
    SessionOverrides overrides;
    overrides.frameIntervalMs = 250;
    overrides.confidenceThreshold = 0.7;
    overrides.alertEmotions = std::vector<Emotion>{Emotion::Sad};
    overrides.maxFrames = 40;

    const SessionConfig config = resolve_session_config("TDAH", overrides);
    EXPECT_EQ(config.profile.category, DiagnosisCategory::Adhd);
    EXPECT_EQ(config.profile.frameIntervalMs, 250);
    EXPECT_DOUBLE_EQ(config.profile.confidenceThreshold, 0.7);
    EXPECT_EQ(config.profile.alertEmotions, std::vector<Emotion>{Emotion::Sad});
    EXPECT_EQ(config.profile.priorityEmotions, profile_for(DiagnosisCategory::Adhd).priorityEmotions);
    EXPECT_EQ(config.maxFrames, 40);
}
