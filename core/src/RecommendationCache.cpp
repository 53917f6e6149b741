#include "affectscope/RecommendationCache.h"

#include "affectscope/ContextClassifier.h"
#include "affectscope/DiagnosisMatcher.h"
#include "affectscope/Utility.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include <algorithm>
#include <cstdint>

namespace affectscope {

RecommendationCache::RecommendationCache(CacheOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    const std::size_t n = std::max<std::size_t>(options_.shards, 1);
    shards_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

RecommendationCache::Shard& RecommendationCache::shard_for(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::optional<StructuredRecommendations> RecommendationCache::get(const std::string& key) {
    Shard& shard = shard_for(key);
    const auto now = clock_();
    std::scoped_lock lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    if (now - it->second.insertedAt >= options_.ttl) {
        shard.entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void RecommendationCache::put(const std::string& key, StructuredRecommendations value) {
    Shard& shard = shard_for(key);
    Entry entry{std::move(value), clock_()};
    std::scoped_lock lock(shard.mutex);
    shard.entries.insert_or_assign(key, std::move(entry));
}

std::size_t RecommendationCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::scoped_lock lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

namespace {

// FNV-1a, 64 bit.
uint64_t fnv1a(const std::string& data) {
    uint64_t hash = 14695981039346656037ull;
    for (const unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

}  // namespace

std::string recommendation_cache_key(const std::string& diagnosis,
                                     const ParticipantContext& userContext,
                                     const EmotionSummary& emotionSummary,
                                     const AudioSummary& audioSummary) {
    // Only the discrete classification of the summaries enters the key.
    const std::string canonical = absl::StrCat(
        diagnosis_category_to_string(match_diagnosis(diagnosis)), "|", fold_case_and_accents(diagnosis), "|",
        userContext.ageMonths ? absl::StrCat(*userContext.ageMonths) : std::string("-"), "|", userContext.notes,
        "|", emotionSummary.predominant ? emotion_to_string(*emotionSummary.predominant) : std::string("-"), "|",
        emotionSummary.negativeShare > 0.5 ? "neg" : "pos", "|", audioSummary.available ? "audio" : "noaudio", "|",
        communication_level_to_string(classify_communication_level(audioSummary.attempts, audioSummary.wordCount)));
    return absl::StrFormat("%016x", fnv1a(canonical));
}

}  // namespace affectscope
