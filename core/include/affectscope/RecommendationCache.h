#pragma once

#include "affectscope/CoreContract.h"
#include "affectscope/RecommendationService.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace affectscope {

struct CacheOptions {
    std::chrono::seconds ttl{contract::RECOMMENDATION_CACHE_TTL};
    std::size_t shards{contract::RECOMMENDATION_CACHE_SHARDS};
};

/**
 * RecommendationCache: TTL cache of recommendation-service responses.
 *
 * Keys are spread over independently locked shards so sessions working on
 * unrelated keys never wait on each other. Expiry is checked on read; a stale
 * entry is dropped and reported as a miss.
 */
class RecommendationCache {
  public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static std::chrono::steady_clock::time_point steady_clock_now() { return std::chrono::steady_clock::now(); }

    explicit RecommendationCache(CacheOptions options = {}, Clock clock = steady_clock_now);

    std::optional<StructuredRecommendations> get(const std::string& key);
    void put(const std::string& key, StructuredRecommendations value);

    std::size_t size() const;

  private:
    struct Entry {
        StructuredRecommendations value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    Shard& shard_for(const std::string& key);

    CacheOptions options_;
    Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

// Stable hex digest of the request fields that shape a contextual response.
std::string recommendation_cache_key(const std::string& diagnosis,
                                     const ParticipantContext& userContext,
                                     const EmotionSummary& emotionSummary,
                                     const AudioSummary& audioSummary);

}  // namespace affectscope
