#pragma once

/**
 * CoreContract.h - AffectScope product constants
 *
 * Every threshold the pipeline uses lives here under a name. The values are
 * product-tuned; they are defaults only, and each one can be overridden through
 * the option struct that consumes it (EnsembleOptions, AlertThresholds,
 * RetryPolicy, CacheOptions, VideoLimits).
 *
 * VERSION: 1.0.0
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace affectscope {
namespace contract {

// ============================================================================
// Ensemble fusion
// ============================================================================

/**
 * SMOOTHING_EPSILON - Laplace smoothing weight of the uniform distribution
 *
 *   avg' = (1 - eps) * avg + eps * uniform
 *
 * Keeps a single confident model from pinning the fused output at 1.0.
 */
constexpr double SMOOTHING_EPSILON = 0.05;

/**
 * CLAHE parameters applied to every face crop before inference.
 */
constexpr double CLAHE_CLIP_LIMIT = 2.0;
constexpr int CLAHE_TILE_GRID = 8;

// ============================================================================
// Fallback heuristic
// ============================================================================
//
// Used when no model is configured or every model failed on an image.
// Confidences stay at or below FALLBACK_MAX_CONFIDENCE so downstream consumers
// can tell heuristic output from ensemble output.

constexpr double FALLBACK_DARK_MEAN = 80.0;        // mean < => Sad
constexpr double FALLBACK_FLAT_STDDEV = 20.0;      // std < => Neutral
constexpr double FALLBACK_BRIGHT_MEAN = 180.0;     // mean > => Happy
constexpr double FALLBACK_EDGE_MAGNITUDE = 50.0;   // mean |grad| > => Surprise

constexpr double FALLBACK_DARK_CONFIDENCE = 0.30;
constexpr double FALLBACK_FLAT_CONFIDENCE = 0.40;
constexpr double FALLBACK_BRIGHT_CONFIDENCE = 0.35;
constexpr double FALLBACK_EDGE_CONFIDENCE = 0.40;
constexpr double FALLBACK_DEFAULT_CONFIDENCE = 0.30;
constexpr double FALLBACK_MAX_CONFIDENCE = 0.40;

// ============================================================================
// Alert table
// ============================================================================

constexpr double NEGATIVE_SHARE_ALERT = 0.60;      // strictly greater
constexpr double ALERT_EMOTION_SHARE = 0.30;       // strictly greater
constexpr int LIMITED_COMMUNICATION_ATTEMPTS = 2;  // attempts < => medio
constexpr int TECHNICAL_ERROR_COUNT = 2;           // errors > => technical

// ============================================================================
// Context classification
// ============================================================================

constexpr double PATTERN_DOMINANCE_RATIO = 1.5;
constexpr double STABILITY_HIGH_SHARE = 0.60;
constexpr double STABILITY_MEDIUM_SHARE = 0.40;
constexpr std::size_t VARIABILITY_LOW_MAX = 2;
constexpr std::size_t VARIABILITY_MEDIUM_MAX = 4;

constexpr int PRE_VERBAL_MAX_ATTEMPTS = 3;         // attempts <
constexpr int EMERGING_VERBAL_MAX_ATTEMPTS = 8;    // attempts <

constexpr std::size_t CLARITY_VERY_LIMITED_CHARS = 10;
constexpr std::size_t CLARITY_LIMITED_CHARS = 50;

constexpr int COMPLEXITY_SIMPLE_WORDS = 5;
constexpr int COMPLEXITY_BASIC_WORDS = 15;

// ============================================================================
// External services
// ============================================================================

constexpr int STT_MAX_ATTEMPTS = 3;
constexpr std::chrono::milliseconds STT_INITIAL_BACKOFF{500};
constexpr double STT_BACKOFF_MULTIPLIER = 2.0;

constexpr std::chrono::seconds RECOMMENDATION_CACHE_TTL{3600};
constexpr std::size_t RECOMMENDATION_CACHE_SHARDS = 16;

// ============================================================================
// Input validation
// ============================================================================

constexpr std::uintmax_t MAX_VIDEO_BYTES = 200ull * 1024ull * 1024ull;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - stored with every persisted session so records
 * produced under different thresholds can be told apart.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

}  // namespace contract
}  // namespace affectscope
