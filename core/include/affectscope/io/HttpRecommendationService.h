#pragma once

#include "affectscope/RecommendationService.h"

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <chrono>
#include <string>

namespace affectscope {
namespace io {

struct HttpRecommendationOptions {
    std::string baseUrl;      // e.g. http://localhost:8000/api
    std::string bearerToken;  // empty: no Authorization header
    std::chrono::seconds timeout{10};
};

// "scheme://host[:port]" plus the path the endpoint lives under.
struct ServiceEndpoint {
    std::string origin;
    std::string pathPrefix;
};

absl::StatusOr<ServiceEndpoint> parse_service_url(const std::string& baseUrl);

// {"diagnostico": ..., "contexto": {...}} as sent to /recomendaciones.
std::string recommendation_request_body(const std::string& diagnosis,
                                        const ParticipantContext& userContext,
                                        const EmotionSummary& emotionSummary,
                                        const AudioSummary& audioSummary);

/**
 * Decode a /recomendaciones answer. Lists are read from
 * "acciones_inmediatas", "estrategias" and "actividades"; a flat
 * "recomendaciones" list is appended to the strategies. A body carrying an
 * "error" key is Unavailable, anything that is not the expected JSON is
 * InvalidArgument.
 */
absl::StatusOr<StructuredRecommendations> parse_recommendation_response(const std::string& body);

// 2xx is OK; 408, 429 and 5xx are Unavailable so the caller retries them.
absl::Status status_from_http(int httpStatus, const std::string& body);

/**
 * HttpRecommendationService: POSTs to <baseUrl>/recomendaciones with
 * cpp-httplib. One client per call, so a single instance can serve several
 * sessions at once. Transport failures and timeouts come back as Unavailable.
 *
 * Throws std::invalid_argument when baseUrl is not an http(s) URL.
 */
class HttpRecommendationService : public RecommendationService {
  public:
    explicit HttpRecommendationService(HttpRecommendationOptions options);

    absl::StatusOr<StructuredRecommendations> get_recommendations(const std::string& diagnosis,
                                                                  const ParticipantContext& userContext,
                                                                  const EmotionSummary& emotionSummary,
                                                                  const AudioSummary& audioSummary) override;

  private:
    HttpRecommendationOptions options_;
    ServiceEndpoint endpoint_;
};

}  // namespace io
}  // namespace affectscope
