#include "affectscope/io/HttpRecommendationService.h"

#include "affectscope/Utility.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/strip.h>
#include <glog/logging.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <stdexcept>
#include <string_view>

namespace affectscope {
namespace io {

namespace {

using json = nlohmann::json;

constexpr std::size_t kMaxBodyInMessage = 200;

absl::Status read_string_list(const json& root, const char* key, std::vector<std::string>& out) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return absl::OkStatus();
    if (!it->is_array()) {
        return absl::InvalidArgumentError(absl::StrCat("'", key, "' is not a list"));
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return absl::InvalidArgumentError(absl::StrCat("'", key, "' holds a non-string entry"));
        }
        out.push_back(item.get<std::string>());
    }
    return absl::OkStatus();
}

std::string clip_body(const std::string& body) {
    if (body.size() <= kMaxBodyInMessage) return body;
    return body.substr(0, kMaxBodyInMessage) + "...";
}

}  // namespace

absl::StatusOr<ServiceEndpoint> parse_service_url(const std::string& baseUrl) {
    std::string_view rest = baseUrl;
    std::string scheme;
    if (absl::ConsumePrefix(&rest, "http://")) {
        scheme = "http://";
    } else if (absl::ConsumePrefix(&rest, "https://")) {
        scheme = "https://";
    } else {
        return absl::InvalidArgumentError(absl::StrCat("Recommendation URL must start with http:// or https://: '",
                                                       baseUrl, "'"));
    }

    const std::size_t slash = rest.find('/');
    const std::string_view host = rest.substr(0, slash);
    if (host.empty()) {
        return absl::InvalidArgumentError(absl::StrCat("Recommendation URL has no host: '", baseUrl, "'"));
    }

    ServiceEndpoint endpoint;
    endpoint.origin = absl::StrCat(scheme, host);
    if (slash != std::string_view::npos) {
        std::string_view path = rest.substr(slash);
        while (absl::ConsumeSuffix(&path, "/")) {
        }
        endpoint.pathPrefix = std::string(path);
    }
    return endpoint;
}

std::string recommendation_request_body(const std::string& diagnosis,
                                        const ParticipantContext& userContext,
                                        const EmotionSummary& emotionSummary,
                                        const AudioSummary& audioSummary) {
    json context;
    context["edad_meses"] = userContext.ageMonths ? json(*userContext.ageMonths) : json(nullptr);
    context["notas"] = userContext.notes;
    context["emocion_predominante"] =
        emotionSummary.predominant ? json(emotion_to_string(*emotionSummary.predominant)) : json(nullptr);
    context["proporcion_predominante"] = emotionSummary.predominantShare;
    context["proporcion_negativa"] = emotionSummary.negativeShare;
    context["detecciones"] = emotionSummary.totalDetections;
    context["audio_disponible"] = audioSummary.available;
    context["palabras"] = audioSummary.wordCount;
    context["intentos"] = audioSummary.attempts;
    context["claridad"] = clarity_to_string(audioSummary.quality);

    json body;
    body["diagnostico"] = diagnosis;
    body["contexto"] = std::move(context);
    return body.dump();
}

absl::StatusOr<StructuredRecommendations> parse_recommendation_response(const std::string& body) {
    const json root = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded()) {
        return absl::InvalidArgumentError("Recommendation service answered with invalid JSON");
    }
    if (!root.is_object()) {
        return absl::InvalidArgumentError("Recommendation service answer is not a JSON object");
    }

    if (auto error = root.find("error"); error != root.end()) {
        return absl::UnavailableError(
            absl::StrCat("Recommendation service error: ", error->is_string() ? error->get<std::string>()
                                                                              : error->dump()));
    }

    StructuredRecommendations recs;
    absl::Status status = read_string_list(root, "acciones_inmediatas", recs.immediateActions);
    if (status.ok()) status = read_string_list(root, "estrategias", recs.strategies);
    if (status.ok()) status = read_string_list(root, "actividades", recs.activities);
    if (status.ok()) status = read_string_list(root, "recomendaciones", recs.strategies);
    if (!status.ok()) return status;
    return recs;
}

absl::Status status_from_http(int httpStatus, const std::string& body) {
    if (httpStatus >= 200 && httpStatus < 300) return absl::OkStatus();

    const std::string message =
        absl::StrFormat("Recommendation service answered HTTP %d: %s", httpStatus, clip_body(body));
    if (httpStatus == 408 || httpStatus == 429 || httpStatus >= 500) return absl::UnavailableError(message);
    if (httpStatus == 401 || httpStatus == 403) return absl::PermissionDeniedError(message);
    if (httpStatus == 404) return absl::NotFoundError(message);
    return absl::InvalidArgumentError(message);
}

HttpRecommendationService::HttpRecommendationService(HttpRecommendationOptions options)
    : options_(std::move(options)) {
    absl::StatusOr<ServiceEndpoint> endpoint = parse_service_url(options_.baseUrl);
    if (!endpoint.ok()) {
        throw std::invalid_argument(std::string(endpoint.status().message()));
    }
    endpoint_ = *std::move(endpoint);
    LOG(INFO) << "Recommendation service at " << endpoint_.origin << endpoint_.pathPrefix << "/recomendaciones"
              << (options_.bearerToken.empty() ? "" : " (bearer token)");
}

absl::StatusOr<StructuredRecommendations> HttpRecommendationService::get_recommendations(
    const std::string& diagnosis,
    const ParticipantContext& userContext,
    const EmotionSummary& emotionSummary,
    const AudioSummary& audioSummary) {
    httplib::Client cli(endpoint_.origin);
    if (!cli.is_valid()) {
        return absl::FailedPreconditionError(absl::StrCat("Cannot create HTTP client for ", endpoint_.origin));
    }
    const time_t seconds = static_cast<time_t>(options_.timeout.count());
    cli.set_connection_timeout(seconds, 0);
    cli.set_read_timeout(seconds, 0);
    cli.set_write_timeout(seconds, 0);
    if (!options_.bearerToken.empty()) {
        cli.set_bearer_token_auth(options_.bearerToken);
    }

    const std::string path = endpoint_.pathPrefix + "/recomendaciones";
    const std::string body = recommendation_request_body(diagnosis, userContext, emotionSummary, audioSummary);
    VLOG(1) << "POST " << endpoint_.origin << path << " (" << body.size() << " bytes)";

    auto res = cli.Post(path, body, "application/json");
    if (!res) {
        LOG(WARNING) << "Recommendation service unreachable: " << httplib::to_string(res.error());
        return absl::UnavailableError(
            absl::StrCat("Recommendation service unreachable: ", httplib::to_string(res.error())));
    }

    absl::Status status = status_from_http(res->status, res->body);
    if (!status.ok()) {
        LOG(WARNING) << status;
        return status;
    }
    return parse_recommendation_response(res->body);
}

}  // namespace io
}  // namespace affectscope
