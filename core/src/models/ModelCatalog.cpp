#include "affectscope/models/ModelCatalog.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>
#include <glog/logging.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace affectscope {
namespace models {

namespace {

int parse_int_or_throw(absl::string_view field, int lineNo, const char* what) {
    int value = 0;
    if (!absl::SimpleAtoi(field, &value)) {
        throw std::runtime_error(absl::StrCat("ensemble manifest line ", lineNo, ": invalid ", what, " '", field, "'"));
    }
    return value;
}

}  // namespace

EnsembleConfig parse_manifest(std::istream& in, const std::string& baseDir) {
    EnsembleConfig config;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        absl::string_view view = line;
        const auto hash = view.find('#');
        if (hash != absl::string_view::npos) view = view.substr(0, hash);
        view = absl::StripAsciiWhitespace(view);
        if (view.empty()) continue;

        std::vector<absl::string_view> fields = absl::StrSplit(view, absl::ByAnyChar(" \t"), absl::SkipEmpty());
        if (fields.size() != 6 && fields.size() != 7) {
            throw std::runtime_error(absl::StrCat("ensemble manifest line ", lineNo,
                                                  ": expected 6 or 7 fields, got ", fields.size()));
        }

        ModelDescriptor d;
        d.name = std::string(fields[0]);
        std::filesystem::path artifact{std::string(fields[1])};
        if (artifact.is_relative() && !baseDir.empty()) artifact = std::filesystem::path(baseDir) / artifact;
        d.artifactPath = artifact.string();
        if (!absl::SimpleAtod(fields[2], &d.weight)) {
            throw std::runtime_error(absl::StrCat("ensemble manifest line ", lineNo, ": invalid weight '", fields[2], "'"));
        }
        d.inputShape.height = parse_int_or_throw(fields[3], lineNo, "height");
        d.inputShape.width = parse_int_or_throw(fields[4], lineNo, "width");
        d.inputShape.channels = parse_int_or_throw(fields[5], lineNo, "channels");
        if (fields.size() == 7) d.inputShape.rank = parse_int_or_throw(fields[6], lineNo, "rank");

        config.models.push_back(std::move(d));
    }
    return config;
}

EnsembleConfig load_catalog(const std::string& modelsDir) {
    const auto manifestPath = std::filesystem::path(modelsDir) / kManifestFileName;
    std::ifstream in(manifestPath);
    if (!in) {
        LOG(WARNING) << "No ensemble manifest at " << manifestPath.string() << "; scoring will use the fallback heuristic";
        return {};
    }

    EnsembleConfig parsed = parse_manifest(in, modelsDir);
    EnsembleConfig available;
    for (auto& d : parsed.models) {
        if (!std::filesystem::exists(d.artifactPath)) {
            LOG(WARNING) << "Skipping model '" << d.name << "': artifact not found at " << d.artifactPath;
            continue;
        }
        available.models.push_back(std::move(d));
    }
    LOG(INFO) << "Ensemble manifest lists " << parsed.models.size() << " model(s), "
              << available.models.size() << " available";
    return available;
}

}  // namespace models
}  // namespace affectscope
