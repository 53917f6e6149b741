#include "affectscope/VideoValidator.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace affectscope {

absl::Status validate_video(const std::string& path, const VideoLimits& limits) {
    namespace fs = std::filesystem;

    if (path.empty()) {
        return absl::NotFoundError("No video path given");
    }

    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return absl::NotFoundError("Video not found: " + path);
    }
    if (!fs::is_regular_file(status)) {
        return absl::InvalidArgumentError("Not a regular file: " + path);
    }

    const std::string ext = absl::AsciiStrToLower(fs::path(path).extension().string());
    if (std::find(limits.extensions.begin(), limits.extensions.end(), ext) == limits.extensions.end()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Unsupported format '", ext, "'. Use ", absl::StrJoin(limits.extensions, ", ")));
    }

    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return absl::InvalidArgumentError(absl::StrCat("Cannot stat ", path, ": ", ec.message()));
    }
    if (size == 0) {
        return absl::InvalidArgumentError("Video file is empty: " + path);
    }
    if (size > limits.maxBytes) {
        return absl::InvalidArgumentError(absl::StrCat("Video too large: ", size, " bytes (max ",
                                                       limits.maxBytes / (1024 * 1024), " MB)"));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return absl::PermissionDeniedError("Video is not readable: " + path);
    }
    return absl::OkStatus();
}

}  // namespace affectscope
