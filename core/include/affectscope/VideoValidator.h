#pragma once

#include "affectscope/CoreContract.h"

#include <absl/status/status.h>

#include <cstdint>
#include <string>
#include <vector>

namespace affectscope {

struct VideoLimits {
    std::uintmax_t maxBytes{contract::MAX_VIDEO_BYTES};
    std::vector<std::string> extensions{".mp4", ".avi", ".mov", ".mkv"};  // lower-case
};

/**
 * Check a video path before any analysis runs.
 *
 * NotFound: empty path or missing file.
 * InvalidArgument: not a regular file, empty, over the size limit, or an
 * unsupported extension (compared case-insensitively).
 * PermissionDenied: the file cannot be opened for reading.
 */
absl::Status validate_video(const std::string& path, const VideoLimits& limits = {});

}  // namespace affectscope
