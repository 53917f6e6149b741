#pragma once

#include <absl/status/status.h>
#include <opencv2/core.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace affectscope {
namespace io {

struct SampledFrame {
    int64_t frameId{0};            // index of the decoded frame in the video
    double timestampSeconds{0.0};
    cv::Mat image;                 // BGR
};

// Returns false to stop sampling early.
using FrameVisitor = std::function<bool(SampledFrame&& frame)>;

/**
 * FrameSource: decodes a video and hands every sampled frame to a visitor.
 *
 * One frame in `skip = max(1, int(intervalMs / 1000 * fps))` is sampled,
 * starting with frame 0.
 */
class FrameSource {
  public:
    virtual ~FrameSource() = default;

    virtual absl::Status sample(const std::string& videoPath, int intervalMs, const FrameVisitor& visitor) = 0;
};

int sampling_stride(int intervalMs, double fps);

/// OpenCV VideoCapture implementation.
class VideoFrameSource : public FrameSource {
  public:
    absl::Status sample(const std::string& videoPath, int intervalMs, const FrameVisitor& visitor) override;
};

}  // namespace io
}  // namespace affectscope
