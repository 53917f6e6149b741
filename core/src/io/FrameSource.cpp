#include "affectscope/io/FrameSource.h"

#include <glog/logging.h>
#include <opencv2/videoio.hpp>

#include <algorithm>

namespace affectscope {
namespace io {

namespace {
constexpr double kAssumedFps = 30.0;
}

int sampling_stride(int intervalMs, double fps) {
    const double intervalSeconds = static_cast<double>(intervalMs) / 1000.0;
    return std::max(1, static_cast<int>(intervalSeconds * fps));
}

absl::Status VideoFrameSource::sample(const std::string& videoPath, int intervalMs, const FrameVisitor& visitor) {
    cv::VideoCapture cap(videoPath);
    if (!cap.isOpened()) {
        return absl::UnavailableError("Cannot open video: " + videoPath);
    }

    double fps = cap.get(cv::CAP_PROP_FPS);
    if (!(fps > 0.0)) {
        LOG(WARNING) << "Video reports no frame rate, assuming " << kAssumedFps << " fps: " << videoPath;
        fps = kAssumedFps;
    }
    const int stride = sampling_stride(intervalMs, fps);
    VLOG(1) << "Sampling " << videoPath << " at " << fps << " fps, stride " << stride;

    cv::Mat frame;
    int64_t frameId = 0;
    while (cap.read(frame)) {
        if (frameId % stride == 0) {
            SampledFrame sampled;
            sampled.frameId = frameId;
            sampled.timestampSeconds = static_cast<double>(frameId) / fps;
            sampled.image = frame.clone();
            if (!visitor(std::move(sampled))) {
                break;
            }
        }
        ++frameId;
    }
    cap.release();
    return absl::OkStatus();
}

}  // namespace io
}  // namespace affectscope
