#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <string>
#include <vector>

namespace affectscope {
namespace io {

// Mono 16 kHz 16-bit PCM WAV.
struct AudioClip {
    std::vector<uint8_t> wavBytes;
    double durationSeconds{0.0};
};

class AudioExtractor {
  public:
    virtual ~AudioExtractor() = default;

    virtual absl::StatusOr<AudioClip> extract(const std::string& videoPath) = 0;
};

/// Extracts the first audio stream with the ffmpeg command-line tool.
class FfmpegAudioExtractor : public AudioExtractor {
  public:
    explicit FfmpegAudioExtractor(std::string ffmpegBinary = "ffmpeg");

    absl::StatusOr<AudioClip> extract(const std::string& videoPath) override;

  private:
    std::string ffmpegBinary_;
};

struct TranscriptSegment {
    double startSeconds{0.0};
    double endSeconds{0.0};
    std::string text;
};

struct Transcript {
    std::vector<TranscriptSegment> segments;
};

/**
 * SpeechToTextClient: transcription backend.
 *
 * Unavailable and DeadlineExceeded are transient and retried by the caller;
 * every other error code is final.
 */
class SpeechToTextClient {
  public:
    virtual ~SpeechToTextClient() = default;

    virtual absl::StatusOr<Transcript> transcribe(const std::vector<uint8_t>& audioBytes,
                                                  const std::string& languageCode) = 0;
};

/**
 * CommandSpeechToTextClient: runs `<command> <wav-path> <language>` and reads
 * the transcript from its stdout.
 *
 * Each output line is either `start<TAB>end<TAB>text` or plain text; plain
 * lines become segments without timing.
 */
class CommandSpeechToTextClient : public SpeechToTextClient {
  public:
    explicit CommandSpeechToTextClient(std::string command);

    absl::StatusOr<Transcript> transcribe(const std::vector<uint8_t>& audioBytes,
                                          const std::string& languageCode) override;

  private:
    std::string command_;
};

// Parse the line format accepted by CommandSpeechToTextClient.
Transcript parse_transcript_lines(const std::string& output);

}  // namespace io
}  // namespace affectscope
