#pragma once

#include "affectscope/EmotionTypes.h"
#include "affectscope/Retry.h"
#include "affectscope/io/AudioIO.h"

#include <absl/status/statusor.h>

#include <memory>
#include <string>
#include <vector>

namespace affectscope {

struct AudioAnalyzerOptions {
    std::string languageCode{"es-ES"};
    RetryPolicy retry;
};

/**
 * AudioAnalyzer: extract -> transcribe (retried) -> aggregate.
 *
 * Extraction failures are final. Transcription is retried on transient
 * errors per RetryPolicy; the last error is returned once attempts run out.
 */
class AudioAnalyzer {
  public:
    AudioAnalyzer(std::shared_ptr<io::AudioExtractor> extractor,
                  std::shared_ptr<io::SpeechToTextClient> speechToText,
                  AudioAnalyzerOptions options = {},
                  Sleeper sleeper = thread_sleeper());

    absl::StatusOr<AudioResult> analyze(const std::string& videoPath) const;

  private:
    std::shared_ptr<io::AudioExtractor> extractor_;
    std::shared_ptr<io::SpeechToTextClient> speechToText_;
    AudioAnalyzerOptions options_;
    Sleeper sleeper_;
};

std::vector<std::string> split_words(const std::string& text);

// Words longer than one character count as verbal attempts.
int count_verbal_attempts(const std::vector<std::string>& words);

AudioResult aggregate_transcript(const io::Transcript& transcript, const std::string& languageCode);

}  // namespace affectscope
