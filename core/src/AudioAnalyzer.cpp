#include "affectscope/AudioAnalyzer.h"

#include "affectscope/ContextClassifier.h"
#include "affectscope/Utility.h"

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <glog/logging.h>

namespace affectscope {

std::vector<std::string> split_words(const std::string& text) {
    return absl::StrSplit(text, absl::ByAnyChar(" \t\r\n"), absl::SkipEmpty());
}

int count_verbal_attempts(const std::vector<std::string>& words) {
    int attempts = 0;
    for (const auto& w : words) {
        if (utf8_length(w) > 1) ++attempts;
    }
    return attempts;
}

AudioResult aggregate_transcript(const io::Transcript& transcript, const std::string& languageCode) {
    AudioResult result;
    result.languageCode = languageCode;

    std::vector<std::string> texts;
    for (const auto& seg : transcript.segments) {
        AudioSegmentResult s;
        s.startSeconds = seg.startSeconds;
        s.endSeconds = seg.endSeconds;
        s.transcript = seg.text;
        const auto words = split_words(seg.text);
        s.wordCount = static_cast<int>(words.size());
        s.attempts = count_verbal_attempts(words);
        s.quality = classify_clarity(seg.text);
        result.segments.push_back(std::move(s));
        if (!seg.text.empty()) texts.push_back(seg.text);
    }

    result.transcript = absl::StrJoin(texts, " ");
    result.words = split_words(result.transcript);
    result.wordCount = static_cast<int>(result.words.size());
    result.attempts = count_verbal_attempts(result.words);
    result.quality = classify_clarity(result.transcript);
    return result;
}

AudioAnalyzer::AudioAnalyzer(std::shared_ptr<io::AudioExtractor> extractor,
                             std::shared_ptr<io::SpeechToTextClient> speechToText,
                             AudioAnalyzerOptions options,
                             Sleeper sleeper)
    : extractor_(std::move(extractor)),
      speechToText_(std::move(speechToText)),
      options_(std::move(options)),
      sleeper_(std::move(sleeper)) {}

absl::StatusOr<AudioResult> AudioAnalyzer::analyze(const std::string& videoPath) const {
    if (!extractor_ || !speechToText_) {
        return absl::FailedPreconditionError("Audio analysis is not configured");
    }

    absl::StatusOr<io::AudioClip> clip = extractor_->extract(videoPath);
    if (!clip.ok()) return clip.status();

    const std::string& lang = options_.languageCode;
    absl::StatusOr<io::Transcript> transcript = retry_with_backoff<io::Transcript>(
        options_.retry, sleeper_, "Speech-to-text",
        [&]() { return speechToText_->transcribe(clip->wavBytes, lang); });
    if (!transcript.ok()) return transcript.status();

    AudioResult result = aggregate_transcript(*transcript, lang);
    LOG(INFO) << "Audio: " << result.wordCount << " word(s), " << result.attempts << " attempt(s), clarity "
              << clarity_to_string(result.quality);
    return result;
}

}  // namespace affectscope
