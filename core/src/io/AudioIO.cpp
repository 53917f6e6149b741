#include "affectscope/io/AudioIO.h"

#include "affectscope/io/ShellCommand.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <glog/logging.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace affectscope {
namespace io {

namespace {

constexpr int kSampleRate = 16000;
constexpr int kBytesPerSample = 2;
constexpr std::size_t kWavHeaderBytes = 44;

absl::StatusOr<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return absl::NotFoundError("Cannot read " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

FfmpegAudioExtractor::FfmpegAudioExtractor(std::string ffmpegBinary) : ffmpegBinary_(std::move(ffmpegBinary)) {}

absl::StatusOr<AudioClip> FfmpegAudioExtractor::extract(const std::string& videoPath) {
    TempPath wav(".wav");
    const std::string cmd = absl::StrCat(shell_quote(ffmpegBinary_), " -nostdin -loglevel error -y -i ",
                                         shell_quote(videoPath), " -vn -ac 1 -ar ", kSampleRate,
                                         " -acodec pcm_s16le -f wav ", shell_quote(wav.path()));
    absl::Status status = run_shell_command(cmd);
    if (!status.ok()) {
        return absl::Status(status.code(), absl::StrCat("audio extraction failed: ", status.message()));
    }

    absl::StatusOr<std::vector<uint8_t>> bytes = read_file_bytes(wav.path());
    if (!bytes.ok()) return bytes.status();
    if (bytes->size() <= kWavHeaderBytes) {
        return absl::NotFoundError("Video has no audio samples: " + videoPath);
    }

    AudioClip clip;
    clip.durationSeconds = static_cast<double>(bytes->size() - kWavHeaderBytes) / (kSampleRate * kBytesPerSample);
    clip.wavBytes = std::move(*bytes);
    VLOG(1) << "Extracted " << clip.durationSeconds << " s of audio from " << videoPath;
    return clip;
}

Transcript parse_transcript_lines(const std::string& output) {
    Transcript transcript;
    for (absl::string_view line : absl::StrSplit(output, '\n', absl::SkipWhitespace())) {
        line = absl::StripAsciiWhitespace(line);
        std::vector<absl::string_view> fields = absl::StrSplit(line, absl::MaxSplits('\t', 2));
        TranscriptSegment segment;
        double start = 0.0;
        double end = 0.0;
        if (fields.size() == 3 && absl::SimpleAtod(fields[0], &start) && absl::SimpleAtod(fields[1], &end)) {
            segment.startSeconds = start;
            segment.endSeconds = end;
            segment.text = std::string(absl::StripAsciiWhitespace(fields[2]));
        } else {
            segment.text = std::string(line);
        }
        if (!segment.text.empty()) {
            transcript.segments.push_back(std::move(segment));
        }
    }
    return transcript;
}

CommandSpeechToTextClient::CommandSpeechToTextClient(std::string command) : command_(std::move(command)) {}

absl::StatusOr<Transcript> CommandSpeechToTextClient::transcribe(const std::vector<uint8_t>& audioBytes,
                                                                 const std::string& languageCode) {
    if (command_.empty()) {
        return absl::FailedPreconditionError("No speech-to-text command configured");
    }

    TempPath wav(".wav");
    TempPath out(".txt");
    {
        std::ofstream f(wav.path(), std::ios::binary);
        f.write(reinterpret_cast<const char*>(audioBytes.data()), static_cast<std::streamsize>(audioBytes.size()));
        if (!f) {
            return absl::InternalError("Cannot write temporary audio file " + wav.path());
        }
    }

    const std::string cmd = absl::StrCat(command_, " ", shell_quote(wav.path()), " ", shell_quote(languageCode),
                                         " > ", shell_quote(out.path()));
    absl::Status status = run_shell_command(cmd);
    if (!status.ok()) {
        return absl::Status(status.code(), absl::StrCat("speech-to-text failed: ", status.message()));
    }

    std::ifstream in(out.path());
    if (!in) {
        return absl::UnavailableError("Speech-to-text produced no output");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_transcript_lines(buffer.str());
}

}  // namespace io
}  // namespace affectscope
