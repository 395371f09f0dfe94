#include "common_voice_dataset.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

#include "evaluation_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"
#include "internal/util/text.hpp"

namespace transcription::evaluation {

bool IsCharacterScored(const std::string& language) {
  return language.rfind("zh", 0) == 0 || language == "ja" || language == "yue";
}

AudioJoiner FfmpegJoiner(std::string ffmpeg_path) {
  return [ffmpeg = std::move(ffmpeg_path)](const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output) {
    const auto list_path = output.string() + ".list";
    {
      std::ofstream list(list_path);
      for (const auto& input : inputs) {
        // concat demuxer quoting: ' becomes '\''
        std::string quoted;
        for (char c : std::filesystem::absolute(input).string()) {
          quoted += c == '\'' ? std::string("'\\''") : std::string(1, c);
        }
        list << "file '" << quoted << "'\n";
      }
      if (!list) {
        throw std::runtime_error("cannot write " + list_path);
      }
    }

    // re-encoded to 16 kHz mono
    const std::string command = util::ShellQuote(ffmpeg) + " -nostdin -loglevel error -y -f concat -safe 0 -i " + util::ShellQuote(list_path) +
                                " -ac 1 -ar 16000 " + util::ShellQuote(output.string());
    util::CommandResult result;
    try {
      result = util::RunCommand(command);
    } catch (const std::runtime_error& e) {
      std::filesystem::remove(list_path);
      throw util::ProviderError(std::string("ffmpeg: ") + e.what());
    }
    std::filesystem::remove(list_path);
    if (result.exit_code != 0) {
      std::filesystem::remove(output);
      throw util::ProviderError("ffmpeg: joining into " + output.string() + " failed (exit " + std::to_string(result.exit_code) +
                                "): " + util::Trim(result.output));
    }
  };
}

CommonVoiceDataset::CommonVoiceDataset(std::filesystem::path root, std::string language, AudioJoiner joiner, std::size_t max_mixed_samples)
    : root_(std::move(root)), language_(std::move(language)), joiner_(joiner ? std::move(joiner) : FfmpegJoiner()), max_mixed_samples_(max_mixed_samples) {
}

std::string CommonVoiceDataset::ProviderLanguage() const {
  return language_ == kMixedLanguage ? "auto" : language_;
}

MetricKind CommonVoiceDataset::Metric() const {
  return IsCharacterScored(language_) ? MetricKind::kCer : MetricKind::kWer;
}

std::vector<Sample> CommonVoiceDataset::Load(const std::string& split) const {
  auto samples = language_ == kMixedLanguage ? LoadMixed(split) : LoadLanguage(language_, split);

  TRANSCRIPTION_LOG_INFO("common voice split loaded", {observability::StringField("language", language_), observability::StringField("split", split),
                                                       observability::IntField("samples", static_cast<std::int64_t>(samples.size()))});
  return samples;
}

std::vector<Sample> CommonVoiceDataset::LoadLanguage(const std::string& language, const std::string& split) const {
  const auto base = root_ / language;
  const auto rows = ReadDelimited(base / (split + ".tsv"), '\t', {"path", "sentence"});

  std::vector<Sample> samples;
  samples.reserve(rows.size());
  for (const auto& row : rows) {
    Sample sample;
    sample.audio     = base / "clips" / row.at("path");
    sample.reference = row.at("sentence");
    samples.push_back(std::move(sample));
  }
  return samples;
}

std::vector<Sample> CommonVoiceDataset::LoadMixed(const std::string& split) const {
  const auto english    = LoadLanguage("en", split);
  const auto vietnamese = LoadLanguage("vi", split);
  const auto count      = std::min({english.size(), vietnamese.size(), max_mixed_samples_});

  const auto out_dir = root_ / kMixedLanguage / split;
  std::filesystem::create_directories(out_dir);

  std::vector<Sample> samples;
  samples.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    Sample sample;
    sample.audio     = out_dir / ("mixed_" + std::to_string(i) + ".wav");
    sample.reference = english[i].reference + " " + vietnamese[i].reference;
    if (!std::filesystem::exists(sample.audio)) {
      joiner_({english[i].audio, vietnamese[i].audio}, sample.audio);
    }
    samples.push_back(std::move(sample));
  }
  return samples;
}

} // namespace transcription::evaluation
