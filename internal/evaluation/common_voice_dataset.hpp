#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "dataset.hpp"

namespace transcription::evaluation {

// Writes the inputs back to back into output.
using AudioJoiner = std::function<void(const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output)>;

// ffmpeg concat demuxer; throws util::ProviderError when ffmpeg fails
AudioJoiner FfmpegJoiner(std::string ffmpeg_path = "ffmpeg");

constexpr const char* kMixedLanguage      = "mixed";
constexpr std::size_t kMixedDefaultSamples = 1237;

/*
  Mozilla Common Voice export on disk:

    {root}/{language}/{split}.tsv    columns path, sentence (among others)
    {root}/{language}/clips/{path}

  Character-based languages (zh*, ja, yue) are scored with CER.

  language "mixed" pairs the en and vi splits row by row: English clip
  first, then Vietnamese, reference "{en} {vi}". Pairing stops at the
  shorter split or after max_mixed_samples pairs. Joined clips are cached
  under {root}/mixed/{split}/mixed_{i}.wav and the provider is asked to
  detect the language.
*/
class CommonVoiceDataset final : public Dataset {
 public:
  CommonVoiceDataset(std::filesystem::path root, std::string language, AudioJoiner joiner = {}, std::size_t max_mixed_samples = kMixedDefaultSamples);

  std::string Name() const override {
    return "common_voice";
  }

  std::string Language() const override {
    return language_;
  }

  std::string ProviderLanguage() const override;

  MetricKind Metric() const override;

  std::vector<Sample> Load(const std::string& split) const override;

 private:
  std::vector<Sample> LoadLanguage(const std::string& language, const std::string& split) const;
  std::vector<Sample> LoadMixed(const std::string& split) const;

  std::filesystem::path root_;
  std::string           language_;
  AudioJoiner           joiner_;
  std::size_t           max_mixed_samples_;
};

bool IsCharacterScored(const std::string& language);

} // namespace transcription::evaluation
