#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dataset.hpp"

namespace transcription::evaluation {

/*
  CallHome diarization export on disk:

    {root}/{language}/{split}.tsv    columns id, audio, rttm

  audio and rttm are relative to {root}/{language}. Reference turns come from
  the RTTM SPEAKER lines.
*/
class CallHomeDataset final : public Dataset {
 public:
  CallHomeDataset(std::filesystem::path root, std::string language);

  std::string Name() const override {
    return "callhome";
  }

  std::string Language() const override {
    return language_;
  }

  MetricKind Metric() const override {
    return MetricKind::kDer;
  }

  std::vector<Sample> Load(const std::string& split) const override;

 private:
  std::filesystem::path root_;
  std::string           language_;
};

// SPEAKER <file> <chan> <onset> <duration> <NA> <NA> <speaker> ...
std::vector<scoring::SpeakerTurn> ParseRttm(const std::string& content);

} // namespace transcription::evaluation
