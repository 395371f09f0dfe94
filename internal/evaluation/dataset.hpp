#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/scoring/metrics_calculator.hpp"

namespace transcription::evaluation {

enum class MetricKind { kWer, kCer, kDer };

std::string_view MetricName(MetricKind metric);

struct Sample {
  std::filesystem::path            audio;
  std::string                      reference; // text datasets
  std::vector<scoring::SpeakerTurn> turns;     // diarization datasets
};

/*
  Source of evaluation samples. Sample ids are positions in Load() order, so
  Load must be deterministic for resumption to be meaningful.
*/
class Dataset {
 public:
  virtual ~Dataset() = default;

  virtual std::string Name() const     = 0;
  virtual std::string Language() const = 0;
  virtual MetricKind  Metric() const   = 0;

  // language hint handed to the provider
  virtual std::string ProviderLanguage() const {
    return Language();
  }

  // throws util::NotFound when the split is missing, util::ParseError on bad rows
  virtual std::vector<Sample> Load(const std::string& split) const = 0;
};

// "0.000-1.250:A;1.250-3.000:B"
std::string                       FormatTurns(const std::vector<scoring::SpeakerTurn>& turns);
std::vector<scoring::SpeakerTurn> ParseTurns(std::string_view text);

} // namespace transcription::evaluation
