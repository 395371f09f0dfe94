#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace transcription::scoring {

// (start, end, speaker) in seconds
struct SpeakerTurn {
  double      start = 0.0;
  double      end   = 0.0;
  std::string speaker;
};

struct DerBreakdown {
  double missed      = 0.0;
  double false_alarm = 0.0;
  double confusion   = 0.0;
  double reference   = 0.0;
  double hypothesis  = 0.0;

  double Rate() const;
};

// lowercase, drop everything that is neither a word character nor
// whitespace, collapse runs of whitespace
std::string NormalizeForWer(std::string_view text);

// lowercase, drop the CJK / fullwidth punctuation set, pad ideographs with
// spaces so every character scores as a token
std::string NormalizeForCer(std::string_view text);

// (S + D + I) / |reference| over already tokenized input
double EditErrorRate(const std::vector<std::string>& reference, const std::vector<std::string>& hypothesis);

double Wer(std::string_view reference, std::string_view hypothesis);
double Cer(std::string_view reference, std::string_view hypothesis);

/*
  Corpus-level scores: samples are joined with newlines and scored once, so
  long samples weigh more than short ones. Reports produced by earlier runs
  depend on this; do not switch to a per-sample mean.
*/
double CorpusWer(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses);
double CorpusCer(const std::vector<std::string>& references, const std::vector<std::string>& hypotheses);

DerBreakdown ComputeDer(const std::vector<SpeakerTurn>& reference, const std::vector<SpeakerTurn>& hypothesis);
double       Der(const std::vector<SpeakerTurn>& reference, const std::vector<SpeakerTurn>& hypothesis);

// Maximum-weight one-to-one assignment; result[row] is the column or -1.
std::vector<int> MaxWeightAssignment(const std::vector<std::vector<double>>& weights);

} // namespace transcription::scoring
