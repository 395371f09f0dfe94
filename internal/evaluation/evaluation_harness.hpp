#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dataset.hpp"
#include "evaluation_store.hpp"
#include "internal/providers/transcription_provider.hpp"

namespace transcription::evaluation {

struct EvaluationOptions {
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  std::filesystem::path     results_dir = "evaluate/results";
  std::chrono::milliseconds inter_sample_delay{2000};
  std::filesystem::path     temp_root;
  std::size_t               max_segment_length = 200;
  Sleeper                   sleeper;
};

struct EvaluationReport {
  std::string provider;
  std::string dataset;
  std::string language;
  MetricKind  metric       = MetricKind::kWer;
  double      metric_value = 0.0;
  std::size_t samples      = 0;
  double      mean_time    = 0.0; // seconds
  double      total_time   = 0.0; // seconds

  double TotalMinutes() const {
    return total_time / 60.0;
  }

  std::string Format() const;
};

struct EvaluationRun {
  std::vector<EvaluationRecord> records;
  std::size_t                   processed = 0; // new samples this run
  EvaluationReport              report;
};

/*
  Drives one provider over one dataset, resumably.

  Strictly sequential: one sample at a time with a fixed pause between
  provider calls. After every sample the full record set is rewritten, so
  an interrupted run loses at most the sample in flight. Sample ids already
  in the results file are never transcribed again.
*/
class EvaluationHarness {
 public:
  EvaluationHarness(std::shared_ptr<const Dataset> dataset, providers::TranscriptionProviderPtr provider, EvaluationOptions options = {});

  // {results_dir}/{provider}_{dataset}_{language}_{split}_results.csv
  std::filesystem::path ResultsPath(const std::string& split) const;

  /*
    limit > 0 caps the total number of records, 0 means the whole split.
    A provider failure stops the run; records saved so far stay on disk and
    the error (util::ProviderError / util::ParseError) propagates.
  */
  EvaluationRun Evaluate(const std::string& split, std::int64_t limit);

  EvaluationReport Report(const std::vector<EvaluationRecord>& records) const;

  // throws util::NotFound when the file does not exist
  EvaluationReport ReportFromFile(const std::filesystem::path& path) const;

 private:
  EvaluationRecord Score(std::int64_t sample_id, const Sample& sample, const providers::ProviderOutput& output, double seconds) const;

  std::shared_ptr<const Dataset>      dataset_;
  providers::TranscriptionProviderPtr provider_;
  EvaluationOptions                   options_;
};

} // namespace transcription::evaluation
