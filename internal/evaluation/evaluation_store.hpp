#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace transcription::evaluation {

struct EvaluationRecord {
  std::int64_t sample_id = 0;
  std::string  reference;
  std::string  hypothesis;
  double       metric_value    = 0.0;
  double       processing_time = 0.0; // seconds
};

/*
  Results table of one (provider, dataset, language, split) run.

  CSV with columns sample_id, reference, hypothesis, metric_value,
  processing_time. Save rewrites the whole file through tmp + rename, so a
  reader never observes a partial table.
*/
class EvaluationStore {
 public:
  // missing file -> empty
  static std::vector<EvaluationRecord> Load(const std::filesystem::path& path);

  static void Save(const std::filesystem::path& path, const std::vector<EvaluationRecord>& records);
};

/*
  Reads the named columns of a delimited text file as strings, one map per
  row. Missing columns throw util::ParseError.
*/
std::vector<std::map<std::string, std::string>> ReadDelimited(const std::filesystem::path& path, char delimiter, const std::vector<std::string>& columns);

} // namespace transcription::evaluation
