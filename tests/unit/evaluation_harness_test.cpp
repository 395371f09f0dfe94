#include "internal/evaluation/evaluation_harness.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using transcription::evaluation::Dataset;
using transcription::evaluation::EvaluationHarness;
using transcription::evaluation::EvaluationOptions;
using transcription::evaluation::EvaluationStore;
using transcription::evaluation::MetricKind;
using transcription::evaluation::Sample;
using transcription::providers::ProviderOutput;
using transcription::providers::TranscribeResult;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "transcription_evaluation_harness_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir / "clips");
  std::filesystem::create_directories(dir / "tmp");
  return dir;
}

class FakeDataset final : public Dataset {
 public:
  FakeDataset(std::filesystem::path dir, std::vector<std::string> references, MetricKind metric = MetricKind::kWer)
      : dir_(std::move(dir)), references_(std::move(references)), metric_(metric) {
  }

  std::string Name() const override {
    return "fake";
  }
  std::string Language() const override {
    return "en";
  }
  MetricKind Metric() const override {
    return metric_;
  }

  std::vector<Sample> Load(const std::string& split) const override {
    std::vector<Sample> samples;
    for (std::size_t i = 0; i < references_.size(); ++i) {
      Sample s;
      s.audio = dir_ / "clips" / (split + "_" + std::to_string(i) + ".wav");
      std::ofstream(s.audio, std::ios::binary) << "RIFF" << i;
      s.reference = references_[i];
      s.turns     = {{0.0, 1.0, "A"}, {1.0, 2.0, "B"}};
      samples.push_back(std::move(s));
    }
    return samples;
  }

 private:
  std::filesystem::path    dir_;
  std::vector<std::string> references_;
  MetricKind               metric_;
};

class FakeProvider final : public transcription::providers::TranscriptionProvider {
 public:
  std::string Name() const override {
    return "fake_provider";
  }

  TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) override {
    ++calls;
    last_language = language;
    audio_paths.push_back(audio_path);
    assert(std::filesystem::exists(audio_path));
    std::ifstream in(audio_path, std::ios::binary);
    audio_contents.emplace_back(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (fail_on_call == calls) {
      return TranscribeResult::Failure("HTTP 429: rate limited");
    }

    ProviderOutput output;
    output.kind = ProviderOutput::Kind::kTokens;
    for (const auto& [text, speaker, start, end] : std::vector<std::tuple<std::string, std::string, double, double>>{
             {"hello", "spk_0", 0.0, 0.5}, {" ", "spk_0", 0.5, 0.5}, {"world.", "spk_0", 0.5, 1.0}, {"bye.", "spk_1", 1.0, 2.0}}) {
      transcription::model::Word word;
      word.text    = text;
      word.speaker = speaker;
      word.start   = start;
      word.end     = end;
      word.is_spacing = text == " ";
      output.tokens.push_back(word);
    }
    output.text = "hello world";
    return TranscribeResult::Success(std::move(output));
  }

  int                                calls        = 0;
  int                                fail_on_call = 0;
  std::string                        last_language;
  std::vector<std::filesystem::path> audio_paths;
  std::vector<std::string>           audio_contents;
};

struct Harness {
  std::shared_ptr<FakeDataset>           dataset;
  std::shared_ptr<FakeProvider>          provider;
  std::vector<std::chrono::milliseconds> sleeps;
  std::unique_ptr<EvaluationHarness>     harness;
};

std::unique_ptr<Harness> MakeHarness(const std::filesystem::path& dir, std::vector<std::string> references, MetricKind metric = MetricKind::kWer) {
  auto h      = std::make_unique<Harness>();
  h->dataset  = std::make_shared<FakeDataset>(dir, std::move(references), metric);
  h->provider = std::make_shared<FakeProvider>();

  EvaluationOptions options;
  options.results_dir = dir / "results";
  options.temp_root   = dir / "tmp";
  auto* sleeps        = &h->sleeps;
  options.sleeper     = [sleeps](std::chrono::milliseconds d) { sleeps->push_back(d); };

  h->harness = std::make_unique<EvaluationHarness>(h->dataset, h->provider, options);
  return h;
}

void TestResultsPathNaming() {
  const auto dir = TestDir("naming");
  auto       h   = MakeHarness(dir, {"hello world"});
  assert(h->harness->ResultsPath("test") == dir / "results" / "fake_provider_fake_en_test_results.csv");
}

void TestLimitAndResumption() {
  const auto dir = TestDir("resume");
  auto       h   = MakeHarness(dir, {"hello world", "hello there world", "hello world", "goodbye"});

  auto first = h->harness->Evaluate("test", 2);
  assert(first.processed == 2);
  assert(first.records.size() == 2);
  assert(h->provider->calls == 2);
  assert(h->provider->last_language == "en");
  assert(h->sleeps.size() == 1);
  assert(h->sleeps[0] == std::chrono::milliseconds(2000));
  assert(EvaluationStore::Load(h->harness->ResultsPath("test")).size() == 2);

  // the provider only ever sees scoped copies
  for (const auto& p : h->provider->audio_paths) {
    assert(p.parent_path() == dir / "tmp");
    assert(!std::filesystem::exists(p));
  }

  auto again = h->harness->Evaluate("test", 2);
  assert(again.processed == 0);
  assert(again.records.size() == 2);
  assert(h->provider->calls == 2);

  auto rest = h->harness->Evaluate("test", 0);
  assert(rest.processed == 2);
  assert(rest.records.size() == 4);
  assert(rest.records[2].sample_id == 2);
  assert(rest.records[3].sample_id == 3);
  assert(h->provider->calls == 4);

  // identical reference and hypothesis score zero
  assert(rest.records[0].metric_value == 0.0);
  assert(rest.records[0].hypothesis == "hello world");
  assert(rest.records[3].metric_value > 0.0);
}

void TestFailureKeepsSavedRecords() {
  const auto dir = TestDir("failure");
  auto       h   = MakeHarness(dir, {"hello world", "hello world", "hello world"});
  h->provider->fail_on_call = 2;

  bool failed = false;
  try {
    (void)h->harness->Evaluate("test", 0);
  } catch (const transcription::util::ProviderError& e) {
    failed = std::string(e.what()).find("429") != std::string::npos;
  }
  assert(failed);
  assert(EvaluationStore::Load(h->harness->ResultsPath("test")).size() == 1);

  h->provider->fail_on_call = 0;
  auto resumed = h->harness->Evaluate("test", 0);
  assert(resumed.processed == 2);
  assert(resumed.records.size() == 3);
  assert(resumed.records[1].sample_id == 1);
}

void TestWerReport() {
  const auto dir = TestDir("report");
  auto       h   = MakeHarness(dir, {"hello world", "hello big world"});

  const auto run = h->harness->Evaluate("dev", 0);
  assert(run.report.samples == 2);
  assert(run.report.metric == MetricKind::kWer);
  // one deletion over five reference words
  assert(std::fabs(run.report.metric_value - 0.2) < 1e-9);

  const auto text = run.report.Format();
  assert(text.find("Results for fake_provider on fake dataset (en):") != std::string::npos);
  assert(text.find("Total samples processed: 2") != std::string::npos);
  assert(text.find("WER: 0.2000 (20.00%)") != std::string::npos);

  const auto from_file = h->harness->ReportFromFile(h->harness->ResultsPath("dev"));
  assert(from_file.samples == 2);
  assert(std::fabs(from_file.metric_value - run.report.metric_value) < 1e-12);
}

void TestReportFormatsLargeValuesWhole() {
  transcription::evaluation::EvaluationReport report;
  report.provider   = std::string(300, 'p');
  report.dataset    = "fake";
  report.language   = "en";
  report.samples    = 1;
  report.mean_time  = 1e300;
  report.total_time = 1e300;

  const auto text = report.Format();
  assert(text.find(report.provider) != std::string::npos);
  assert(text.find("WER: 0.0000 (0.00%)\n") != std::string::npos);
  const auto total = text.find("Total processing time: ");
  assert(total != std::string::npos);
  assert(text.size() - total > 600);
  assert(text.compare(text.size() - 10, 10, " minutes)\n") == 0);
}

void TestDiarizationScoredOnTurns() {
  const auto dir = TestDir("der");
  auto       h   = MakeHarness(dir, {""}, MetricKind::kDer);

  const auto run = h->harness->Evaluate("test", 0);
  assert(run.records.size() == 1);
  assert(run.records[0].reference == "0.000-1.000:A;1.000-2.000:B");
  assert(run.records[0].hypothesis == "0.000-1.000:spk_0;1.000-2.000:spk_1");
  assert(run.records[0].metric_value < 1e-9);
  assert(run.report.metric == MetricKind::kDer);
}

void TestMissingResultsFile() {
  const auto dir = TestDir("missing");
  auto       h   = MakeHarness(dir, {"hello"});

  bool missing = false;
  try {
    (void)h->harness->ReportFromFile(dir / "results" / "nope.csv");
  } catch (const transcription::util::NotFound&) {
    missing = true;
  }
  assert(missing);

  const auto empty = h->harness->Report({});
  assert(empty.samples == 0);
  assert(empty.metric_value == 0.0);
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestLimitCountsStoredRecords() {
  const auto dir = TestDir("stored_prefix");
  auto       h   = MakeHarness(dir, {"a b", "c d", "e f", "hello world", "hello world", "hello world", "hello world"});

  std::vector<transcription::evaluation::EvaluationRecord> stored;
  for (std::int64_t id = 0; id < 3; ++id) {
    transcription::evaluation::EvaluationRecord r;
    r.sample_id       = id;
    r.reference       = "stored reference " + std::to_string(id);
    r.hypothesis      = "stored hypothesis " + std::to_string(id);
    r.metric_value    = 0.25 * static_cast<double>(id + 1);
    r.processing_time = 1.5;
    stored.push_back(r);
  }
  const auto path = h->harness->ResultsPath("test");
  std::filesystem::create_directories(path.parent_path());
  EvaluationStore::Save(path, stored);
  const auto before = ReadAll(path);

  auto run = h->harness->Evaluate("test", 5);
  assert(run.processed == 2);
  assert(h->provider->calls == 2);
  assert(h->provider->audio_contents.size() == 2);
  assert(h->provider->audio_contents[0] == "RIFF3");
  assert(h->provider->audio_contents[1] == "RIFF4");

  const auto saved = EvaluationStore::Load(path);
  assert(saved.size() == 5);
  for (std::size_t i = 0; i < 3; ++i) {
    assert(saved[i].sample_id == stored[i].sample_id);
    assert(saved[i].reference == stored[i].reference);
    assert(saved[i].hypothesis == stored[i].hypothesis);
    assert(saved[i].metric_value == stored[i].metric_value);
    assert(saved[i].processing_time == stored[i].processing_time);
  }
  assert(saved[3].sample_id == 3);
  assert(saved[4].sample_id == 4);

  // stored rows are rewritten byte for byte ahead of the new ones
  assert(ReadAll(path).compare(0, before.size(), before) == 0);
}

} // namespace

int main() {
  TestResultsPathNaming();
  TestLimitAndResumption();
  TestLimitCountsStoredRecords();
  TestFailureKeepsSavedRecords();
  TestWerReport();
  TestReportFormatsLargeValuesWhole();
  TestDiarizationScoredOnTurns();
  TestMissingResultsFile();

  std::cout << "transcription_unit_evaluation_harness: pass\n";
  return 0;
}
