#include "evaluation_harness.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/temp_file.hpp"

namespace transcription::evaluation {

namespace {

std::vector<scoring::SpeakerTurn> TurnsOf(const std::vector<model::Segment>& segments) {
  std::vector<scoring::SpeakerTurn> turns;
  turns.reserve(segments.size());
  for (const auto& s : segments) {
    turns.push_back({s.start, s.end, s.speaker});
  }
  return turns;
}

} // namespace

EvaluationHarness::EvaluationHarness(std::shared_ptr<const Dataset> dataset, providers::TranscriptionProviderPtr provider, EvaluationOptions options)
    : dataset_(std::move(dataset)), provider_(std::move(provider)), options_(std::move(options)) {
  if (!dataset_ || !provider_) {
    throw std::invalid_argument("EvaluationHarness requires a dataset and a provider");
  }
  if (!options_.sleeper) {
    options_.sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::filesystem::path EvaluationHarness::ResultsPath(const std::string& split) const {
  return options_.results_dir / (provider_->Name() + "_" + dataset_->Name() + "_" + dataset_->Language() + "_" + split + "_results.csv");
}

EvaluationRun EvaluationHarness::Evaluate(const std::string& split, std::int64_t limit) {
  const auto samples = dataset_->Load(split);
  const auto path    = ResultsPath(split);

  EvaluationRun run;
  run.records = EvaluationStore::Load(path);

  std::unordered_set<std::int64_t> processed;
  for (const auto& r : run.records) {
    processed.insert(r.sample_id);
  }

  const std::int64_t done  = static_cast<std::int64_t>(processed.size());
  const std::int64_t quota = limit > 0 ? limit - done : static_cast<std::int64_t>(samples.size()) - done;
  if (quota <= 0) {
    TRANSCRIPTION_LOG_INFO("nothing new to evaluate", {observability::StringField("results", path.string()), observability::IntField("records", done)});
    run.report = Report(run.records);
    return run;
  }

  TRANSCRIPTION_LOG_INFO("evaluation started", {observability::StringField("provider", provider_->Name()), observability::StringField("dataset", dataset_->Name()),
                                                observability::StringField("split", split), observability::IntField("quota", quota)});

  for (std::size_t i = 0; i < samples.size() && static_cast<std::int64_t>(run.processed) < quota; ++i) {
    const auto sample_id = static_cast<std::int64_t>(i);
    if (processed.count(sample_id)) {
      continue;
    }

    if (run.processed > 0) {
      options_.sleeper(options_.inter_sample_delay);
    }
    ++run.processed;

    observability::SpanScope span("evaluation.sample");
    span.SetAttribute("sample_id", sample_id);

    const auto&          sample = samples[i];
    util::ScopedTempFile audio(util::ResolveTempRoot(options_.temp_root.string()), sample.audio.extension().string());
    audio.CopyFrom(sample.audio);

    const auto started = std::chrono::steady_clock::now();
    auto       result  = provider_->Transcribe(audio.Path(), dataset_->ProviderLanguage());
    const auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (!result.ok()) {
      TRANSCRIPTION_LOG_ERROR("evaluation stopped", {observability::IntField("sample_id", sample_id), observability::StringField("error", result.failure().message)});
      result.ThrowIfFailed();
    }

    run.records.push_back(Score(sample_id, sample, result.output(), seconds));
    EvaluationStore::Save(path, run.records);

    TRANSCRIPTION_LOG_INFO("sample evaluated", {observability::IntField("sample_id", sample_id), observability::DoubleField("metric", run.records.back().metric_value),
                                                observability::DoubleField("seconds", seconds)});
  }

  run.report = Report(run.records);
  return run;
}

EvaluationRecord EvaluationHarness::Score(std::int64_t sample_id, const Sample& sample, const providers::ProviderOutput& output, double seconds) const {
  EvaluationRecord record;
  record.sample_id       = sample_id;
  record.processing_time = seconds;

  switch (dataset_->Metric()) {
    case MetricKind::kDer: {
      const auto transcript = providers::ToTranscript(output, options_.max_segment_length);
      const auto hypothesis = TurnsOf(transcript.segments);
      record.reference      = FormatTurns(sample.turns);
      record.hypothesis     = FormatTurns(hypothesis);
      record.metric_value   = scoring::Der(sample.turns, hypothesis);
      break;
    }
    case MetricKind::kCer:
      record.reference    = sample.reference;
      record.hypothesis   = providers::FlatText(output);
      record.metric_value = scoring::Cer(record.reference, record.hypothesis);
      break;
    case MetricKind::kWer:
      record.reference    = sample.reference;
      record.hypothesis   = providers::FlatText(output);
      record.metric_value = scoring::Wer(record.reference, record.hypothesis);
      break;
  }
  return record;
}

EvaluationReport EvaluationHarness::Report(const std::vector<EvaluationRecord>& records) const {
  EvaluationReport report;
  report.provider = provider_->Name();
  report.dataset  = dataset_->Name();
  report.language = dataset_->Language();
  report.metric   = dataset_->Metric();
  report.samples  = records.size();

  if (records.empty()) {
    return report;
  }

  std::vector<std::string> references;
  std::vector<std::string> hypotheses;
  double                   der_sum = 0.0;
  for (const auto& r : records) {
    references.push_back(r.reference);
    hypotheses.push_back(r.hypothesis);
    der_sum += r.metric_value;
    report.total_time += r.processing_time;
  }
  report.mean_time = report.total_time / static_cast<double>(records.size());

  switch (report.metric) {
    case MetricKind::kWer:
      report.metric_value = scoring::CorpusWer(references, hypotheses);
      break;
    case MetricKind::kCer:
      report.metric_value = scoring::CorpusCer(references, hypotheses);
      break;
    case MetricKind::kDer:
      report.metric_value = der_sum / static_cast<double>(records.size());
      break;
  }
  return report;
}

EvaluationReport EvaluationHarness::ReportFromFile(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("results file not found: " + path.string());
  }
  return Report(EvaluationStore::Load(path));
}

std::string EvaluationReport::Format() const {
  std::ostringstream out;
  out << "Results for " << provider << " on " << dataset << " dataset (" << language << "):\n";
  out << "Total samples processed: " << samples << "\n";

  out << std::fixed << std::setprecision(4);
  out << MetricName(metric) << ": " << metric_value << " (" << std::setprecision(2) << metric_value * 100.0 << "%)\n";

  if (samples > 0) {
    out << "Average processing time: " << mean_time << " seconds\n";
    out << "Total processing time: " << total_time << " seconds (" << TotalMinutes() << " minutes)\n";
  }
  return out.str();
}

} // namespace transcription::evaluation
