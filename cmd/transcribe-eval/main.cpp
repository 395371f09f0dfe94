#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/evaluation/callhome_dataset.hpp"
#include "internal/evaluation/common_voice_dataset.hpp"
#include "internal/evaluation/evaluation_harness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/providers/provider_context.hpp"
#include "internal/util/errors.hpp"

using namespace transcription;

namespace {

constexpr const char* kDefaultCommonVoiceRoot = "evaluate/data/common_voice";
constexpr const char* kDefaultCallHomeRoot    = "evaluate/data/callhome";

void Usage() {
  std::cerr << "Usage:\n"
            << "  transcribe-eval [options] evaluate [--split test] [--limit 0]\n"
            << "  transcribe-eval [options] report [--split test] [--results-file <name>]\n"
            << "Options:\n"
            << "  --service elevenlabs|google|whisper   (default elevenlabs)\n"
            << "  --dataset common_voice|callhome       (default common_voice)\n"
            << "  --language <code>|mixed               (default en; mixed pairs en and vi clips)\n"
            << "  --results-dir <dir>                   (default evaluate/results)\n"
            << "  --config <config.yaml>                provider credentials and dataset roots\n";
}

struct Options {
  std::string  mode     = "evaluate";
  std::string  service  = "elevenlabs";
  std::string  dataset  = "common_voice";
  std::string  language = "en";
  std::string  split    = "test";
  std::int64_t limit    = 0;
  std::string  results_dir;
  std::string  results_file;
  std::string  config_path;
};

// false on malformed arguments
bool ParseArgs(int argc, char** argv, Options& options) {
  const std::map<std::string, std::string*> string_flags = {
      {"--service", &options.service},         {"--dataset", &options.dataset},           {"--language", &options.language},
      {"--split", &options.split},             {"--results-dir", &options.results_dir},   {"--results-file", &options.results_file},
      {"--config", &options.config_path},
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "evaluate" || arg == "report") {
      options.mode = arg;
      continue;
    }
    if (i + 1 >= argc) {
      return false;
    }
    if (arg == "--limit") {
      options.limit = std::stoll(argv[++i]);
      continue;
    }
    auto it = string_flags.find(arg);
    if (it == string_flags.end()) {
      return false;
    }
    *it->second = argv[++i];
  }

  // older result files name the local model whisperx
  if (options.service == "whisperx") {
    options.service = "whisper";
  }
  return true;
}

std::shared_ptr<evaluation::Dataset> MakeDataset(const Options& options, const runtime::config::EvaluationConfig& config) {
  if (options.dataset == "common_voice") {
    const std::string root = config.common_voice_root().empty() ? kDefaultCommonVoiceRoot : config.common_voice_root();
    const std::size_t mixed_samples = options.limit > 0 ? static_cast<std::size_t>(options.limit) : evaluation::kMixedDefaultSamples;
    return std::make_shared<evaluation::CommonVoiceDataset>(root, options.language, evaluation::FfmpegJoiner(), mixed_samples);
  }
  if (options.dataset == "callhome") {
    const std::string root = config.callhome_root().empty() ? kDefaultCallHomeRoot : config.callhome_root();
    return std::make_shared<evaluation::CallHomeDataset>(root, options.language);
  }
  throw util::ValidationError("unknown dataset: " + options.dataset);
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  try {
    if (!ParseArgs(argc, argv, options)) {
      Usage();
      return 1;
    }
  } catch (const std::exception&) {
    Usage();
    return 1;
  }

  try {
    runtime::config::RuntimeConfig config;
    if (!options.config_path.empty()) {
      config = config::ConfigLoader::LoadFromYaml(options.config_path);
    } else {
      config::ConfigLoader::ApplyEnvironmentOverrides(config);
    }
    observability::InitializeLogging(config);

    const auto& eval_config = config.evaluation();

    evaluation::EvaluationOptions eval_options;
    eval_options.results_dir = !options.results_dir.empty()        ? options.results_dir
                               : !eval_config.results_dir().empty() ? eval_config.results_dir()
                                                                    : std::string("evaluate/results");
    if (eval_config.inter_sample_delay_ms() > 0) {
      eval_options.inter_sample_delay = std::chrono::milliseconds(eval_config.inter_sample_delay_ms());
    }
    eval_options.temp_root = config.providers().temp_dir();
    if (config.providers().max_segment_length() > 0) {
      eval_options.max_segment_length = config.providers().max_segment_length();
    }

    auto providers = providers::ProviderContext::FromConfig(config);
    auto dataset   = MakeDataset(options, eval_config);

    evaluation::EvaluationHarness harness(dataset, providers->Get(options.service), eval_options);

    if (options.mode == "evaluate") {
      std::cout << "Testing " << options.service << " on " << options.dataset << " dataset (" << options.language << ")\n";
      const auto run = harness.Evaluate(options.split, options.limit);
      std::cout << "Processed " << run.processed << " new samples\n" << run.report.Format();
    } else {
      std::cout << "Generating report for " << options.service << " on " << options.dataset << " dataset (" << options.language << ")\n";
      const auto path = options.results_file.empty() ? harness.ResultsPath(options.split)
                                                     : std::filesystem::path(eval_options.results_dir) / options.results_file;
      std::cout << harness.ReportFromFile(path).Format();
    }
  } catch (const std::exception& e) {
    TRANSCRIPTION_LOG_ERROR("evaluation failed", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }

  observability::ShutdownLogging();
  return 0;
}
