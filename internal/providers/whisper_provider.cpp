#include "whisper_provider.hpp"

#include <whisper.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace transcription::providers {

namespace {

void SilenceWhisper(enum ggml_log_level, const char*, void*) {
}

// mean probability of the non-special tokens of a segment
double SegmentConfidence(whisper_context* ctx, int segment) {
  const int n_tokens = whisper_full_n_tokens(ctx, segment);
  double    sum      = 0.0;
  int       count    = 0;
  for (int i = 0; i < n_tokens; ++i) {
    const whisper_token_data token = whisper_full_get_token_data(ctx, segment, i);
    if (token.id < whisper_token_eot(ctx)) {
      sum += token.p;
      ++count;
    }
  }
  return count > 0 ? sum / count : model::kDefaultConfidence;
}

} // namespace

WhisperModel::WhisperModel(const std::filesystem::path& model_path) {
  whisper_log_set(SilenceWhisper, nullptr);

  whisper_context_params params = whisper_context_default_params();
  ctx_                          = whisper_init_from_file_with_params(model_path.c_str(), params);
  if (!ctx_) {
    throw util::ProviderError("whisper: failed to load model from " + model_path.string());
  }
  TRANSCRIPTION_LOG_INFO("whisper model loaded", {observability::StringField("path", model_path.string()),
                                                  observability::BoolField("multilingual", whisper_is_multilingual(ctx_) != 0)});
}

WhisperModel::~WhisperModel() {
  if (ctx_) {
    whisper_free(ctx_);
  }
}

WhisperModel::Lease WhisperModel::Acquire() {
  return Lease(std::unique_lock<std::mutex>(mutex_), ctx_);
}

std::vector<float> DecodePcm16kMono(const std::string& ffmpeg_path, const std::filesystem::path& audio_path) {
  const std::string command = util::ShellQuote(ffmpeg_path) + " -hide_banner -loglevel error -nostdin -i " + util::ShellQuote(audio_path.string()) +
                              " -ar " + std::to_string(WHISPER_SAMPLE_RATE) + " -ac 1 -f f32le -";

  FILE* pipe = popen(command.c_str(), "r");
  if (!pipe) {
    throw util::ProviderError("whisper: cannot start ffmpeg: " + std::string(std::strerror(errno)));
  }

  std::vector<float>      pcm;
  std::array<float, 4096> chunk;
  std::size_t             n = 0;
  while ((n = std::fread(chunk.data(), sizeof(float), chunk.size(), pipe)) > 0) {
    pcm.insert(pcm.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
  }

  if (pclose(pipe) != 0) {
    throw util::ProviderError("whisper: ffmpeg could not decode " + audio_path.string());
  }
  if (pcm.empty()) {
    throw util::ProviderError("whisper: no audio samples in " + audio_path.string());
  }
  return pcm;
}

WhisperProvider::WhisperProvider(std::shared_ptr<WhisperModel> model, WhisperOptions options)
    : model_(std::move(model)), options_(std::move(options)) {
  if (!model_) {
    throw std::invalid_argument("WhisperProvider: model is null");
  }
}

TranscribeResult WhisperProvider::Transcribe(const std::filesystem::path& audio_path, const std::string& language) {
  observability::SpanScope span("provider.whisper.transcribe");
  const auto               started = std::chrono::steady_clock::now();

  std::vector<float> pcm;
  try {
    pcm = DecodePcm16kMono(options_.ffmpeg_path, audio_path);
  } catch (const util::ProviderError& e) {
    span.RecordException(e.what());
    return TranscribeResult::Failure(e.what());
  }

  whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  params.language            = language.empty() || language == "auto" ? nullptr : language.c_str();
  params.n_threads           = options_.threads > 0 ? options_.threads : std::min(8, static_cast<int>(std::thread::hardware_concurrency()));
  params.print_progress      = false;
  params.print_special       = false;
  params.print_realtime      = false;
  params.print_timestamps    = false;

  ProviderOutput output;
  output.kind = ProviderOutput::Kind::kSegments;
  {
    auto             lease = model_->Acquire();
    whisper_context* ctx   = lease.Get();

    if (const int rc = whisper_full(ctx, params, pcm.data(), static_cast<int>(pcm.size())); rc != 0) {
      span.RecordException("whisper_full failed");
      return TranscribeResult::Failure("whisper: inference failed with code " + std::to_string(rc));
    }

    const int n_segments = whisper_full_n_segments(ctx);
    output.segments.reserve(n_segments);
    for (int i = 0; i < n_segments; ++i) {
      model::Segment segment;
      // t0/t1 are in 10 ms units
      segment.start = static_cast<double>(whisper_full_get_segment_t0(ctx, i)) / 100.0;
      segment.end   = static_cast<double>(whisper_full_get_segment_t1(ctx, i)) / 100.0;
      const char* text = whisper_full_get_segment_text(ctx, i);
      segment.text     = text ? text : "";

      model::Word word;
      word.start      = segment.start;
      word.end        = segment.end;
      word.text       = segment.text;
      word.confidence = SegmentConfidence(ctx, i);
      segment.words.push_back(std::move(word));

      output.segments.push_back(std::move(segment));
    }

    const char* lang         = whisper_lang_str(whisper_full_lang_id(ctx));
    output.detected_language = lang ? lang : "";
  }

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), true, elapsed_ms);
  return TranscribeResult::Success(std::move(output));
}

} // namespace transcription::providers
