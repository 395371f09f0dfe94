#include "provider_context.hpp"

#include "config/config.pb.h"
#include "elevenlabs_provider.hpp"
#include "gemini_client.hpp"
#include "gemini_provider.hpp"
#include "gemini_summarizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

#if TRANSCRIPTION_WITH_WHISPER
#include "whisper_provider.hpp"
#endif

namespace transcription::providers {

ProviderContext::ProviderContext(std::size_t max_segment_length) : max_segment_length_(max_segment_length == 0 ? 200 : max_segment_length) {
}

std::shared_ptr<ProviderContext> ProviderContext::FromConfig(const transcription::runtime::config::RuntimeConfig& config, HttpTransportPtr transport) {
  const auto& cfg = config.providers();
  auto        ctx = std::make_shared<ProviderContext>(cfg.max_segment_length());

  if (!transport) {
    transport = std::make_shared<CurlHttpTransport>();
  }

  ElevenLabsOptions eleven;
  eleven.api_key = cfg.elevenlabs().api_key();
  if (!cfg.elevenlabs().model_id().empty()) {
    eleven.model_id = cfg.elevenlabs().model_id();
  }
  if (!cfg.elevenlabs().endpoint().empty()) {
    eleven.endpoint = cfg.elevenlabs().endpoint();
  }
  eleven.timeout_ms = cfg.elevenlabs().timeout_ms();
  ctx->Register(std::make_shared<ElevenLabsProvider>(eleven, transport));

  GeminiOptions google;
  google.api_key = cfg.google().api_key();
  if (!cfg.google().model().empty()) {
    google.model = cfg.google().model();
  }
  if (!cfg.google().endpoint().empty()) {
    google.endpoint = cfg.google().endpoint();
  }
  if (cfg.google().poll_interval_ms() > 0) {
    google.poll_interval_ms = cfg.google().poll_interval_ms();
  }
  if (cfg.google().max_poll_attempts() > 0) {
    google.max_poll_attempts = static_cast<int>(cfg.google().max_poll_attempts());
  }
  google.timeout_ms = cfg.google().timeout_ms();

  auto gemini = std::make_shared<GeminiClient>(google, transport);
  ctx->Register(std::make_shared<GeminiProvider>(gemini));
  ctx->SetSummarizer(std::make_shared<GeminiSummarizer>(gemini));

  TRANSCRIPTION_LOG_DEBUG("provider credentials", {observability::SecretField("elevenlabs_api_key", eleven.api_key),
                                                    observability::SecretField("google_api_key", google.api_key)});
  if (eleven.api_key.empty()) {
    TRANSCRIPTION_LOG_WARN("ElevenLabs API key not configured", {observability::StringField("provider", "elevenlabs")});
  }
  if (google.api_key.empty()) {
    TRANSCRIPTION_LOG_WARN("Google API key not configured", {observability::StringField("provider", "google")});
  }

#if TRANSCRIPTION_WITH_WHISPER
  if (!cfg.whisper().model_path().empty()) {
    WhisperOptions whisper;
    whisper.threads = static_cast<int>(cfg.whisper().threads());
    if (!cfg.whisper().ffmpeg_path().empty()) {
      whisper.ffmpeg_path = cfg.whisper().ffmpeg_path();
    }
    ctx->Register(std::make_shared<WhisperProvider>(std::make_shared<WhisperModel>(cfg.whisper().model_path()), whisper));
  }
#endif

  TRANSCRIPTION_LOG_INFO("providers ready", {observability::StringField("providers", util::Join(ctx->Names(), ",")),
                                             observability::IntField("max_segment_length", static_cast<std::int64_t>(ctx->MaxSegmentLength()))});
  return ctx;
}

void ProviderContext::Register(TranscriptionProviderPtr provider) {
  if (!provider) {
    throw std::invalid_argument("ProviderContext: provider is null");
  }
  providers_[provider->Name()] = std::move(provider);
}

void ProviderContext::SetSummarizer(SummarizerPtr summarizer) {
  summarizer_ = std::move(summarizer);
}

TranscriptionProviderPtr ProviderContext::Get(const std::string& name) const {
  auto it = providers_.find(name);
  if (it == providers_.end()) {
    throw util::ValidationError("unknown provider '" + name + "' (available: " + util::Join(Names(), ", ") + ")");
  }
  return it->second;
}

bool ProviderContext::Has(const std::string& name) const {
  return providers_.count(name) > 0;
}

std::vector<std::string> ProviderContext::Names() const {
  std::vector<std::string> names;
  names.reserve(providers_.size());
  for (const auto& [name, _] : providers_) {
    names.push_back(name);
  }
  return names;
}

Summarizer& ProviderContext::GetSummarizer() const {
  if (!summarizer_) {
    throw util::ProviderError("no summarizer configured");
  }
  return *summarizer_;
}

} // namespace transcription::providers
