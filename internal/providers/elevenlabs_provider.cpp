#include "elevenlabs_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "transcription/manager/providers/v1/elevenlabs.pb.h"

namespace transcription::providers {

namespace v1 = transcription::manager::providers::v1;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string ErrorDetail(const HttpResponse& response) {
  v1::ElevenLabsError error;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (google::protobuf::util::JsonStringToMessage(response.body, &error, options).ok() && !error.detail().message().empty()) {
    return "HTTP " + std::to_string(response.status_code) + ": " + error.detail().message();
  }
  return DescribeHttpError(response);
}

} // namespace

std::string ElevenLabsLanguageCode(const std::string& language) {
  static const std::unordered_map<std::string, std::string> kCodes = {
      {"en", "eng"}, {"fr", "fra"}, {"de", "deu"}, {"es", "spa"}, {"it", "ita"}, {"vi", "vie"},
  };

  if (language.empty() || language == "auto") {
    return {};
  }
  auto it = kCodes.find(Lower(language));
  return it == kCodes.end() ? language : it->second;
}

ProviderOutput ParseElevenLabsResponse(const std::string& body) {
  v1::ElevenLabsTranscript response;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(body, &response, options);
  if (!status.ok()) {
    throw util::ParseError("elevenlabs: malformed response: " + std::string(status.message()));
  }

  ProviderOutput output;
  output.kind              = ProviderOutput::Kind::kTokens;
  output.detected_language = response.language_code();
  output.text              = response.text();
  output.tokens.reserve(response.words_size());

  for (const auto& w : response.words()) {
    if (!std::isfinite(w.start()) || !std::isfinite(w.end()) || w.end() < w.start()) {
      throw util::ParseError("elevenlabs: invalid timing on token '" + w.text() + "'");
    }

    model::Word word;
    word.start      = w.start();
    word.end        = w.end();
    word.text       = w.text();
    word.is_spacing = w.type() == "spacing";
    if (!w.speaker_id().empty()) {
      word.speaker = w.speaker_id();
    }
    if (w.has_logprob()) {
      word.confidence = std::exp(w.logprob());
    }
    output.tokens.push_back(std::move(word));
  }

  return output;
}

ElevenLabsProvider::ElevenLabsProvider(ElevenLabsOptions options, HttpTransportPtr transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("ElevenLabsProvider: transport is null");
  }
}

TranscribeResult ElevenLabsProvider::Transcribe(const std::filesystem::path& audio_path, const std::string& language) {
  if (options_.api_key.empty()) {
    return TranscribeResult::Failure("elevenlabs: API key not configured (set ELEVENLABS_API_KEY)");
  }

  observability::SpanScope span("provider.elevenlabs.transcribe");
  const std::string        code = ElevenLabsLanguageCode(language);

  HttpRequest request;
  request.url        = options_.endpoint + "/v1/speech-to-text";
  request.timeout_ms = options_.timeout_ms;
  request.headers    = {"xi-api-key: " + options_.api_key, "Accept: application/json"};
  request.form       = {
      {"file", "", audio_path, ""},
      {"model_id", options_.model_id, {}, ""},
      {"diarize", "true", {}, ""},
      {"tag_audio_events", "true", {}, ""},
  };
  if (!code.empty()) {
    request.form.push_back({"language_code", code, {}, ""});
  }

  TRANSCRIPTION_LOG_INFO("elevenlabs request", {observability::StringField("language", code.empty() ? "auto" : code)});

  const auto   started = std::chrono::steady_clock::now();
  HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const util::ProviderError& e) {
    span.RecordException(e.what());
    return TranscribeResult::Failure(std::string("elevenlabs: ") + e.what());
  }
  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

  if (!response.Ok()) {
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), false, elapsed_ms);
    span.RecordException(ErrorDetail(response));
    return TranscribeResult::Failure("elevenlabs: " + ErrorDetail(response));
  }

  try {
    auto output = ParseElevenLabsResponse(response.body);
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), true, elapsed_ms);
    span.SetAttribute("tokens", static_cast<std::int64_t>(output.tokens.size()));
    return TranscribeResult::Success(std::move(output));
  } catch (const util::ParseError& e) {
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), false, elapsed_ms);
    span.RecordException(e.what());
    return TranscribeResult::ParseFailure(e.what());
  }
}

} // namespace transcription::providers
