#include "gemini_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/mime_type.hpp"

namespace transcription::providers {

namespace v1 = transcription::manager::providers::v1;

namespace {

constexpr const char* kSystemInstruction = R"(You are a transcription assistant. Your task is to transcribe the audio file provided to you.
Your response must be a JSON object containing 'segments' field.
The 'segments' field must be a list of objects with 'start', 'end', 'text' and 'speaker' fields.
The 'start' and 'end' must follow the format of MM:SS.mmm.
Timestamps should have milli-second level accuracy.
The 'speaker' field must be a string indicating the speaker's name or in the format 'Speaker X'.
Also include a 'language' field with the ISO 639-1 code of the spoken language.)";

bool AllDigits(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

long ToLong(std::string_view digits) {
  long value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    throw util::ParseError("timestamp component out of range: " + std::string(digits));
  }
  return value;
}

} // namespace

double ParseTimestamp(std::string_view timestamp) {
  const auto invalid = [&] { return util::ParseError("invalid timestamp format: '" + std::string(timestamp) + "'"); };

  const auto colon = timestamp.find(':');
  if (colon == std::string_view::npos || timestamp.find(':', colon + 1) != std::string_view::npos) {
    throw invalid();
  }

  std::string_view minutes = timestamp.substr(0, colon);
  std::string_view rest    = timestamp.substr(colon + 1);
  std::string_view seconds = rest;
  std::string_view millis;

  if (const auto dot = rest.find('.'); dot != std::string_view::npos) {
    seconds = rest.substr(0, dot);
    millis  = rest.substr(dot + 1);
    if (!AllDigits(millis) || millis.size() > 3) {
      throw invalid();
    }
  }
  if (!AllDigits(minutes) || !AllDigits(seconds) || seconds.size() > 2) {
    throw invalid();
  }

  const long sec = ToLong(seconds);
  if (sec >= 60) {
    throw invalid();
  }

  // ".5" is half a second
  double fraction = 0.0;
  if (!millis.empty()) {
    long scaled = ToLong(millis);
    for (std::size_t i = millis.size(); i < 3; ++i) {
      scaled *= 10;
    }
    fraction = static_cast<double>(scaled) / 1000.0;
  }

  return static_cast<double>(ToLong(minutes)) * 60.0 + static_cast<double>(sec) + fraction;
}

std::string BuildTranscriptionPrompt(const std::string& language) {
  std::string prompt = "Transcribe the following audio file with correct timestamps";
  if (!language.empty() && language != "auto") {
    prompt += " and translate it to " + language + ".";
  }
  return prompt;
}

v1::GeminiGenerateRequest BuildTranscriptionRequest(const v1::GeminiFile& file, const std::string& language) {
  v1::GeminiGenerateRequest request;
  request.mutable_system_instruction()->add_parts()->set_text(kSystemInstruction);

  auto* content = request.add_contents();
  content->set_role("user");

  auto* file_part = content->add_parts()->mutable_file_data();
  file_part->set_mime_type(file.mime_type());
  file_part->set_file_uri(file.uri());

  content->add_parts()->set_text(BuildTranscriptionPrompt(language));

  request.mutable_generation_config()->set_response_mime_type("application/json");
  return request;
}

ProviderOutput ParseGeminiTranscription(const std::string& json) {
  v1::GeminiTranscription transcription;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(json, &transcription, options);
  if (!status.ok()) {
    throw util::ParseError("google: response is not a transcription object: " + std::string(status.message()));
  }

  ProviderOutput output;
  output.kind              = ProviderOutput::Kind::kSegments;
  output.detected_language = transcription.language();
  output.segments.reserve(transcription.segments_size());

  for (const auto& s : transcription.segments()) {
    model::Segment segment;
    segment.start = ParseTimestamp(s.start());
    segment.end   = ParseTimestamp(s.end());
    segment.text  = s.text();
    if (!s.speaker().empty()) {
      segment.speaker = s.speaker();
    }
    output.segments.push_back(std::move(segment));
  }
  return output;
}

GeminiProvider::GeminiProvider(std::shared_ptr<GeminiClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("GeminiProvider: client is null");
  }
}

TranscribeResult GeminiProvider::Transcribe(const std::filesystem::path& audio_path, const std::string& language) {
  observability::SpanScope span("provider.google.transcribe");
  const auto               started = std::chrono::steady_clock::now();
  const auto               elapsed = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count(); };

  std::string text;
  try {
    const auto file = client_->UploadFile(audio_path, util::GuessMimeType(audio_path));
    text            = client_->GenerateContent(BuildTranscriptionRequest(file, language));
  } catch (const util::ProviderError& e) {
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), false, elapsed());
    span.RecordException(e.what());
    return TranscribeResult::Failure(e.what());
  }

  try {
    auto output = ParseGeminiTranscription(text);
    if (output.detected_language.empty() && language != "auto") {
      output.detected_language = language;
    }
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), true, elapsed());
    span.SetAttribute("segments", static_cast<std::int64_t>(output.segments.size()));
    return TranscribeResult::Success(std::move(output));
  } catch (const util::ParseError& e) {
    observability::Metrics::Instance().ObserveProviderLatencyMs(Name(), false, elapsed());
    TRANSCRIPTION_LOG_WARN("gemini output rejected", {observability::StringField("error", e.what())});
    span.RecordException(e.what());
    return TranscribeResult::ParseFailure(e.what());
  }
}

} // namespace transcription::providers
