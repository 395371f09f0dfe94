#include "gemini_summarizer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdio>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace transcription::providers {

namespace v1     = transcription::manager::providers::v1;
namespace corev1 = transcription::manager::core::v1;

namespace {

constexpr const char* kSystemInstruction = R"(You are an AI assistant specialized in summarizing transcribed content.
Provide a summary that captures the main points of the transcript in JSON format.
The summary should be in the same language as the transcript.
Return a list of summary points, where each point includes:
1. "text" - The summary point text without timestamp
2. "timestamp" - The timestamp in seconds where this information appears

Format your response as valid JSON with the following structure:
{
  "summary_points": [
    {"text": "First main point", "timestamp": 45.2},
    {"text": "Second main point", "timestamp": 120.5}
  ],
  "overview": "Overall summary of the content."
}

Ensure timestamps are provided as numbers, not strings.)";

std::string BuildPrompt(const std::string& transcript) {
  return "Please provide a summary of the following transcript:\n\n" + transcript +
         "\nFor each key point in your summary, include a reference to the timestamp (in seconds)\n"
         "where this information appears in the transcript. Format each point as:\n\n"
         "- Point summary text [timestamp]\n";
}

} // namespace

std::string FormatTranscriptForSummary(const std::vector<model::Segment>& segments) {
  std::string out;
  char        stamp[32];
  for (const auto& segment : segments) {
    std::snprintf(stamp, sizeof(stamp), "[%.2fs] ", segment.start);
    out += stamp;
    out += segment.speaker;
    out += ": ";
    out += segment.text;
    out += '\n';
  }
  return out;
}

corev1::Summary ParseGeminiSummary(const std::string& json) {
  v1::GeminiSummary parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
  if (!status.ok()) {
    throw util::ParseError("google: summary is not valid JSON: " + std::string(status.message()));
  }
  if (parsed.overview().empty() && parsed.summary_points().empty()) {
    throw util::ParseError("google: summary has neither overview nor points");
  }

  corev1::Summary summary;
  summary.set_overview(parsed.overview());
  for (const auto& p : parsed.summary_points()) {
    if (!std::isfinite(p.timestamp()) || p.timestamp() < 0) {
      throw util::ParseError("google: summary point has invalid timestamp");
    }
    auto* point = summary.add_summary_points();
    point->set_text(p.text());
    point->set_timestamp(p.timestamp());
  }
  return summary;
}

GeminiSummarizer::GeminiSummarizer(std::shared_ptr<GeminiClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("GeminiSummarizer: client is null");
  }
}

corev1::Summary GeminiSummarizer::Summarize(const std::vector<model::Segment>& segments) {
  observability::SpanScope span("provider.google.summarize");

  v1::GeminiGenerateRequest request;
  request.mutable_system_instruction()->add_parts()->set_text(kSystemInstruction);
  auto* content = request.add_contents();
  content->set_role("user");
  content->add_parts()->set_text(BuildPrompt(FormatTranscriptForSummary(segments)));
  request.mutable_generation_config()->set_response_mime_type("application/json");

  // ProviderError propagates as is
  return ParseGeminiSummary(client_->GenerateContent(std::move(request)));
}

} // namespace transcription::providers
