#include "transcription_provider.hpp"

#include "internal/segments/segment_builder.hpp"
#include "internal/segments/segment_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::providers {

void TranscribeResult::ThrowIfFailed() const {
  if (ok()) {
    return;
  }
  const auto& f = failure();
  if (f.kind == ProviderFailure::Kind::kParse) {
    throw util::ParseError(f.message);
  }
  throw util::ProviderError(f.message);
}

model::Transcript ToTranscript(ProviderOutput output, std::size_t max_segment_length) {
  model::Transcript transcript;
  transcript.detected_language = std::move(output.detected_language);

  if (output.kind == ProviderOutput::Kind::kTokens) {
    transcript.segments = segments::BuildSegments(output.tokens, max_segment_length);
  } else {
    transcript.segments = segments::NormalizeSegments(std::move(output.segments));
  }
  return transcript;
}

std::string FlatText(const ProviderOutput& output) {
  if (!output.text.empty()) {
    return output.text;
  }

  std::vector<std::string> parts;
  if (output.kind == ProviderOutput::Kind::kSegments) {
    for (const auto& segment : output.segments) {
      parts.push_back(segment.text);
    }
    return util::Join(parts, " ");
  }

  std::string text;
  for (const auto& token : output.tokens) {
    text += token.text;
  }
  return util::Trim(text);
}

} // namespace transcription::providers
