#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/segment.hpp"

namespace transcription::providers {

/*
  What a provider hands back on success.

  Word-level recognizers fill `tokens` (spacing tokens included) and leave
  segment building to the SegmentBuilder; segment-level recognizers fill
  `segments` directly.
*/
struct ProviderOutput {
  enum class Kind { kTokens, kSegments };

  Kind                        kind = Kind::kTokens;
  std::vector<model::Word>    tokens;
  std::vector<model::Segment> segments;
  std::string                 detected_language;

  // flat transcript text when the vendor returns one
  std::string text;
};

struct ProviderFailure {
  enum class Kind {
    kUpstream, // network, HTTP status, vendor-side failure
    kParse     // response could not be mapped onto Word/Segment
  };

  Kind        kind = Kind::kUpstream;
  std::string message;
};

/*
  Either a ProviderOutput or a ProviderFailure; callers branch on ok().
*/
class TranscribeResult {
 public:
  static TranscribeResult Success(ProviderOutput output) {
    return TranscribeResult(std::move(output));
  }

  static TranscribeResult Failure(std::string message) {
    return TranscribeResult(ProviderFailure{ProviderFailure::Kind::kUpstream, std::move(message)});
  }

  static TranscribeResult ParseFailure(std::string message) {
    return TranscribeResult(ProviderFailure{ProviderFailure::Kind::kParse, std::move(message)});
  }

  bool ok() const {
    return std::holds_alternative<ProviderOutput>(value_);
  }

  const ProviderOutput& output() const {
    return std::get<ProviderOutput>(value_);
  }

  ProviderOutput TakeOutput() {
    return std::move(std::get<ProviderOutput>(value_));
  }

  const ProviderFailure& failure() const {
    return std::get<ProviderFailure>(value_);
  }

  // throws util::ProviderError or util::ParseError for a failure
  void ThrowIfFailed() const;

 private:
  explicit TranscribeResult(std::variant<ProviderOutput, ProviderFailure> value) : value_(std::move(value)) {
  }

  std::variant<ProviderOutput, ProviderFailure> value_;
};

class TranscriptionProvider {
 public:
  virtual ~TranscriptionProvider() = default;

  virtual std::string Name() const = 0;

  // Blocking. language is an ISO 639-1 code or "auto".
  virtual TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) = 0;
};

using TranscriptionProviderPtr = std::shared_ptr<TranscriptionProvider>;

/*
  Token output goes through the SegmentBuilder; segment output is checked and
  normalized. Throws util::ParseError on malformed segments.
*/
model::Transcript ToTranscript(ProviderOutput output, std::size_t max_segment_length);

// Provider text when present, else the segment texts joined by spaces.
std::string FlatText(const ProviderOutput& output);

} // namespace transcription::providers
