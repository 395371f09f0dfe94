#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gemini_client.hpp"
#include "summarizer.hpp"

namespace transcription::providers {

class GeminiSummarizer final : public Summarizer {
 public:
  explicit GeminiSummarizer(std::shared_ptr<GeminiClient> client);

  transcription::manager::core::v1::Summary Summarize(const std::vector<model::Segment>& segments) override;

 private:
  std::shared_ptr<GeminiClient> client_;
};

// one "[12.34s] SPEAKER: text" line per segment
std::string FormatTranscriptForSummary(const std::vector<model::Segment>& segments);

// throws util::ParseError
transcription::manager::core::v1::Summary ParseGeminiSummary(const std::string& json);

} // namespace transcription::providers
