#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "summarizer.hpp"
#include "transcription_provider.hpp"

namespace transcription::runtime::config {
class RuntimeConfig;
}

namespace transcription::providers {

/*
  Provider client handles for the whole process.

  Built once at startup and handed to the job worker, the manager and the
  evaluation harness. Read-only after construction.
*/
class ProviderContext {
 public:
  explicit ProviderContext(std::size_t max_segment_length = 200);

  // elevenlabs and google always, whisper when built in and a model is set
  static std::shared_ptr<ProviderContext> FromConfig(const transcription::runtime::config::RuntimeConfig& config,
                                                     HttpTransportPtr                                    transport = nullptr);

  void Register(TranscriptionProviderPtr provider);
  void SetSummarizer(SummarizerPtr summarizer);

  // throws util::ValidationError for an unknown name
  TranscriptionProviderPtr Get(const std::string& name) const;
  bool                     Has(const std::string& name) const;
  std::vector<std::string> Names() const;

  // throws util::ProviderError when no summarizer is configured
  Summarizer& GetSummarizer() const;

  std::size_t MaxSegmentLength() const {
    return max_segment_length_;
  }

 private:
  std::size_t                                     max_segment_length_;
  std::map<std::string, TranscriptionProviderPtr> providers_;
  SummarizerPtr                                   summarizer_;
};

using ProviderContextPtr = std::shared_ptr<ProviderContext>;

} // namespace transcription::providers
