#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "gemini_client.hpp"
#include "transcription_provider.hpp"

namespace transcription::providers {

/*
  Gemini transcription: uploads the audio, asks the model for diarized
  segments as JSON and converts the MM:SS.mmm timestamps to seconds.
*/
class GeminiProvider final : public TranscriptionProvider {
 public:
  explicit GeminiProvider(std::shared_ptr<GeminiClient> client);

  std::string Name() const override {
    return "google";
  }

  TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) override;

 private:
  std::shared_ptr<GeminiClient> client_;
};

// "MM:SS" or "MM:SS.mmm" -> seconds; anything else throws util::ParseError
double ParseTimestamp(std::string_view timestamp);

std::string BuildTranscriptionPrompt(const std::string& language);

transcription::manager::providers::v1::GeminiGenerateRequest BuildTranscriptionRequest(const transcription::manager::providers::v1::GeminiFile& file,
                                                                                         const std::string& language);

// model JSON -> segment output; throws util::ParseError
ProviderOutput ParseGeminiTranscription(const std::string& json);

} // namespace transcription::providers
