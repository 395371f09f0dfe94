#pragma once

#include <string>

#include "http_client.hpp"
#include "transcription_provider.hpp"

namespace transcription::providers {

struct ElevenLabsOptions {
  std::string api_key;
  std::string model_id   = "scribe_v1";
  std::string endpoint   = "https://api.elevenlabs.io";
  long        timeout_ms = 0;
};

/*
  ElevenLabs speech-to-text with diarization.

  Returns word-level tokens (spacing included); segment building happens in
  the caller.
*/
class ElevenLabsProvider final : public TranscriptionProvider {
 public:
  ElevenLabsProvider(ElevenLabsOptions options, HttpTransportPtr transport);

  std::string Name() const override {
    return "elevenlabs";
  }

  TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) override;

 private:
  ElevenLabsOptions options_;
  HttpTransportPtr  transport_;
};

// ISO 639-1 to the 639-2 codes the API expects. Empty means auto-detect.
std::string ElevenLabsLanguageCode(const std::string& language);

// throws util::ParseError
ProviderOutput ParseElevenLabsResponse(const std::string& body);

} // namespace transcription::providers
