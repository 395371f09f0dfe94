#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "http_client.hpp"
#include "transcription/manager/providers/v1/gemini.pb.h"

namespace transcription::providers {

struct GeminiOptions {
  std::string api_key;
  std::string model             = "models/gemini-2.0-pro-exp-02-05";
  std::string endpoint          = "https://generativelanguage.googleapis.com";
  long        poll_interval_ms  = 10000;
  int         max_poll_attempts = 90;
  long        timeout_ms        = 0;
};

/*
  Thin REST client for the Gemini file and generation endpoints.

  Shared by the transcription provider and the summarizer. Every failure
  (transport, non-2xx, file processing FAILED, poll budget exhausted) throws
  util::ProviderError.
*/
class GeminiClient {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  GeminiClient(GeminiOptions options, HttpTransportPtr transport, Sleeper sleeper = {});

  // resumable upload, then polls until the file leaves PROCESSING
  transcription::manager::providers::v1::GeminiFile UploadFile(const std::filesystem::path& path, const std::string& mime_type);

  // concatenated text of the first candidate, code fences removed
  std::string GenerateContent(transcription::manager::providers::v1::GeminiGenerateRequest request);

  const GeminiOptions& Options() const {
    return options_;
  }

  bool Configured() const {
    return !options_.api_key.empty();
  }

 private:
  HttpResponse SendChecked(const HttpRequest& request, std::string_view what);

  transcription::manager::providers::v1::GeminiFile WaitUntilProcessed(transcription::manager::providers::v1::GeminiFile file);

  GeminiOptions    options_;
  HttpTransportPtr transport_;
  Sleeper          sleeper_;
};

// ```json ... ``` -> ...
std::string StripCodeFences(std::string_view text);

} // namespace transcription::providers
