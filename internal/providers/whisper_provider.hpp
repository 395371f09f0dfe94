#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transcription_provider.hpp"

struct whisper_context;

namespace transcription::providers {

/*
  Process-owned whisper.cpp model.

  Loaded once at startup and released with the last owner. Inference on a
  whisper_context is not reentrant, so callers go through Acquire(), which
  serializes access for the lifetime of the returned lease.
*/
class WhisperModel {
 public:
  class Lease {
   public:
    whisper_context* Get() const {
      return ctx_;
    }

   private:
    friend class WhisperModel;
    Lease(std::unique_lock<std::mutex> lock, whisper_context* ctx) : lock_(std::move(lock)), ctx_(ctx) {
    }

    std::unique_lock<std::mutex> lock_;
    whisper_context*             ctx_;
  };

  // throws util::ProviderError when the model cannot be loaded
  explicit WhisperModel(const std::filesystem::path& model_path);
  ~WhisperModel();

  WhisperModel(const WhisperModel&)            = delete;
  WhisperModel& operator=(const WhisperModel&) = delete;

  Lease Acquire();

 private:
  std::mutex       mutex_;
  whisper_context* ctx_ = nullptr;
};

struct WhisperOptions {
  int         threads     = 0; // 0: min(8, hardware_concurrency)
  std::string ffmpeg_path = "ffmpeg";
};

/*
  Local whisper.cpp recognizer. Segment-level output without diarization;
  every segment is attributed to the UNKNOWN speaker.
*/
class WhisperProvider final : public TranscriptionProvider {
 public:
  WhisperProvider(std::shared_ptr<WhisperModel> model, WhisperOptions options);

  std::string Name() const override {
    return "whisper";
  }

  TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) override;

 private:
  std::shared_ptr<WhisperModel> model_;
  WhisperOptions                options_;
};

// 16 kHz mono float PCM via ffmpeg; throws util::ProviderError
std::vector<float> DecodePcm16kMono(const std::string& ffmpeg_path, const std::filesystem::path& audio_path);

} // namespace transcription::providers
