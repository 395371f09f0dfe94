#include "internal/providers/gemini_provider.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/providers/gemini_summarizer.hpp"
#include "internal/util/errors.hpp"

namespace {

using transcription::providers::GeminiClient;
using transcription::providers::GeminiOptions;
using transcription::providers::GeminiProvider;
using transcription::providers::HttpRequest;
using transcription::providers::HttpResponse;
using transcription::providers::HttpTransport;
using transcription::providers::ParseTimestamp;
using transcription::providers::ProviderFailure;
using transcription::providers::ProviderOutput;

// replays canned responses in order and records every request
class ScriptedTransport final : public HttpTransport {
 public:
  void Push(long status, std::string body, std::map<std::string, std::string> headers = {}) {
    HttpResponse response;
    response.status_code = status;
    response.body        = std::move(body);
    response.headers     = std::move(headers);
    responses_.push_back(std::move(response));
  }

  HttpResponse Send(const HttpRequest& request) override {
    requests.push_back(request);
    assert(!responses_.empty() && "unexpected request");
    auto response = responses_.front();
    responses_.pop_front();
    return response;
  }

  std::vector<HttpRequest> requests;

 private:
  std::deque<HttpResponse> responses_;
};

std::filesystem::path WriteAudio(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "transcription_gemini_provider_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << "RIFF-fake-wave-bytes";
  return path;
}

GeminiOptions Options() {
  GeminiOptions options;
  options.api_key           = "g-key";
  options.endpoint          = "http://gemini.test";
  options.max_poll_attempts = 3;
  return options;
}

std::string GenerateBody(const std::string& text) {
  return R"({"candidates": [{"content": {"role": "model", "parts": [{"text": )" + text + R"(}]}, "finishReason": "STOP"}]})";
}

void PushUpload(ScriptedTransport& transport, const std::string& state) {
  transport.Push(200, "{}", {{"x-goog-upload-url", "http://gemini.test/upload-session/1"}});
  transport.Push(200, R"({"file": {"name": "files/abc", "mimeType": "audio/wav", "uri": "http://gemini.test/files/abc", "state": ")" + state + R"("}})");
}

void TestParseTimestamp() {
  assert(ParseTimestamp("00:00") == 0.0);
  assert(ParseTimestamp("01:05") == 65.0);
  assert(std::fabs(ParseTimestamp("01:05.250") - 65.25) < 1e-9);
  assert(std::fabs(ParseTimestamp("00:03.5") - 3.5) < 1e-9);
  assert(ParseTimestamp("90:00") == 5400.0);

  for (const char* bad : {"", "5", "1:2:3", "00:60", "00:123", "aa:10", "00:10.", "00:10.1234", "-1:00", "00:1x"}) {
    bool threw = false;
    try {
      (void)ParseTimestamp(bad);
    } catch (const transcription::util::ParseError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestParseTranscription() {
  const ProviderOutput output = transcription::providers::ParseGeminiTranscription(
      R"({"segments": [{"start": "00:00.000", "end": "00:02.500", "text": "Xin chào.", "speaker": "Speaker 1"},
                       {"start": "00:02.500", "end": "00:04.000", "text": "Chào bạn."}],
          "language": "vi"})");

  assert(output.kind == ProviderOutput::Kind::kSegments);
  assert(output.detected_language == "vi");
  assert(output.segments.size() == 2);
  assert(output.segments[0].speaker == "Speaker 1");
  assert(output.segments[1].speaker == transcription::model::kUnknownSpeaker);
  assert(std::fabs(output.segments[0].end - 2.5) < 1e-9);
}

void TestPromptMentionsTargetLanguage() {
  assert(transcription::providers::BuildTranscriptionPrompt("auto").find("translate") == std::string::npos);
  assert(transcription::providers::BuildTranscriptionPrompt("en").find("translate it to en") != std::string::npos);
}

void TestStripCodeFences() {
  assert(transcription::providers::StripCodeFences("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
  assert(transcription::providers::StripCodeFences("  {\"a\": 1} ") == "{\"a\": 1}");
}

void TestTranscribeUploadsPollsAndGenerates() {
  auto transport = std::make_shared<ScriptedTransport>();
  PushUpload(*transport, "PROCESSING");
  transport->Push(200, R"({"name": "files/abc", "mimeType": "audio/wav", "uri": "http://gemini.test/files/abc", "state": "ACTIVE"})");
  transport->Push(200, GenerateBody(R"("```json\n{\"segments\": [{\"start\": \"00:00.000\", \"end\": \"00:01.000\", \"text\": \"Hello.\", \"speaker\": \"Speaker 1\"}]}\n```")"));

  int  sleeps = 0;
  auto client = std::make_shared<GeminiClient>(Options(), transport, [&](std::chrono::milliseconds) { ++sleeps; });

  GeminiProvider provider(client);
  auto           result = provider.Transcribe(WriteAudio("sample.wav"), "en");

  assert(result.ok());
  assert(result.output().segments.size() == 1);
  assert(result.output().segments[0].text == "Hello.");
  // no language in the reply; the requested one is kept
  assert(result.output().detected_language == "en");
  assert(sleeps == 1);

  assert(transport->requests.size() == 4);
  assert(transport->requests[0].url == "http://gemini.test/upload/v1beta/files");
  assert(transport->requests[1].url == "http://gemini.test/upload-session/1");
  assert(transport->requests[2].method == "GET");
  assert(transport->requests[2].url == "http://gemini.test/v1beta/files/abc");
  assert(transport->requests[3].url == "http://gemini.test/v1beta/models/gemini-2.0-pro-exp-02-05:generateContent");
  assert(transport->requests[3].body.find("http://gemini.test/files/abc") != std::string::npos);
}

void TestFailedFileProcessingIsUpstreamFailure() {
  auto transport = std::make_shared<ScriptedTransport>();
  PushUpload(*transport, "FAILED");

  GeminiProvider provider(std::make_shared<GeminiClient>(Options(), transport, [](std::chrono::milliseconds) {}));
  auto           result = provider.Transcribe(WriteAudio("failed.wav"), "auto");

  assert(!result.ok());
  assert(result.failure().kind == ProviderFailure::Kind::kUpstream);
}

void TestPollBudgetIsBounded() {
  auto transport = std::make_shared<ScriptedTransport>();
  PushUpload(*transport, "PROCESSING");
  for (int i = 0; i < 3; ++i) {
    transport->Push(200, R"({"name": "files/abc", "state": "PROCESSING"})");
  }

  GeminiProvider provider(std::make_shared<GeminiClient>(Options(), transport, [](std::chrono::milliseconds) {}));
  auto           result = provider.Transcribe(WriteAudio("slow.wav"), "auto");

  assert(!result.ok());
  assert(result.failure().message.find("still processing") != std::string::npos);
}

void TestBadTimestampIsParseFailure() {
  auto transport = std::make_shared<ScriptedTransport>();
  PushUpload(*transport, "ACTIVE");
  transport->Push(200, GenerateBody(R"("{\"segments\": [{\"start\": \"1:2:3\", \"end\": \"00:01\", \"text\": \"x\"}]}")"));

  GeminiProvider provider(std::make_shared<GeminiClient>(Options(), transport, [](std::chrono::milliseconds) {}));
  auto           result = provider.Transcribe(WriteAudio("bad.wav"), "auto");

  assert(!result.ok());
  assert(result.failure().kind == ProviderFailure::Kind::kParse);
}

void TestSummaryParsingAndFormatting() {
  const auto summary = transcription::providers::ParseGeminiSummary(
      R"({"overview": "A short chat.", "summary_points": [{"text": "Greeting", "timestamp": 0.5}, {"text": "Farewell", "timestamp": 12}]})");
  assert(summary.overview() == "A short chat.");
  assert(summary.summary_points_size() == 2);
  assert(summary.summary_points(1).timestamp() == 12.0);

  bool threw = false;
  try {
    (void)transcription::providers::ParseGeminiSummary("{}");
  } catch (const transcription::util::ParseError&) {
    threw = true;
  }
  assert(threw);

  transcription::model::Segment segment;
  segment.start   = 1.5;
  segment.speaker = "Speaker 1";
  segment.text    = "Hello.";
  assert(transcription::providers::FormatTranscriptForSummary({segment}) == "[1.50s] Speaker 1: Hello.\n");
}

} // namespace

int main() {
  TestParseTimestamp();
  TestParseTranscription();
  TestPromptMentionsTargetLanguage();
  TestStripCodeFences();
  TestTranscribeUploadsPollsAndGenerates();
  TestFailedFileProcessingIsUpstreamFailure();
  TestPollBudgetIsBounded();
  TestBadTimestampIsParseFailure();
  TestSummaryParsingAndFormatting();

  std::cout << "transcription_unit_gemini_provider: pass\n";
  return 0;
}
