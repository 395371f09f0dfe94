#include "gemini_client.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::providers {

namespace v1 = transcription::manager::providers::v1;

namespace {

constexpr std::string_view kFileProcessing = "PROCESSING";
constexpr std::string_view kFileFailed     = "FAILED";

std::string ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::ProviderError("google: cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

template <typename Message>
Message ParseEnvelope(const std::string& body, std::string_view what) {
  Message message;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    throw util::ProviderError("google: malformed " + std::string(what) + " response: " + std::string(status.message()));
  }
  return message;
}

} // namespace

GeminiClient::GeminiClient(GeminiOptions options, HttpTransportPtr transport, Sleeper sleeper)
    : options_(std::move(options)), transport_(std::move(transport)), sleeper_(std::move(sleeper)) {
  if (!transport_) {
    throw std::invalid_argument("GeminiClient: transport is null");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

HttpResponse GeminiClient::SendChecked(const HttpRequest& request, std::string_view what) {
  if (!Configured()) {
    throw util::ProviderError("google: API key not configured (set GOOGLE_API_KEY)");
  }

  HttpResponse response = transport_->Send(request);
  if (!response.Ok()) {
    throw util::ProviderError("google: " + std::string(what) + " failed: " + DescribeHttpError(response));
  }
  return response;
}

v1::GeminiFile GeminiClient::UploadFile(const std::filesystem::path& path, const std::string& mime_type) {
  const std::string bytes = ReadFileBytes(path);

  v1::GeminiFileMetadataRequest metadata;
  metadata.mutable_file()->set_display_name(path.filename().string());
  std::string metadata_json;
  if (!google::protobuf::util::MessageToJsonString(metadata, &metadata_json).ok()) {
    throw std::runtime_error("google: failed to encode upload metadata");
  }

  HttpRequest start;
  start.url        = options_.endpoint + "/upload/v1beta/files";
  start.timeout_ms = options_.timeout_ms;
  start.body       = metadata_json;
  start.headers    = {
      "x-goog-api-key: " + options_.api_key,
      "X-Goog-Upload-Protocol: resumable",
      "X-Goog-Upload-Command: start",
      "X-Goog-Upload-Header-Content-Length: " + std::to_string(bytes.size()),
      "X-Goog-Upload-Header-Content-Type: " + mime_type,
      "Content-Type: application/json",
  };

  const std::string upload_url = SendChecked(start, "upload start").Header("x-goog-upload-url");
  if (upload_url.empty()) {
    throw util::ProviderError("google: upload start returned no upload URL");
  }

  HttpRequest upload;
  upload.url        = upload_url;
  upload.timeout_ms = options_.timeout_ms;
  upload.body       = bytes;
  upload.headers    = {
      "X-Goog-Upload-Offset: 0",
      "X-Goog-Upload-Command: upload, finalize",
  };

  auto envelope = ParseEnvelope<v1::GeminiFileEnvelope>(SendChecked(upload, "upload").body, "upload");
  if (envelope.file().name().empty()) {
    throw util::ProviderError("google: upload response carries no file name");
  }

  TRANSCRIPTION_LOG_INFO("gemini file uploaded", {observability::StringField("file", envelope.file().name()),
                                                  observability::IntField("bytes", static_cast<std::int64_t>(bytes.size()))});

  return WaitUntilProcessed(envelope.file());
}

v1::GeminiFile GeminiClient::WaitUntilProcessed(v1::GeminiFile file) {
  int attempts = 0;
  while (file.state() == kFileProcessing) {
    if (++attempts > options_.max_poll_attempts) {
      throw util::ProviderError("google: file " + file.name() + " still processing after " + std::to_string(options_.max_poll_attempts) + " polls");
    }
    sleeper_(std::chrono::milliseconds(options_.poll_interval_ms));

    HttpRequest poll;
    poll.method     = "GET";
    poll.url        = options_.endpoint + "/v1beta/" + file.name();
    poll.timeout_ms = options_.timeout_ms;
    poll.headers    = {"x-goog-api-key: " + options_.api_key};

    file = ParseEnvelope<v1::GeminiFile>(SendChecked(poll, "file status").body, "file status");
  }

  if (file.state() == kFileFailed) {
    throw util::ProviderError("google: processing of " + file.name() + " failed");
  }
  return file;
}

std::string GeminiClient::GenerateContent(v1::GeminiGenerateRequest request) {
  std::string body;
  if (!google::protobuf::util::MessageToJsonString(request, &body).ok()) {
    throw std::runtime_error("google: failed to encode generate request");
  }

  HttpRequest http;
  http.url        = options_.endpoint + "/v1beta/" + options_.model + ":generateContent";
  http.timeout_ms = options_.timeout_ms;
  http.body       = std::move(body);
  http.headers    = {"x-goog-api-key: " + options_.api_key, "Content-Type: application/json"};

  auto response = ParseEnvelope<v1::GeminiGenerateResponse>(SendChecked(http, "generateContent").body, "generateContent");
  if (response.candidates().empty()) {
    throw util::ProviderError("google: generateContent returned no candidates");
  }

  std::string text;
  for (const auto& part : response.candidates(0).content().parts()) {
    text += part.text();
  }
  if (util::TrimView(text).empty()) {
    throw util::ProviderError("google: empty response (finish reason " + response.candidates(0).finish_reason() + ")");
  }
  return StripCodeFences(text);
}

std::string StripCodeFences(std::string_view text) {
  std::string_view body = util::TrimView(text);
  if (body.substr(0, 3) != "```") {
    return std::string(body);
  }

  // drop the opening fence line, including any language tag
  const auto newline = body.find('\n');
  body               = newline == std::string_view::npos ? std::string_view() : body.substr(newline + 1);

  const auto closing = body.rfind("```");
  if (closing != std::string_view::npos) {
    body = body.substr(0, closing);
  }
  return util::Trim(body);
}

} // namespace transcription::providers
