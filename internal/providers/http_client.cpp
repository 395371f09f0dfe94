#include "http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace transcription::providers {

namespace {

constexpr std::size_t kErrorBodyLimit = 512;

size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(contents, total);
  return total;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
  const size_t total   = size * nitems;
  auto*        headers = static_cast<std::map<std::string, std::string>*>(userp);

  std::string_view line(buffer, total);
  const auto       colon = line.find(':');
  if (colon != std::string_view::npos) {
    std::string name(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    (*headers)[name] = util::Trim(line.substr(colon + 1));
  }
  return total;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

struct MimeDeleter {
  void operator()(curl_mime* mime) const {
    curl_mime_free(mime);
  }
};

void InitCurlOnce() {
  static std::once_flag once;
  std::call_once(once, [] {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
  });
}

} // namespace

std::string HttpResponse::Header(const std::string& lowercase_name) const {
  auto it = headers.find(lowercase_name);
  return it == headers.end() ? std::string() : it->second;
}

CurlHttpTransport::CurlHttpTransport() {
  InitCurlOnce();
}

HttpResponse CurlHttpTransport::Send(const HttpRequest& request) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::ProviderError("failed to initialize HTTP client");
  }

  HttpResponse response;
  CURL*        handle = curl.get();

  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

  // required for multi-threaded use: no signals for timeouts
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 10L);
  if (request.timeout_ms > 0) {
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, request.timeout_ms);
  }

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  for (const auto& header : request.headers) {
    curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
    if (!appended) {
      throw util::ProviderError("failed to build request headers");
    }
    headers.release();
    headers.reset(appended);
  }
  if (headers) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  }

  std::unique_ptr<curl_mime, MimeDeleter> mime;
  if (!request.form.empty()) {
    mime.reset(curl_mime_init(handle));
    for (const auto& field : request.form) {
      curl_mimepart* part = curl_mime_addpart(mime.get());
      curl_mime_name(part, field.name.c_str());
      if (!field.file.empty()) {
        if (curl_mime_filedata(part, field.file.string().c_str()) != CURLE_OK) {
          throw util::ProviderError("cannot attach " + field.file.string());
        }
      } else {
        curl_mime_data(part, field.value.data(), field.value.size());
      }
      if (!field.content_type.empty()) {
        curl_mime_type(part, field.content_type.c_str());
      }
    }
    curl_easy_setopt(handle, CURLOPT_MIMEPOST, mime.get());
  } else if (request.method == "POST") {
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
  } else if (request.method != "GET") {
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.body.empty()) {
      curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
      curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
  }

  const CURLcode rc = curl_easy_perform(handle);
  if (rc != CURLE_OK) {
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      throw util::ProviderError("request to " + request.url + " timed out");
    }
    throw util::ProviderError(std::string("HTTP request failed: ") + curl_easy_strerror(rc));
  }

  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

std::string DescribeHttpError(const HttpResponse& response) {
  std::string message = "HTTP " + std::to_string(response.status_code);
  if (!response.body.empty()) {
    message += ": " + response.body.substr(0, kErrorBodyLimit);
  }
  return message;
}

} // namespace transcription::providers
