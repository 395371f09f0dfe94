#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace transcription::providers {

struct FormField {
  std::string           name;
  std::string           value;
  std::filesystem::path file; // non-empty: upload this file instead of value
  std::string           content_type;
};

struct HttpRequest {
  std::string              method = "POST";
  std::string              url;
  std::vector<std::string> headers; // "Name: value"
  std::string              body;
  std::vector<FormField>   form; // non-empty: multipart/form-data, body ignored
  long                     timeout_ms = 0;
};

struct HttpResponse {
  long                               status_code = 0;
  std::string                        body;
  std::map<std::string, std::string> headers; // lowercase names

  bool Ok() const {
    return status_code >= 200 && status_code < 300;
  }

  std::string Header(const std::string& lowercase_name) const;
};

/*
  Blocking HTTP seam for the vendor clients; tests substitute a fake.

  Transport failures (DNS, connect, timeout) throw util::ProviderError.
  Non-2xx statuses are returned, not thrown.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

/*
  libcurl implementation. One easy handle per request, so a single instance
  is safe to share across worker threads.
*/
class CurlHttpTransport final : public HttpTransport {
 public:
  CurlHttpTransport();

  HttpResponse Send(const HttpRequest& request) override;
};

// "HTTP 429: <body prefix>"
std::string DescribeHttpError(const HttpResponse& response);

} // namespace transcription::providers
