#include "mime_type.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

namespace transcription::util {

namespace {

// first entry per MIME type wins for the reverse lookup
constexpr std::pair<std::string_view, std::string_view> kTypes[] = {
    {".mp3", "audio/mpeg"},  {".wav", "audio/wav"},   {".m4a", "audio/mp4"},       {".aac", "audio/aac"},
    {".ogg", "audio/ogg"},   {".opus", "audio/ogg"},  {".flac", "audio/flac"},     {".webm", "audio/webm"},
    {".mp4", "video/mp4"},   {".mov", "video/quicktime"}, {".mkv", "video/x-matroska"},
};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

std::string GuessMimeType(const std::filesystem::path& path) {
  const std::string ext = Lower(path.extension().string());
  for (const auto& [e, type] : kTypes) {
    if (e == ext) {
      return std::string(type);
    }
  }
  return "application/octet-stream";
}

std::string ExtensionForMimeType(const std::string& mime_type) {
  const std::string type = Lower(mime_type);
  for (const auto& [ext, t] : kTypes) {
    if (t == type) {
      return std::string(ext);
    }
  }
  return {};
}

} // namespace transcription::util
