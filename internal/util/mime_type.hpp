#pragma once

#include <filesystem>
#include <string>

namespace transcription::util {

// by extension, application/octet-stream when unknown
std::string GuessMimeType(const std::filesystem::path& path);

// ".m4a" for audio/mp4 etc., empty when unknown
std::string ExtensionForMimeType(const std::string& mime_type);

} // namespace transcription::util
