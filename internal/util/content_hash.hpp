#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace transcription::util {

/*
  SHA-256 content identity of uploaded media, lowercase hex.
*/
std::string Sha256Hex(std::string_view bytes);
std::string Sha256HexFile(const std::filesystem::path& path);

} // namespace transcription::util
