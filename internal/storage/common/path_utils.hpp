#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace transcription::storage::common {

inline void ValidateAssetId(const std::string& asset_id) {
  if (asset_id.empty()) {
    throw std::invalid_argument("asset id must not be empty");
  }
  for (char c : asset_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("asset id contains invalid character");
    }
  }
  if (asset_id == "." || asset_id == "..") {
    throw std::invalid_argument("asset id must not be a relative path component");
  }
}

inline std::filesystem::path MediaPath(const std::filesystem::path& root, const std::string& asset_id) {
  ValidateAssetId(asset_id);
  return root / (asset_id + ".media");
}

} // namespace transcription::storage::common
