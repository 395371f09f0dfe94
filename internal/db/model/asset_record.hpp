#pragma once

#include <cstdint>
#include <string>

namespace transcription::db::model {

inline constexpr const char* kSha256Namespace  = "sha256";
inline constexpr const char* kYoutubeNamespace = "youtube";

/*
  Persistent media asset row.

  (key_namespace, content_key) is unique; keys from different namespaces are
  never compared. Immutable after insert.
*/
struct AssetRecord {
  std::string id;
  std::string key_namespace;
  std::string content_key;

  std::string display_name;
  std::string mime_type;
  std::string owner;

  uint64_t created_at_ms = 0;
};

} // namespace transcription::db::model
