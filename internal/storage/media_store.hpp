#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>

namespace transcription::storage {

/*
  Raw media bytes keyed by asset id.

  Every asset is represented as an Arrow Buffer. The registry owns the asset
  rows; this only holds the bytes they point at.
*/

class MediaStore {
 public:
  virtual ~MediaStore() = default;

  // Persist bytes for an asset, replacing any previous content.
  virtual void Write(const std::string& asset_id, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Persist the content of an existing file (e.g. extracted YouTube audio).
  virtual void Import(const std::string& asset_id, const std::filesystem::path& source) = 0;

  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& asset_id) = 0;

  virtual bool Contains(const std::string& asset_id) = 0;

  // Missing content is not an error.
  virtual void Remove(const std::string& asset_id) = 0;
};

using MediaStorePtr = std::shared_ptr<MediaStore>;

} // namespace transcription::storage
