#include "disk_media_store.hpp"

#include <arrow/io/file.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace transcription::storage {

using namespace transcription::storage::common;

DiskMediaStore::DiskMediaStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void DiskMediaStore::Write(const std::string& asset_id, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto final_path = MediaPath(root_, asset_id);
  auto tmp_path   = final_path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path), tmp_path);
    Unwrap(out->Write(buffer->data(), buffer->size()), tmp_path);
    Unwrap(out->Close(), tmp_path);
  }

  std::filesystem::rename(tmp_path, final_path);
}

void DiskMediaStore::Import(const std::string& asset_id, const std::filesystem::path& source) {
  Write(asset_id, ReadFile(source.string()));
}

std::shared_ptr<arrow::Buffer> DiskMediaStore::Read(const std::string& asset_id) {
  auto path = MediaPath(root_, asset_id);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("media not stored for asset: " + asset_id);
  }
  return ReadFile(path.string());
}

bool DiskMediaStore::Contains(const std::string& asset_id) {
  return std::filesystem::exists(MediaPath(root_, asset_id));
}

void DiskMediaStore::Remove(const std::string& asset_id) {
  std::filesystem::remove(MediaPath(root_, asset_id));
}

} // namespace transcription::storage
