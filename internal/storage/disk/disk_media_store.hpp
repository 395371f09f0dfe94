#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/media_store.hpp"

namespace transcription::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - one file per asset under root
    - atomic replace writes (tmp + rename)
*/

class DiskMediaStore final : public MediaStore {
 public:
  explicit DiskMediaStore(std::filesystem::path root);

  void Write(const std::string& asset_id, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void Import(const std::string& asset_id, const std::filesystem::path& source) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& asset_id) override;

  bool Contains(const std::string& asset_id) override;
  void Remove(const std::string& asset_id) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace transcription::storage
