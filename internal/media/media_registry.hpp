#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/storage/media_store.hpp"

namespace transcription::media {

struct AssetMetadata {
  std::string display_name;
  std::string mime_type;
  std::string owner;
};

/*
  Content identity -> stored asset.

  Keys live in a namespace ("sha256" for uploaded bytes, "youtube" for video
  ids); lookups never cross namespaces. Resolve followed by Register is
  racy by nature; ResolveOrRegister absorbs the Conflict of the losing side.
*/
class MediaRegistry {
 public:
  MediaRegistry(std::shared_ptr<db::Repository> repository, storage::MediaStorePtr store);

  // throws util::NotFound
  db::model::AssetRecord Resolve(const std::string& content_key, const std::string& key_namespace);

  // throws util::Conflict when the key already exists in the namespace
  db::model::AssetRecord Register(const std::string& content_key, const std::string& key_namespace, const AssetMetadata& metadata);

  db::model::AssetRecord ResolveOrRegister(const std::string& content_key, const std::string& key_namespace, const AssetMetadata& metadata,
                                           bool* created = nullptr);

  std::optional<db::model::AssetRecord> Get(const std::string& asset_id);

  // Deletes the asset row and its stored media when no job references it.
  // Returns false when the asset is still referenced or already gone.
  bool RemoveIfUnreferenced(const std::string& asset_id);

  storage::MediaStore& Store() {
    return *store_;
  }

 private:
  std::optional<db::model::AssetRecord> Find(const std::string& content_key, const std::string& key_namespace);

  std::shared_ptr<db::Repository> repository_;
  storage::MediaStorePtr          store_;
};

} // namespace transcription::media
