#include "media_registry.hpp"

#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace transcription::media {

MediaRegistry::MediaRegistry(std::shared_ptr<db::Repository> repository, storage::MediaStorePtr store)
    : repository_(std::move(repository)), store_(std::move(store)) {
  if (!repository_ || !store_) {
    throw std::invalid_argument("media registry requires a repository and a media store");
  }
}

std::optional<db::model::AssetRecord> MediaRegistry::Find(const std::string& content_key, const std::string& key_namespace) {
  auto tx    = repository_->Begin();
  auto asset = repository_->FindAssetByKey(*tx, key_namespace, content_key);
  tx->Commit();
  return asset;
}

db::model::AssetRecord MediaRegistry::Resolve(const std::string& content_key, const std::string& key_namespace) {
  auto asset = Find(content_key, key_namespace);
  if (!asset) {
    throw util::NotFound("no asset for " + key_namespace + ":" + content_key);
  }
  return *asset;
}

db::model::AssetRecord MediaRegistry::Register(const std::string& content_key, const std::string& key_namespace, const AssetMetadata& metadata) {
  if (content_key.empty() || key_namespace.empty()) {
    throw util::ValidationError("asset key and namespace must not be empty");
  }

  db::model::AssetRecord record;
  record.id            = util::NewId();
  record.key_namespace = key_namespace;
  record.content_key   = content_key;
  record.display_name  = metadata.display_name;
  record.mime_type     = metadata.mime_type;
  record.owner         = metadata.owner;
  record.created_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertAsset(*tx, record), "register asset " + key_namespace + ":" + content_key);
  tx->Commit();

  TRANSCRIPTION_LOG_INFO("asset registered", {observability::StringField("asset_id", record.id), observability::StringField("namespace", key_namespace),
                                               observability::StringField("key", content_key)});
  return record;
}

db::model::AssetRecord MediaRegistry::ResolveOrRegister(const std::string& content_key, const std::string& key_namespace, const AssetMetadata& metadata,
                                                        bool* created) {
  if (created) *created = false;

  if (auto existing = Find(content_key, key_namespace)) {
    return *existing;
  }

  try {
    auto asset = Register(content_key, key_namespace, metadata);
    if (created) *created = true;
    return asset;
  } catch (const util::Conflict&) {
    // lost the race against a concurrent registration
    return Resolve(content_key, key_namespace);
  }
}

std::optional<db::model::AssetRecord> MediaRegistry::Get(const std::string& asset_id) {
  auto tx    = repository_->Begin();
  auto asset = repository_->GetAsset(*tx, asset_id);
  tx->Commit();
  return asset;
}

bool MediaRegistry::RemoveIfUnreferenced(const std::string& asset_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetAsset(*tx, asset_id)) {
    return false;
  }
  if (repository_->CountJobsForAsset(*tx, asset_id) > 0) {
    return false;
  }
  db::ThrowIfDbError(repository_->DeleteAsset(*tx, asset_id), "delete asset " + asset_id);
  tx->Commit();

  store_->Remove(asset_id);
  TRANSCRIPTION_LOG_INFO("asset removed", {observability::StringField("asset_id", asset_id)});
  return true;
}

} // namespace transcription::media
