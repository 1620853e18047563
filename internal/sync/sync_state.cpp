#include "sync_state.hpp"

namespace gearledger::sync {

namespace {

std::optional<CatalogMeta> MetaOf(const std::shared_ptr<const CatalogBlob>& blob) {
  if (!blob) {
    return std::nullopt;
  }
  return CatalogMeta{blob->filename, static_cast<uint32_t>(blob->bytes.size()), blob->uploaded_at};
}

} // namespace

int32_t SyncState::Version() const {
  std::lock_guard lock(mutex_);
  return version_;
}

int32_t SyncState::BumpVersion() {
  std::lock_guard lock(mutex_);
  return ++version_;
}

int32_t SyncState::ReplaceCatalog(std::string filename, std::string bytes, std::string uploaded_at) {
  auto blob = std::make_shared<CatalogBlob>(CatalogBlob{std::move(filename), std::move(bytes), std::move(uploaded_at)});

  std::lock_guard lock(mutex_);
  catalog_ = std::move(blob);
  return ++version_;
}

std::optional<CatalogMeta> SyncState::Catalog() const {
  std::lock_guard lock(mutex_);
  return MetaOf(catalog_);
}

std::shared_ptr<const CatalogBlob> SyncState::CatalogBlobSnapshot() const {
  std::lock_guard lock(mutex_);
  return catalog_;
}

std::pair<int32_t, std::optional<CatalogMeta>> SyncState::Snapshot() const {
  std::lock_guard lock(mutex_);
  return {version_, MetaOf(catalog_)};
}

} // namespace gearledger::sync
