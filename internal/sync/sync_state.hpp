#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace gearledger::sync {

struct CatalogBlob {
  std::string filename;
  std::string bytes;
  std::string uploaded_at;
};

struct CatalogMeta {
  std::string filename;
  uint32_t    size = 0;
  std::string uploaded_at;
};

/*
  SyncState

  Process-lifetime state shared by every request worker: the version counter
  and the in-memory catalog blob. A single mutex covers both so that a catalog
  replacement and its version bump are observed together.
*/
class SyncState {
 public:
  int32_t Version() const;

  // Increments and returns the new version.
  int32_t BumpVersion();

  // Replaces the blob wholesale and bumps the version; returns the new version.
  int32_t ReplaceCatalog(std::string filename, std::string bytes, std::string uploaded_at);

  std::optional<CatalogMeta> Catalog() const;

  // Blob bytes are shared, not copied; the returned pointer stays valid after
  // a later replacement.
  std::shared_ptr<const CatalogBlob> CatalogBlobSnapshot() const;

  // Version and catalog metadata read under one lock.
  std::pair<int32_t, std::optional<CatalogMeta>> Snapshot() const;

 private:
  mutable std::mutex                 mutex_;
  int32_t                            version_ = 0;
  std::shared_ptr<const CatalogBlob> catalog_;
};

} // namespace gearledger::sync
