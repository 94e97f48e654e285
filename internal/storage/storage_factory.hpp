#pragma once

#include "internal/storage/object_store.hpp"

namespace logship::config {
struct StoreSettings;
}

namespace logship::storage {

/*
  Builds the remote object store from configuration. Throws
  upload::UploadError when the filesystem cannot be created.
*/
ObjectStorePtr BuildObjectStore(const config::StoreSettings& store);

} // namespace logship::storage
