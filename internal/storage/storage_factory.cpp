#include "storage_factory.hpp"

#include "internal/config/settings.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object/arrow_object_store.hpp"
#include "internal/upload/upload_error.hpp"

namespace logship::storage {

using logship::observability::StringField;

ObjectStorePtr BuildObjectStore(const config::StoreSettings& store) {
  auto [fs, root_path] = upload::Unwrap(common::ResolveFileSystem(store), "resolve object store");

  LOGSHIP_LOG_INFO("Object store ready", {StringField("filesystem", fs->type_name()), StringField("root", root_path),
                                          StringField("region", store.region)});
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root_path));
}

} // namespace logship::storage
