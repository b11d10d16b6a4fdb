#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/storage_result.hpp>

#include <motlib/globals/data_layout.hpp>

namespace motlib::storage {

char const* storageResultToString(StorageResult result) {
  switch (result) {
  case StorageResult::success:
    return "success";
  case StorageResult::notFound:
    return "not found";
  case StorageResult::invalidInput:
    return "invalid input";
  case StorageResult::forbidden:
    return "forbidden";
  case StorageResult::ioFailure:
    return "io failure";
  default:
    return "unknown";
  }
}

char const* assetKindDirName(AssetKind kind) {
  switch (kind) {
  case AssetKind::model:
    return globals::modelsDirName;
  case AssetKind::trajectory:
    return globals::trajectoriesDirName;
  default:
    return "";
  }
}

} /*namespace motlib::storage*/
