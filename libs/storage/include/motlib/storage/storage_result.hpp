#pragma once

namespace motlib::storage {

enum class StorageResult {
  success,
  notFound,
  invalidInput,
  forbidden,
  ioFailure
};

char const* storageResultToString(StorageResult result);

} /*namespace motlib::storage*/
