#include "root_write_lock.hpp"

#include <map>
#include <memory>

namespace fs = std::filesystem;

namespace motlib::storage {

std::mutex& rootWriteMutex(fs::path const& rootPath) {
  static std::mutex registryMutex;
  static std::map<fs::path, std::unique_ptr<std::mutex>> mutexes;

  std::scoped_lock l{registryMutex};

  std::unique_ptr<std::mutex>& rootMutex = mutexes[rootPath];
  if (!rootMutex) {
    rootMutex = std::make_unique<std::mutex>();
  }

  return *rootMutex;
}

} /*namespace motlib::storage*/
