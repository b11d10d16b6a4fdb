#pragma once

#include <filesystem>
#include <mutex>

namespace motlib::storage {

// Mutex shared by every repository opened on the same root directory.
std::mutex& rootWriteMutex(std::filesystem::path const& rootPath);

} /*namespace motlib::storage*/
