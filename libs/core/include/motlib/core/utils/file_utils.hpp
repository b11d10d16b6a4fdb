#pragma once

#include <filesystem>
#include <span>
#include <vector>

namespace motlib::core::utils {

bool readFileBytes(std::filesystem::path const& path,
                   std::vector<char>& outBytes);

// Writes bytes to a hidden sibling of path and renames it over path, creating
// the parent directory if needed. A failed write leaves path untouched.
bool writeFileAtomically(std::filesystem::path const& path,
                         std::span<char const> bytes);

// Name of the sibling used by writeFileAtomically while a write is in flight.
std::filesystem::path partialWritePath(std::filesystem::path const& path);

} /*namespace motlib::core::utils*/
