#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace motlib::asset_id {

// Versioned contract shared by the catalog and the thumbnail generator.
// Changing either the digest or the length renames every thumbnail on disk.
constexpr std::size_t idSchemeVersion = 1;
constexpr std::size_t idLength = 16;

using AssetId = std::string;

// First idLength hex digits of the MD5 digest of the UTF-8 bytes of
// relativePath, taken as is.
AssetId idFromString(std::string_view relativePath);

// Normalizes relativePath lexically and renders it in generic form before
// hashing, matching the ids the repositories derive from listed files.
AssetId idFromRelativePath(std::filesystem::path const& relativePath);

// Derives the id of a file under rootPath, or an empty id if absolutePath is
// not inside rootPath.
AssetId idFromAbsolutePath(std::filesystem::path const& absolutePath,
                           std::filesystem::path const& rootPath);

bool isWellFormedId(std::string_view id);

} /*namespace motlib::asset_id*/
