#pragma once

#include <motlib/asset_id/asset_id.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace motlib::storage {

enum class AssetKind { model, trajectory };

// Name of the per-kind subdirectory under the thumbnails root.
char const* assetKindDirName(AssetKind kind);

using FileTime = std::filesystem::file_time_type;

struct ModelMetadata {
  asset_id::AssetId id;
  std::string filename;
  // Owning first-level directory, unset for models at the root.
  std::optional<std::string> modelName;
  std::string relativePath;
  std::uintmax_t fileSize = 0;
  FileTime modifiedTime = {};
  std::optional<std::string> thumbnailPath;
};

struct TrajectoryMetadata {
  asset_id::AssetId id;
  std::string filename;
  std::optional<std::string> category;
  std::string relativePath;
  std::uintmax_t fileSize = 0;
  FileTime modifiedTime = {};
  std::optional<std::size_t> frameCount;
  std::optional<double> frameRate;
  std::optional<std::size_t> numJoints;
  std::optional<std::string> thumbnailPath;
};

struct ModelDirectoryFile {
  // Relative to the model directory, forward slashes.
  std::string relativePath;
  std::uintmax_t fileSize = 0;
};

} /*namespace motlib::storage*/
