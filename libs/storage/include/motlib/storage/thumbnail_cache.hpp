#pragma once

#include <motlib/asset_id/asset_id.hpp>
#include <motlib/storage/asset_metadata.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace motlib::storage {

// Read side of the thumbnail tree. Thumbnails are written by the offline
// generator under mirroredPath(); lookup does not depend on that placement
// and searches the whole kind subtree by file stem.
class ThumbnailCache {
public:
  explicit ThumbnailCache(std::filesystem::path const& rootPath);

  std::filesystem::path const& getRootPath() const;

  std::filesystem::path baseDirectory(AssetKind kind) const;

  // First hit by extension priority (webp, png, jpg, gif). Among files with
  // the same extension the lexicographically smallest path wins.
  std::optional<std::filesystem::path> lookup(asset_id::AssetId const& id,
                                              AssetKind kind) const;

  // <base>/<parent of assetRelativePath>/<id><write extension>
  std::filesystem::path
  mirroredPath(AssetKind kind, std::string const& assetRelativePath) const;

  // Every file with a thumbnail extension under the kind subtree.
  std::vector<std::filesystem::path> listThumbnailFiles(AssetKind kind) const;

private:
  std::filesystem::path _rootPath;
};

} /*namespace motlib::storage*/
