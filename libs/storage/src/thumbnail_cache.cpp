#include <motlib/core/logging.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/storage/thumbnail_cache.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>

namespace fs = std::filesystem;

namespace motlib::storage {

namespace {

// Index into the extension priority list, or the list size if none match.
std::size_t extensionRank(fs::path const& path) {
  fs::path const extension = path.extension();

  auto const extIter =
      std::find_if(globals::thumbnailExtPriority.cbegin(),
                   globals::thumbnailExtPriority.cend(),
                   [&extension](char const* ext) { return extension == ext; });

  return static_cast<std::size_t>(
      std::distance(globals::thumbnailExtPriority.cbegin(), extIter));
}

} /*namespace*/

ThumbnailCache::ThumbnailCache(fs::path const& rootPath)
    : _rootPath{core::utils::normalizedDirPath(rootPath)} {}

fs::path const& ThumbnailCache::getRootPath() const { return _rootPath; }

fs::path ThumbnailCache::baseDirectory(AssetKind kind) const {
  return _rootPath / assetKindDirName(kind);
}

std::optional<fs::path> ThumbnailCache::lookup(asset_id::AssetId const& id,
                                               AssetKind kind) const {
  ZoneScoped;

  if (!asset_id::isWellFormedId(id)) {
    return std::nullopt;
  }

  fs::path const baseDir = baseDirectory(kind);
  std::size_t const noMatchRank = globals::thumbnailExtPriority.size();

  std::optional<fs::path> bestPath;
  std::size_t bestRank = noMatchRank;

  try {
    if (!fs::exists(baseDir)) {
      return std::nullopt;
    }

    for (fs::directory_entry const& entry :
         fs::recursive_directory_iterator(baseDir)) {
      if (!entry.is_regular_file() || entry.path().stem().string() != id) {
        continue;
      }

      std::size_t const rank = extensionRank(entry.path());

      if (rank == noMatchRank) {
        continue;
      }

      if (rank < bestRank || (rank == bestRank && entry.path() < *bestPath)) {
        bestRank = rank;
        bestPath = entry.path();
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to search thumbnails under " + baseDir.string() +
                   ": " + e.what());
    return std::nullopt;
  }

  return bestPath;
}

fs::path
ThumbnailCache::mirroredPath(AssetKind kind,
                             std::string const& assetRelativePath) const {
  fs::path const relativePath = fs::path{assetRelativePath}.lexically_normal();
  fs::path const filename = asset_id::idFromRelativePath(relativePath) +
                            globals::thumbnailWriteExt;

  return baseDirectory(kind) / relativePath.parent_path() / filename;
}

std::vector<fs::path> ThumbnailCache::listThumbnailFiles(AssetKind kind) const {
  std::vector<fs::path> result;
  fs::path const baseDir = baseDirectory(kind);

  try {
    if (!fs::exists(baseDir)) {
      return result;
    }

    for (fs::directory_entry const& entry :
         fs::recursive_directory_iterator(baseDir)) {
      if (entry.is_regular_file() &&
          extensionRank(entry.path()) < globals::thumbnailExtPriority.size()) {
        result.push_back(entry.path());
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to list thumbnails under " + baseDir.string() +
                   ": " + e.what());
    return {};
  }

  std::sort(result.begin(), result.end());

  return result;
}

} /*namespace motlib::storage*/
