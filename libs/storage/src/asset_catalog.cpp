#include <motlib/core/logging.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/storage/asset_catalog.hpp>

#include <tracy/Tracy.hpp>

namespace fs = std::filesystem;

namespace motlib::storage {

AssetCatalog::AssetCatalog(library::DataRoot const& dataRoot)
    : _models{dataRoot.getModelsPath()},
      _trajectories{dataRoot.getTrajectoriesPath()},
      _thumbnails{dataRoot.getThumbnailsPath()} {}

ModelRepository& AssetCatalog::getModels() { return _models; }

TrajectoryRepository& AssetCatalog::getTrajectories() { return _trajectories; }

ThumbnailCache const& AssetCatalog::getThumbnails() const {
  return _thumbnails;
}

std::optional<std::string>
AssetCatalog::thumbnailPointer(asset_id::AssetId const& id,
                               AssetKind kind) const {
  std::optional<fs::path> const path = _thumbnails.lookup(id, kind);

  if (!path) {
    return std::nullopt;
  }

  return core::utils::genericRelativePath(*path, _thumbnails.getRootPath());
}

StorageResult
AssetCatalog::listModels(std::vector<ModelMetadata>& outModels) const {
  ZoneScoped;

  StorageResult const result = _models.list(outModels);

  if (result != StorageResult::success) {
    return result;
  }

  for (ModelMetadata& model : outModels) {
    model.thumbnailPath = thumbnailPointer(model.id, AssetKind::model);
  }

  return StorageResult::success;
}

StorageResult AssetCatalog::listTrajectories(
    std::optional<std::string> const& category,
    std::vector<TrajectoryMetadata>& outTrajectories) const {
  ZoneScoped;

  StorageResult const result = _trajectories.list(category, outTrajectories);

  if (result != StorageResult::success) {
    return result;
  }

  for (TrajectoryMetadata& trajectory : outTrajectories) {
    trajectory.thumbnailPath =
        thumbnailPointer(trajectory.id, AssetKind::trajectory);
  }

  return StorageResult::success;
}

StorageResult AssetCatalog::getModel(asset_id::AssetId const& id,
                                     ModelMetadata& outModel) const {
  StorageResult const result = _models.get(id, outModel);

  if (result == StorageResult::success) {
    outModel.thumbnailPath = thumbnailPointer(id, AssetKind::model);
  }

  return result;
}

StorageResult
AssetCatalog::getTrajectory(asset_id::AssetId const& id,
                            TrajectoryMetadata& outTrajectory) const {
  StorageResult const result = _trajectories.get(id, outTrajectory);

  if (result == StorageResult::success) {
    outTrajectory.thumbnailPath = thumbnailPointer(id, AssetKind::trajectory);
  }

  return result;
}

StorageResult AssetCatalog::getThumbnail(asset_id::AssetId const& id,
                                         AssetKind kind,
                                         fs::path& outPath) const {
  std::optional<fs::path> const path = _thumbnails.lookup(id, kind);

  if (!path) {
    MOTLIB_LOG_WARN(std::string{"No "} + assetKindDirName(kind) +
                    " thumbnail for " + id);
    return StorageResult::notFound;
  }

  outPath = *path;

  return StorageResult::success;
}

} /*namespace motlib::storage*/
