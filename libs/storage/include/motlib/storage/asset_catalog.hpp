#pragma once

#include <motlib/asset_id/asset_id.hpp>
#include <motlib/library/data_root.hpp>
#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/model_repository.hpp>
#include <motlib/storage/storage_result.hpp>
#include <motlib/storage/thumbnail_cache.hpp>
#include <motlib/storage/trajectory_repository.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace motlib::storage {

// Entry point for callers serving the library. Listings and lookups come
// from the repositories and carry a thumbnail pointer when one exists.
class AssetCatalog {
public:
  explicit AssetCatalog(library::DataRoot const& dataRoot);

  ModelRepository& getModels();
  TrajectoryRepository& getTrajectories();
  ThumbnailCache const& getThumbnails() const;

  StorageResult listModels(std::vector<ModelMetadata>& outModels) const;

  StorageResult
  listTrajectories(std::optional<std::string> const& category,
                   std::vector<TrajectoryMetadata>& outTrajectories) const;

  StorageResult getModel(asset_id::AssetId const& id,
                         ModelMetadata& outModel) const;

  StorageResult getTrajectory(asset_id::AssetId const& id,
                              TrajectoryMetadata& outTrajectory) const;

  StorageResult getThumbnail(asset_id::AssetId const& id, AssetKind kind,
                             std::filesystem::path& outPath) const;

private:
  std::optional<std::string> thumbnailPointer(asset_id::AssetId const& id,
                                              AssetKind kind) const;

  ModelRepository _models;
  TrajectoryRepository _trajectories;
  ThumbnailCache _thumbnails;
};

} /*namespace motlib::storage*/
