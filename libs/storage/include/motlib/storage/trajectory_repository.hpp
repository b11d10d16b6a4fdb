#pragma once

#include <motlib/asset_id/asset_id.hpp>
#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/storage_result.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace motlib::storage {

// Pose sequence files (.npy, .npz) anywhere under one trajectories root. The
// category of a trajectory is its parent directory relative to the root.
class TrajectoryRepository {
public:
  explicit TrajectoryRepository(std::filesystem::path const& rootPath);

  std::filesystem::path const& getRootPath() const;

  // Most recently modified first. An empty or unset category lists all.
  StorageResult list(std::optional<std::string> const& category,
                     std::vector<TrajectoryMetadata>& outTrajectories) const;

  // notFound for unknown or malformed ids, ioFailure if the root could not
  // be scanned.
  StorageResult locate(asset_id::AssetId const& id,
                       std::filesystem::path& outPath) const;

  // locate() without the failure reason.
  std::optional<std::filesystem::path> find(asset_id::AssetId const& id) const;

  StorageResult get(asset_id::AssetId const& id,
                    TrajectoryMetadata& outTrajectory) const;

  // Overwrites an existing file of the same name.
  StorageResult save(std::string const& filename,
                     std::span<char const> content,
                     std::optional<std::string> const& category,
                     TrajectoryMetadata& outTrajectory);

  StorageResult remove(asset_id::AssetId const& id);

private:
  std::vector<std::filesystem::path> collectTrajectoryFiles() const;

  // Stat failures fail the call; an unreadable payload only leaves the
  // derived fields unset.
  bool readMetadata(std::filesystem::path const& path,
                    TrajectoryMetadata& outTrajectory) const;

  std::filesystem::path _rootPath;
};

bool isTrajectoryFile(std::filesystem::path const& path);

} /*namespace motlib::storage*/
