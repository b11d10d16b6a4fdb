#include "root_write_lock.hpp"

#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/storage/trajectory_data.hpp>
#include <motlib/storage/trajectory_repository.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace motlib::storage {

bool isTrajectoryFile(fs::path const& path) {
  fs::path const extension = path.extension();
  return extension == globals::arrayFileExt ||
         extension == globals::arrayBundleFileExt;
}

TrajectoryRepository::TrajectoryRepository(fs::path const& rootPath)
    : _rootPath{core::utils::normalizedDirPath(rootPath)} {}

fs::path const& TrajectoryRepository::getRootPath() const { return _rootPath; }

std::vector<fs::path> TrajectoryRepository::collectTrajectoryFiles() const {
  std::vector<fs::path> result;

  if (!fs::exists(_rootPath)) {
    return result;
  }

  for (fs::directory_entry const& entry :
       fs::recursive_directory_iterator(_rootPath)) {
    if (entry.is_regular_file() && isTrajectoryFile(entry.path())) {
      result.push_back(entry.path());
    }
  }

  std::sort(result.begin(), result.end());

  return result;
}

bool TrajectoryRepository::readMetadata(
    fs::path const& path, TrajectoryMetadata& outTrajectory) const {
  try {
    outTrajectory.relativePath =
        core::utils::genericRelativePath(path, _rootPath);
    outTrajectory.id = asset_id::idFromString(outTrajectory.relativePath);
    outTrajectory.filename = path.filename().string();

    std::string const category =
        core::utils::genericRelativePath(path.parent_path(), _rootPath);
    if (category.empty()) {
      outTrajectory.category.reset();
    } else {
      outTrajectory.category = category;
    }

    outTrajectory.fileSize = fs::file_size(path);
    outTrajectory.modifiedTime = fs::last_write_time(path);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to stat trajectory " + path.string() + ": " +
                   e.what());
    return false;
  }

  outTrajectory.frameCount.reset();
  outTrajectory.frameRate.reset();
  outTrajectory.numJoints.reset();

  TrajectoryData data;
  if (!loadTrajectoryData(path, data)) {
    MOTLIB_LOG_WARN("Listing " + outTrajectory.relativePath +
                    " without frame data.");
    return true;
  }

  if (data.poses) {
    TrajectoryShape const shape = poseSequenceShape(*data.poses);
    outTrajectory.frameCount = shape.frameCount;
    outTrajectory.numJoints = shape.numJoints;
  }
  outTrajectory.frameRate = data.frameRate;

  return true;
}

StorageResult TrajectoryRepository::list(
    std::optional<std::string> const& category,
    std::vector<TrajectoryMetadata>& outTrajectories) const {
  ZoneScoped;

  bool const filterByCategory = category && !category->empty();
  outTrajectories.clear();

  try {
    for (fs::path const& path : collectTrajectoryFiles()) {
      if (filterByCategory &&
          core::utils::genericRelativePath(path.parent_path(), _rootPath) !=
              *category) {
        continue;
      }

      TrajectoryMetadata trajectory;
      if (readMetadata(path, trajectory)) {
        outTrajectories.push_back(std::move(trajectory));
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to list trajectories under " + _rootPath.string() +
                   ": " + e.what());
    return StorageResult::ioFailure;
  }

  std::stable_sort(
      outTrajectories.begin(), outTrajectories.end(),
      [](TrajectoryMetadata const& lhs, TrajectoryMetadata const& rhs) {
        return lhs.modifiedTime > rhs.modifiedTime;
      });

  return StorageResult::success;
}

StorageResult TrajectoryRepository::locate(asset_id::AssetId const& id,
                                           fs::path& outPath) const {
  ZoneScoped;

  if (!asset_id::isWellFormedId(id)) {
    MOTLIB_LOG_WARN("Trajectory " + id + " not found.");
    return StorageResult::notFound;
  }

  try {
    for (fs::path const& path : collectTrajectoryFiles()) {
      if (asset_id::idFromAbsolutePath(path, _rootPath) == id) {
        outPath = path;
        return StorageResult::success;
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to scan trajectories under " + _rootPath.string() +
                   ": " + e.what());
    return StorageResult::ioFailure;
  }

  MOTLIB_LOG_WARN("Trajectory " + id + " not found.");

  return StorageResult::notFound;
}

std::optional<fs::path>
TrajectoryRepository::find(asset_id::AssetId const& id) const {
  fs::path path;

  if (locate(id, path) != StorageResult::success) {
    return std::nullopt;
  }

  return path;
}

StorageResult
TrajectoryRepository::get(asset_id::AssetId const& id,
                          TrajectoryMetadata& outTrajectory) const {
  fs::path path;
  if (StorageResult const located = locate(id, path);
      located != StorageResult::success) {
    return located;
  }

  return readMetadata(path, outTrajectory) ? StorageResult::success
                                           : StorageResult::ioFailure;
}

StorageResult
TrajectoryRepository::save(std::string const& filename,
                           std::span<char const> content,
                           std::optional<std::string> const& category,
                           TrajectoryMetadata& outTrajectory) {
  ZoneScoped;

  if (!core::utils::isPlainFileName(filename) ||
      !isTrajectoryFile(filename)) {
    MOTLIB_LOG_ERR("Rejected trajectory file name \"" + filename +
                   "\", expected a plain " + globals::arrayFileExt + " or " +
                   globals::arrayBundleFileExt + " file name.");
    return StorageResult::invalidInput;
  }

  bool const hasCategory = category && !category->empty();

  if (hasCategory && !core::utils::isPlainFileName(*category)) {
    MOTLIB_LOG_ERR("Rejected trajectory category \"" + *category + "\"");
    return StorageResult::invalidInput;
  }

  fs::path const targetPath =
      hasCategory ? _rootPath / *category / filename : _rootPath / filename;

  std::scoped_lock l{rootWriteMutex(_rootPath)};

  if (!core::utils::writeFileAtomically(targetPath, content)) {
    return StorageResult::ioFailure;
  }

  if (!readMetadata(targetPath, outTrajectory)) {
    return StorageResult::ioFailure;
  }

  MOTLIB_LOG_MSG("Saved trajectory " + outTrajectory.relativePath);

  return StorageResult::success;
}

StorageResult TrajectoryRepository::remove(asset_id::AssetId const& id) {
  std::scoped_lock l{rootWriteMutex(_rootPath)};

  fs::path path;
  if (StorageResult const located = locate(id, path);
      located != StorageResult::success) {
    return located;
  }

  std::error_code errorCode;
  if (!fs::remove(path, errorCode)) {
    if (errorCode) {
      MOTLIB_LOG_ERR("Failed to delete " + path.string() + ": " +
                     errorCode.message());
      return StorageResult::ioFailure;
    }
    return StorageResult::notFound;
  }

  MOTLIB_LOG_MSG("Deleted trajectory " + path.string());

  return StorageResult::success;
}

} /*namespace motlib::storage*/
