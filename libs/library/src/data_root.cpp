#include <motlib/core/logging.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/globals/data_layout.hpp>
#include <motlib/library/data_root.hpp>

#include <exception>

namespace fs = std::filesystem;

namespace motlib::library {

namespace {

bool prepareRootDir(fs::path const& path, fs::path& outPath) {
  try {
    fs::path const absolutePath =
        core::utils::normalizedDirPath(fs::absolute(path));

    if (fs::exists(absolutePath) && !fs::is_directory(absolutePath)) {
      MOTLIB_LOG_ERR("Asset root " + absolutePath.string() +
                     " is not a directory.");
      return false;
    }

    if (!fs::exists(absolutePath)) {
      fs::create_directories(absolutePath);
    }

    outPath = absolutePath;
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  return true;
}

} /*namespace*/

bool DataRoot::open(fs::path const& dataDir) {
  if (dataDir.empty()) {
    MOTLIB_LOG_ERR("No data directory given.");
    return false;
  }

  return open(dataDir / globals::modelsDirName,
              dataDir / globals::trajectoriesDirName,
              dataDir / globals::thumbnailsDirName);
}

bool DataRoot::open(fs::path const& modelsPath,
                    fs::path const& trajectoriesPath,
                    fs::path const& thumbnailsPath) {
  fs::path models, trajectories, thumbnails;

  if (!prepareRootDir(modelsPath, models) ||
      !prepareRootDir(trajectoriesPath, trajectories) ||
      !prepareRootDir(thumbnailsPath, thumbnails)) {
    return false;
  }

  _modelsPath = std::move(models);
  _trajectoriesPath = std::move(trajectories);
  _thumbnailsPath = std::move(thumbnails);

  MOTLIB_LOG_MSG("Models root: " + _modelsPath.string());
  MOTLIB_LOG_MSG("Trajectories root: " + _trajectoriesPath.string());
  MOTLIB_LOG_MSG("Thumbnails root: " + _thumbnailsPath.string());

  return true;
}

bool DataRoot::isOpen() const { return !_modelsPath.empty(); }

fs::path const& DataRoot::getModelsPath() const { return _modelsPath; }

fs::path const& DataRoot::getTrajectoriesPath() const {
  return _trajectoriesPath;
}

fs::path const& DataRoot::getThumbnailsPath() const { return _thumbnailsPath; }

fs::path findDefaultDataDir() {
  try {
    return core::utils::findDirInParentTree(fs::current_path(),
                                            globals::dataDirName);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return {};
  }
}

} /*namespace motlib::library*/
