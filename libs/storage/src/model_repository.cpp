#include "root_write_lock.hpp"

#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/storage/model_repository.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace motlib::storage {

ModelRepository::ModelRepository(fs::path const& rootPath)
    : _rootPath{core::utils::normalizedDirPath(rootPath)} {}

fs::path const& ModelRepository::getRootPath() const { return _rootPath; }

std::vector<fs::path> ModelRepository::collectDescriptionFiles() const {
  std::vector<fs::path> result;

  if (!fs::exists(_rootPath)) {
    return result;
  }

  auto const isDescriptionFile = [](fs::directory_entry const& entry) {
    return entry.is_regular_file() &&
           entry.path().extension() == globals::modelDescriptionExt;
  };

  for (fs::directory_entry const& entry : fs::directory_iterator(_rootPath)) {
    if (entry.is_directory()) {
      for (fs::directory_entry const& child :
           fs::directory_iterator(entry.path())) {
        if (isDescriptionFile(child)) {
          result.push_back(child.path());
        }
      }
    } else if (isDescriptionFile(entry)) {
      result.push_back(entry.path());
    }
  }

  // Keeps ties in the mtime ordering consistent between calls.
  std::sort(result.begin(), result.end());

  return result;
}

fs::path ModelRepository::modelDirectory(fs::path const& path) const {
  fs::path const parentPath = path.parent_path();

  if (core::utils::normalizedDirPath(parentPath) == _rootPath) {
    return {};
  }

  return parentPath;
}

bool ModelRepository::readMetadata(fs::path const& path,
                                   ModelMetadata& outModel) const {
  try {
    outModel.relativePath = core::utils::genericRelativePath(path, _rootPath);
    outModel.id = asset_id::idFromString(outModel.relativePath);
    outModel.filename = path.filename().string();

    fs::path const directory = modelDirectory(path);
    if (directory.empty()) {
      outModel.modelName.reset();
    } else {
      outModel.modelName = directory.filename().string();
    }

    outModel.fileSize = fs::file_size(path);
    outModel.modifiedTime = fs::last_write_time(path);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to stat model " + path.string() + ": " + e.what());
    return false;
  }

  return true;
}

StorageResult
ModelRepository::list(std::vector<ModelMetadata>& outModels) const {
  ZoneScoped;

  outModels.clear();

  try {
    for (fs::path const& path : collectDescriptionFiles()) {
      ModelMetadata model;
      if (readMetadata(path, model)) {
        outModels.push_back(std::move(model));
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to list models under " + _rootPath.string() +
                   ": " + e.what());
    return StorageResult::ioFailure;
  }

  std::stable_sort(outModels.begin(), outModels.end(),
                   [](ModelMetadata const& lhs, ModelMetadata const& rhs) {
                     return lhs.modifiedTime > rhs.modifiedTime;
                   });

  return StorageResult::success;
}

StorageResult ModelRepository::locate(asset_id::AssetId const& id,
                                      fs::path& outPath) const {
  ZoneScoped;

  if (!asset_id::isWellFormedId(id)) {
    MOTLIB_LOG_WARN("Model " + id + " not found.");
    return StorageResult::notFound;
  }

  try {
    for (fs::path const& path : collectDescriptionFiles()) {
      if (asset_id::idFromAbsolutePath(path, _rootPath) == id) {
        outPath = path;
        return StorageResult::success;
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to scan models under " + _rootPath.string() +
                   ": " + e.what());
    return StorageResult::ioFailure;
  }

  MOTLIB_LOG_WARN("Model " + id + " not found.");

  return StorageResult::notFound;
}

std::optional<fs::path>
ModelRepository::find(asset_id::AssetId const& id) const {
  fs::path path;

  if (locate(id, path) != StorageResult::success) {
    return std::nullopt;
  }

  return path;
}

StorageResult ModelRepository::get(asset_id::AssetId const& id,
                                   ModelMetadata& outModel) const {
  fs::path path;
  if (StorageResult const located = locate(id, path);
      located != StorageResult::success) {
    return located;
  }

  return readMetadata(path, outModel) ? StorageResult::success
                                      : StorageResult::ioFailure;
}

StorageResult ModelRepository::save(std::string const& filename,
                                    std::span<char const> content,
                                    std::optional<std::string> const& modelName,
                                    ModelMetadata& outModel) {
  ZoneScoped;

  if (!core::utils::isPlainFileName(filename) ||
      fs::path{filename}.extension() != globals::modelDescriptionExt) {
    MOTLIB_LOG_ERR("Rejected model file name \"" + filename +
                   "\", expected a plain " + globals::modelDescriptionExt +
                   " file name.");
    return StorageResult::invalidInput;
  }

  bool const hasModelName = modelName && !modelName->empty();

  if (hasModelName && !core::utils::isPlainFileName(*modelName)) {
    MOTLIB_LOG_ERR("Rejected model name \"" + *modelName + "\"");
    return StorageResult::invalidInput;
  }

  fs::path const targetPath =
      hasModelName ? _rootPath / *modelName / filename : _rootPath / filename;

  std::scoped_lock l{rootWriteMutex(_rootPath)};

  if (!core::utils::writeFileAtomically(targetPath, content)) {
    return StorageResult::ioFailure;
  }

  if (!readMetadata(targetPath, outModel)) {
    return StorageResult::ioFailure;
  }

  MOTLIB_LOG_MSG("Saved model " + outModel.relativePath);

  return StorageResult::success;
}

StorageResult ModelRepository::remove(asset_id::AssetId const& id) {
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

  MOTLIB_LOG_MSG("Deleted model " + path.string());

  return StorageResult::success;
}

StorageResult ModelRepository::listDirectoryFiles(
    asset_id::AssetId const& id,
    std::vector<ModelDirectoryFile>& outFiles) const {
  ZoneScoped;

  fs::path path;
  if (StorageResult const located = locate(id, path);
      located != StorageResult::success) {
    return located;
  }

  outFiles.clear();

  try {
    fs::path const directory = modelDirectory(path);

    if (directory.empty()) {
      outFiles.push_back({path.filename().string(), fs::file_size(path)});
      return StorageResult::success;
    }

    for (fs::directory_entry const& entry :
         fs::recursive_directory_iterator(directory)) {
      if (!entry.is_regular_file()) {
        continue;
      }

      outFiles.push_back(
          {core::utils::genericRelativePath(entry.path(), directory),
           entry.file_size()});
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to list files of model " + id + ": " + e.what());
    return StorageResult::ioFailure;
  }

  std::sort(outFiles.begin(), outFiles.end(),
            [](ModelDirectoryFile const& lhs, ModelDirectoryFile const& rhs) {
              return lhs.relativePath < rhs.relativePath;
            });

  return StorageResult::success;
}

StorageResult
ModelRepository::getDirectoryFile(asset_id::AssetId const& id,
                                  std::string const& requestedPath,
                                  fs::path& outPath) const {
  fs::path modelPath;
  if (StorageResult const located = locate(id, modelPath);
      located != StorageResult::success) {
    return located;
  }

  fs::path const requested{requestedPath};

  if (requestedPath.empty() || requested.has_root_path() ||
      requestedPath.find('\0') != std::string::npos) {
    MOTLIB_LOG_ERR("Rejected model file path \"" + requestedPath + "\"");
    return StorageResult::forbidden;
  }

  fs::path const directory = modelDirectory(modelPath);

  // A root-level model owns nothing but its own file.
  if (directory.empty()) {
    if ((_rootPath / requested).lexically_normal() !=
        modelPath.lexically_normal()) {
      MOTLIB_LOG_ERR("Rejected model file path \"" + requestedPath +
                     "\" for root-level model " + id);
      return StorageResult::forbidden;
    }

    outPath = modelPath;
    return StorageResult::success;
  }

  fs::path const candidatePath = (directory / requested).lexically_normal();

  if (!core::utils::isLexicallyWithin(candidatePath, directory)) {
    MOTLIB_LOG_ERR("Path \"" + requestedPath + "\" escapes model directory " +
                   directory.string());
    return StorageResult::forbidden;
  }

  std::error_code errorCode;

  if (!fs::exists(candidatePath, errorCode)) {
    MOTLIB_LOG_WARN("Model file " + candidatePath.string() + " not found.");
    return errorCode && errorCode != std::errc::no_such_file_or_directory
               ? StorageResult::ioFailure
               : StorageResult::notFound;
  }

  fs::path const resolvedPath = fs::canonical(candidatePath, errorCode);
  if (errorCode) {
    MOTLIB_LOG_ERR("Failed to resolve " + candidatePath.string() + ": " +
                   errorCode.message());
    return StorageResult::ioFailure;
  }

  fs::path const resolvedDirectory = fs::canonical(directory, errorCode);
  if (errorCode) {
    MOTLIB_LOG_ERR("Failed to resolve " + directory.string() + ": " +
                   errorCode.message());
    return StorageResult::ioFailure;
  }

  if (!core::utils::isLexicallyWithin(resolvedPath, resolvedDirectory)) {
    MOTLIB_LOG_ERR("Path \"" + requestedPath +
                   "\" resolves outside model directory " +
                   directory.string());
    return StorageResult::forbidden;
  }

  if (!fs::is_regular_file(resolvedPath, errorCode)) {
    MOTLIB_LOG_WARN("Model file " + candidatePath.string() +
                    " is not a regular file.");
    return StorageResult::notFound;
  }

  outPath = resolvedPath;

  return StorageResult::success;
}

} /*namespace motlib::storage*/
