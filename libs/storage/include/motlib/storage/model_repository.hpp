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

// Model description files under one models root. A model is either a
// description file at the root or one directly inside a first-level
// subdirectory; deeper description files belong to their model's directory
// and are never listed on their own.
class ModelRepository {
public:
  explicit ModelRepository(std::filesystem::path const& rootPath);

  std::filesystem::path const& getRootPath() const;

  // Most recently modified first.
  StorageResult list(std::vector<ModelMetadata>& outModels) const;

  // notFound for unknown or malformed ids, ioFailure if the root could not
  // be scanned.
  StorageResult locate(asset_id::AssetId const& id,
                       std::filesystem::path& outPath) const;

  // locate() without the failure reason.
  std::optional<std::filesystem::path> find(asset_id::AssetId const& id) const;

  StorageResult get(asset_id::AssetId const& id,
                    ModelMetadata& outModel) const;

  // Overwrites an existing file of the same name.
  StorageResult save(std::string const& filename,
                     std::span<char const> content,
                     std::optional<std::string> const& modelName,
                     ModelMetadata& outModel);

  // Removes only the description file, sibling files stay.
  StorageResult remove(asset_id::AssetId const& id);

  // Every regular file of the model's directory subtree, sorted by path. A
  // root-level model owns no directory and reports only its own file.
  StorageResult
  listDirectoryFiles(asset_id::AssetId const& id,
                     std::vector<ModelDirectoryFile>& outFiles) const;

  // Resolves requestedPath inside the model's directory. Paths escaping
  // that directory, lexically or through symlinks, are forbidden.
  StorageResult getDirectoryFile(asset_id::AssetId const& id,
                                 std::string const& requestedPath,
                                 std::filesystem::path& outPath) const;

private:
  std::vector<std::filesystem::path> collectDescriptionFiles() const;

  bool readMetadata(std::filesystem::path const& path,
                    ModelMetadata& outModel) const;

  std::filesystem::path modelDirectory(std::filesystem::path const& path) const;

  std::filesystem::path _rootPath;
};

} /*namespace motlib::storage*/
