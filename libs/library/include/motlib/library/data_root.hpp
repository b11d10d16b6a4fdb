#pragma once

#include <filesystem>

namespace motlib::library {

// Resolved asset roots of one data directory. Each root is absolute and
// lexically normal once open() succeeds.
class DataRoot {
public:
  // Uses the models, trajectories and thumbnails subdirectories of dataDir.
  bool open(std::filesystem::path const& dataDir);

  bool open(std::filesystem::path const& modelsPath,
            std::filesystem::path const& trajectoriesPath,
            std::filesystem::path const& thumbnailsPath);

  bool isOpen() const;

  std::filesystem::path const& getModelsPath() const;
  std::filesystem::path const& getTrajectoriesPath() const;
  std::filesystem::path const& getThumbnailsPath() const;

private:
  std::filesystem::path _modelsPath;
  std::filesystem::path _trajectoriesPath;
  std::filesystem::path _thumbnailsPath;
};

// Closest directory named "data" above the working directory, or an empty
// path.
std::filesystem::path findDefaultDataDir();

} /*namespace motlib::library*/
