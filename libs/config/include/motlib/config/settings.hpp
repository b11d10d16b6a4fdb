#pragma once

#include <motlib/core/camera_params.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>

namespace motlib::config {

struct Settings {
  std::filesystem::path dataDir;
  // Empty roots fall back to the matching subdirectory of dataDir.
  std::filesystem::path modelsDir;
  std::filesystem::path trajectoriesDir;
  std::filesystem::path thumbnailsDir;

  int thumbnailWidth = 160;
  int thumbnailHeight = 160;
  // Frames are rendered this many times larger and box filtered down.
  int supersampling = 2;
  std::size_t trajectorySampleFrames = 30;
  int frameDurationMs = 100;
  float webpQuality = 85.0f;
  int webpMethod = 6;

  core::CameraParams camera;
};

bool serializeSettings(Settings const& settings, nlohmann::json& outJson);

// Keys absent from settingsJson keep the values already in outSettings.
bool deserializeSettings(nlohmann::json const& settingsJson,
                         Settings& outSettings);

bool loadSettingsFromFile(std::filesystem::path const& path,
                          Settings& outSettings);

// MOTLIB_DATA_DIR replaces the data directory when set and not empty.
void applyEnvironmentOverrides(Settings& settings);

// Settings of a command line tool: the config file if given, then
// MOTLIB_DATA_DIR, then dataDirOverride. Without a data directory from any of
// them the closest "data" directory above the working directory is used. An
// unreadable config file is reported and ignored. Fails only if no asset
// roots can be determined.
bool resolveToolSettings(
    std::optional<std::filesystem::path> const& configPath,
    std::optional<std::filesystem::path> const& dataDirOverride,
    Settings& outSettings);

std::filesystem::path modelsPath(Settings const& settings);
std::filesystem::path trajectoriesPath(Settings const& settings);
std::filesystem::path thumbnailsPath(Settings const& settings);

} /*namespace motlib::config*/
