#include <motlib/config/settings.hpp>
#include <motlib/core/logging.hpp>
#include <motlib/globals/data_layout.hpp>
#include <motlib/library/data_root.hpp>
#include <motlib/serialization/serialization.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace motlib::config {

constexpr char const* dataDirJsonName = "dataDir";
constexpr char const* modelsDirJsonName = "modelsDir";
constexpr char const* trajectoriesDirJsonName = "trajectoriesDir";
constexpr char const* thumbnailsDirJsonName = "thumbnailsDir";
constexpr char const* thumbnailWidthJsonName = "thumbnailWidth";
constexpr char const* thumbnailHeightJsonName = "thumbnailHeight";
constexpr char const* supersamplingJsonName = "supersampling";
constexpr char const* trajectorySampleFramesJsonName = "trajectorySampleFrames";
constexpr char const* frameDurationMsJsonName = "frameDurationMs";
constexpr char const* webpQualityJsonName = "webpQuality";
constexpr char const* webpMethodJsonName = "webpMethod";

constexpr char const* cameraJsonName = "camera";
constexpr char const* cameraDistanceJsonName = "distance";
constexpr char const* cameraAzimuthJsonName = "azimuth";
constexpr char const* cameraElevationJsonName = "elevation";
constexpr char const* cameraLookAtJsonName = "lookAt";

namespace {

template <typename T>
void readIfPresent(nlohmann::json const& json, char const* name, T& outValue) {
  if (json.contains(name)) {
    outValue = json[name].get<T>();
  }
}

void readPathIfPresent(nlohmann::json const& json, char const* name,
                       fs::path& outPath) {
  if (json.contains(name)) {
    outPath = json[name].get<std::string>();
  }
}

bool validate(Settings const& settings) {
  if (settings.thumbnailWidth <= 0 || settings.thumbnailHeight <= 0) {
    MOTLIB_LOG_ERR("Thumbnail extent must be positive.");
    return false;
  }

  if (settings.supersampling < 1) {
    MOTLIB_LOG_ERR("Supersampling factor must be at least 1.");
    return false;
  }

  if (settings.trajectorySampleFrames < 1) {
    MOTLIB_LOG_ERR("Trajectory sample frame count must be at least 1.");
    return false;
  }

  if (settings.frameDurationMs <= 0) {
    MOTLIB_LOG_ERR("Frame duration must be positive.");
    return false;
  }

  if (settings.webpQuality < 0.0f || settings.webpQuality > 100.0f ||
      settings.webpMethod < 0 || settings.webpMethod > 6) {
    MOTLIB_LOG_ERR("WebP quality must be in [0, 100] and method in [0, 6].");
    return false;
  }

  return true;
}

} /*namespace*/

bool serializeSettings(Settings const& settings, nlohmann::json& outJson) {
  try {
    outJson[dataDirJsonName] = settings.dataDir.string();
    outJson[modelsDirJsonName] = settings.modelsDir.string();
    outJson[trajectoriesDirJsonName] = settings.trajectoriesDir.string();
    outJson[thumbnailsDirJsonName] = settings.thumbnailsDir.string();
    outJson[thumbnailWidthJsonName] = settings.thumbnailWidth;
    outJson[thumbnailHeightJsonName] = settings.thumbnailHeight;
    outJson[supersamplingJsonName] = settings.supersampling;
    outJson[trajectorySampleFramesJsonName] = settings.trajectorySampleFrames;
    outJson[frameDurationMsJsonName] = settings.frameDurationMs;
    outJson[webpQualityJsonName] = settings.webpQuality;
    outJson[webpMethodJsonName] = settings.webpMethod;

    nlohmann::json& camera = outJson[cameraJsonName];
    camera[cameraDistanceJsonName] = settings.camera.distance;
    camera[cameraAzimuthJsonName] = settings.camera.azimuthDeg;
    camera[cameraElevationJsonName] = settings.camera.elevationDeg;
    camera[cameraLookAtJsonName] =
        serialization::vecToArray(settings.camera.lookAt);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  return true;
}

bool deserializeSettings(nlohmann::json const& settingsJson,
                         Settings& outSettings) {
  Settings settings = outSettings;

  try {
    readPathIfPresent(settingsJson, dataDirJsonName, settings.dataDir);
    readPathIfPresent(settingsJson, modelsDirJsonName, settings.modelsDir);
    readPathIfPresent(settingsJson, trajectoriesDirJsonName,
                      settings.trajectoriesDir);
    readPathIfPresent(settingsJson, thumbnailsDirJsonName,
                      settings.thumbnailsDir);
    readIfPresent(settingsJson, thumbnailWidthJsonName,
                  settings.thumbnailWidth);
    readIfPresent(settingsJson, thumbnailHeightJsonName,
                  settings.thumbnailHeight);
    readIfPresent(settingsJson, supersamplingJsonName, settings.supersampling);
    readIfPresent(settingsJson, trajectorySampleFramesJsonName,
                  settings.trajectorySampleFrames);
    readIfPresent(settingsJson, frameDurationMsJsonName,
                  settings.frameDurationMs);
    readIfPresent(settingsJson, webpQualityJsonName, settings.webpQuality);
    readIfPresent(settingsJson, webpMethodJsonName, settings.webpMethod);

    if (settingsJson.contains(cameraJsonName)) {
      nlohmann::json const& camera = settingsJson[cameraJsonName];

      readIfPresent(camera, cameraDistanceJsonName, settings.camera.distance);
      readIfPresent(camera, cameraAzimuthJsonName, settings.camera.azimuthDeg);
      readIfPresent(camera, cameraElevationJsonName,
                    settings.camera.elevationDeg);

      if (camera.contains(cameraLookAtJsonName)) {
        serialization::arrayToVector(camera[cameraLookAtJsonName],
                                     settings.camera.lookAt);
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  if (!validate(settings)) {
    return false;
  }

  outSettings = std::move(settings);

  return true;
}

bool loadSettingsFromFile(fs::path const& path, Settings& outSettings) {
  std::ifstream inputFile{path};

  if (!inputFile) {
    MOTLIB_LOG_ERR("Failed to open settings file " + path.string());
    return false;
  }

  std::ostringstream sstr;
  sstr << inputFile.rdbuf();

  nlohmann::json settingsJson;

  try {
    settingsJson = nlohmann::json::parse(sstr.str());
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Malformed settings file " + path.string() + ": " +
                   e.what());
    return false;
  }

  return deserializeSettings(settingsJson, outSettings);
}

void applyEnvironmentOverrides(Settings& settings) {
  char const* const dataDir = std::getenv(globals::dataDirEnvVar);

  if (dataDir && *dataDir) {
    settings.dataDir = dataDir;
  }
}

bool resolveToolSettings(std::optional<fs::path> const& configPath,
                         std::optional<fs::path> const& dataDirOverride,
                         Settings& outSettings) {
  if (configPath && !loadSettingsFromFile(*configPath, outSettings)) {
    MOTLIB_LOG_WARN("Ignoring settings file " + configPath->string());
  }

  applyEnvironmentOverrides(outSettings);

  if (dataDirOverride) {
    outSettings.dataDir = *dataDirOverride;
  }

  if (outSettings.dataDir.empty()) {
    outSettings.dataDir = library::findDefaultDataDir();
  }

  bool const rootsGiven = !outSettings.modelsDir.empty() &&
                          !outSettings.trajectoriesDir.empty() &&
                          !outSettings.thumbnailsDir.empty();

  if (outSettings.dataDir.empty() && !rootsGiven) {
    MOTLIB_LOG_ERR("No data directory given and none found above " +
                   fs::current_path().string());
    return false;
  }

  return true;
}

fs::path modelsPath(Settings const& settings) {
  return settings.modelsDir.empty()
             ? settings.dataDir / globals::modelsDirName
             : settings.modelsDir;
}

fs::path trajectoriesPath(Settings const& settings) {
  return settings.trajectoriesDir.empty()
             ? settings.dataDir / globals::trajectoriesDirName
             : settings.trajectoriesDir;
}

fs::path thumbnailsPath(Settings const& settings) {
  return settings.thumbnailsDir.empty()
             ? settings.dataDir / globals::thumbnailsDirName
             : settings.thumbnailsDir;
}

} /*namespace motlib::config*/
