#include <motlib/core/logging.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/serialization/asset_metadata_serialization.hpp>
#include <motlib/serialization/serialization.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>

namespace fs = std::filesystem;

namespace motlib::serialization {

constexpr char const* idJsonName = "id";
constexpr char const* filenameJsonName = "filename";
constexpr char const* modelNameJsonName = "model_name";
constexpr char const* relativePathJsonName = "relative_path";
constexpr char const* fileSizeJsonName = "file_size";
constexpr char const* uploadDateJsonName = "upload_date";
constexpr char const* thumbnailPathJsonName = "thumbnail_path";

constexpr char const* categoryJsonName = "category";
constexpr char const* frameCountJsonName = "frame_count";
constexpr char const* frameRateJsonName = "frame_rate";
constexpr char const* numJointsJsonName = "num_joints";

constexpr char const* modelsJsonName = "models";
constexpr char const* trajectoriesJsonName = "trajectories";
constexpr char const* totalJsonName = "total";
constexpr char const* filesJsonName = "files";
constexpr char const* pathJsonName = "path";

namespace {

template <typename T>
void setOptional(nlohmann::json& json, char const* name,
                 std::optional<T> const& value) {
  if (value) {
    json[name] = *value;
  } else {
    json[name] = nullptr;
  }
}

} /*namespace*/

bool serializeModel(storage::ModelMetadata const& model,
                    nlohmann::json& outJson) {
  try {
    outJson[idJsonName] = model.id;
    outJson[filenameJsonName] = model.filename;
    setOptional(outJson, modelNameJsonName, model.modelName);
    outJson[relativePathJsonName] = model.relativePath;
    outJson[fileSizeJsonName] = model.fileSize;
    outJson[uploadDateJsonName] = toIsoTimestamp(model.modifiedTime);
    setOptional(outJson, thumbnailPathJsonName, model.thumbnailPath);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  return true;
}

bool serializeTrajectory(storage::TrajectoryMetadata const& trajectory,
                         nlohmann::json& outJson) {
  try {
    outJson[idJsonName] = trajectory.id;
    outJson[filenameJsonName] = trajectory.filename;
    setOptional(outJson, categoryJsonName, trajectory.category);
    outJson[relativePathJsonName] = trajectory.relativePath;
    outJson[fileSizeJsonName] = trajectory.fileSize;
    outJson[uploadDateJsonName] = toIsoTimestamp(trajectory.modifiedTime);
    setOptional(outJson, frameCountJsonName, trajectory.frameCount);
    setOptional(outJson, frameRateJsonName, trajectory.frameRate);
    setOptional(outJson, numJointsJsonName, trajectory.numJoints);
    setOptional(outJson, thumbnailPathJsonName, trajectory.thumbnailPath);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  return true;
}

bool serializeModelList(std::vector<storage::ModelMetadata> const& models,
                        nlohmann::json& outJson) {
  nlohmann::json modelsJson = nlohmann::json::array();

  for (storage::ModelMetadata const& model : models) {
    nlohmann::json modelJson;
    if (!serializeModel(model, modelJson)) {
      return false;
    }
    modelsJson.push_back(std::move(modelJson));
  }

  outJson[modelsJsonName] = std::move(modelsJson);
  outJson[totalJsonName] = models.size();

  return true;
}

bool serializeTrajectoryList(
    std::vector<storage::TrajectoryMetadata> const& trajectories,
    nlohmann::json& outJson) {
  nlohmann::json trajectoriesJson = nlohmann::json::array();

  for (storage::TrajectoryMetadata const& trajectory : trajectories) {
    nlohmann::json trajectoryJson;
    if (!serializeTrajectory(trajectory, trajectoryJson)) {
      return false;
    }
    trajectoriesJson.push_back(std::move(trajectoryJson));
  }

  outJson[trajectoriesJsonName] = std::move(trajectoriesJson);
  outJson[totalJsonName] = trajectories.size();

  return true;
}

bool serializeModelDirectoryFiles(
    std::vector<storage::ModelDirectoryFile> const& files,
    nlohmann::json& outJson) {
  nlohmann::json filesJson = nlohmann::json::array();

  for (storage::ModelDirectoryFile const& file : files) {
    filesJson.push_back(
        {{pathJsonName, file.relativePath}, {fileSizeJsonName, file.fileSize}});
  }

  outJson[filesJsonName] = std::move(filesJson);

  return true;
}

char const* mediaTypeForPath(fs::path const& path) {
  fs::path const extension = path.extension();

  if (extension == globals::webpExt)
    return "image/webp";
  if (extension == globals::pngExt)
    return "image/png";
  if (extension == globals::jpgExt || extension == ".jpeg")
    return "image/jpeg";
  if (extension == globals::gifExt)
    return "image/gif";
  if (extension == globals::modelDescriptionExt)
    return "application/xml";
  if (extension == ".stl")
    return "model/stl";
  if (extension == ".obj" || extension == ".dae" || extension == ".mesh")
    return "model/mesh";

  return "application/octet-stream";
}

} /*namespace motlib::serialization*/
