#include <motlib/asset_id/asset_id.hpp>
#include <motlib/config/settings.hpp>
#include <motlib/core/camera_params.hpp>
#include <motlib/core/logging.hpp>
#include <motlib/library/data_root.hpp>
#include <motlib/mujoco_backend/mujoco_render_backend.hpp>
#include <motlib/render/thumbnail_generator.hpp>
#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/model_repository.hpp>
#include <motlib/storage/storage_result.hpp>
#include <motlib/storage/thumbnail_cache.hpp>
#include <motlib/storage/trajectory_repository.hpp>

#include <glm/vec3.hpp>

#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

using namespace motlib;

namespace {

constexpr char const* renderModelCommand = "render-model";
constexpr char const* renderTrajectoryCommand = "render-trajectory";
constexpr char const* pruneThumbnailsCommand = "prune-thumbnails";

struct CommandLine {
  std::string command;
  std::optional<std::string> modelPath;
  std::optional<std::string> trajectoryPath;
  std::optional<float> distance;
  std::optional<float> azimuth;
  std::optional<float> elevation;
  std::optional<glm::vec3> lookAt;
  std::optional<fs::path> dataDir;
  std::optional<fs::path> configPath;
};

void reportInvalidArguments() {
  MOTLIB_LOG_ERR(
      "Invalid command line arguments. Usage:\n"
      "render-model --model <path>\n"
      "render-trajectory --trajectory <file-or-folder> --model <path>\n"
      "prune-thumbnails\n"
      "Paths are relative to the models and trajectories roots. Options:\n"
      "--distance <d> --azimuth <deg> --elevation <deg> --lookat <x> <y> <z>\n"
      "--data-dir <path> --config <settings-json>");
}

bool parseFloat(char const* text, float& outValue) {
  try {
    std::size_t parsedCnt = 0;
    outValue = std::stof(text, &parsedCnt);
    return parsedCnt == std::strlen(text);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(std::string{"Not a number: "} + text + " (" + e.what() +
                   ")");
    return false;
  }
}

bool parseCommandLine(int argc, char const** argv, CommandLine& outCmd) {
  if (argc < 2) {
    return false;
  }

  outCmd.command = argv[1];

  for (int i = 2; i < argc; ++i) {
    bool const hasValue = i + 1 < argc;

    if (std::strcmp(argv[i], "--model") == 0 && hasValue) {
      outCmd.modelPath = argv[++i];
    } else if (std::strcmp(argv[i], "--trajectory") == 0 && hasValue) {
      outCmd.trajectoryPath = argv[++i];
    } else if (std::strcmp(argv[i], "--data-dir") == 0 && hasValue) {
      outCmd.dataDir = argv[++i];
    } else if (std::strcmp(argv[i], "--config") == 0 && hasValue) {
      outCmd.configPath = argv[++i];
    } else if (std::strcmp(argv[i], "--distance") == 0 && hasValue) {
      if (!parseFloat(argv[++i], outCmd.distance.emplace())) {
        return false;
      }
    } else if (std::strcmp(argv[i], "--azimuth") == 0 && hasValue) {
      if (!parseFloat(argv[++i], outCmd.azimuth.emplace())) {
        return false;
      }
    } else if (std::strcmp(argv[i], "--elevation") == 0 && hasValue) {
      if (!parseFloat(argv[++i], outCmd.elevation.emplace())) {
        return false;
      }
    } else if (std::strcmp(argv[i], "--lookat") == 0 && i + 3 < argc) {
      glm::vec3& lookAt = outCmd.lookAt.emplace();
      if (!parseFloat(argv[i + 1], lookAt.x) ||
          !parseFloat(argv[i + 2], lookAt.y) ||
          !parseFloat(argv[i + 3], lookAt.z)) {
        return false;
      }
      i += 3;
    } else {
      MOTLIB_LOG_ERR(std::string{"Unexpected argument "} + argv[i]);
      return false;
    }
  }

  return true;
}

core::CameraParams cameraFor(CommandLine const& cmd,
                             config::Settings const& settings) {
  core::CameraParams camera = settings.camera;

  if (cmd.distance)
    camera.distance = *cmd.distance;
  if (cmd.azimuth)
    camera.azimuthDeg = *cmd.azimuth;
  if (cmd.elevation)
    camera.elevationDeg = *cmd.elevation;
  if (cmd.lookAt)
    camera.lookAt = *cmd.lookAt;

  return camera;
}

render::ThumbnailOptions optionsFor(config::Settings const& settings) {
  render::ThumbnailOptions options;
  options.width = settings.thumbnailWidth;
  options.height = settings.thumbnailHeight;
  options.supersampling = settings.supersampling;
  options.sampleFrames = settings.trajectorySampleFrames;
  options.frameDurationMs = settings.frameDurationMs;
  options.webp.quality = settings.webpQuality;
  options.webp.method = settings.webpMethod;
  return options;
}

int reportSummary(render::BatchSummary const& summary) {
  for (render::RenderOutcome const& outcome : summary.outcomes) {
    if (outcome.succeeded()) {
      std::cout << "ok     " << outcome.assetPath << " -> "
                << outcome.thumbnailPath.string() << std::endl;
    } else {
      std::cout << "failed " << outcome.assetPath << " ("
                << render::renderStageToString(outcome.failedStage)
                << "): " << outcome.message << std::endl;
    }
  }

  std::cout << summary.successCount() << "/" << summary.totalCount()
            << " thumbnails rendered" << std::endl;

  return summary.successCount() == summary.totalCount() ? 0 : 1;
}

int pruneThumbnails(library::DataRoot const& dataRoot) {
  storage::ModelRepository const models{dataRoot.getModelsPath()};
  storage::TrajectoryRepository const trajectories{
      dataRoot.getTrajectoriesPath()};
  storage::ThumbnailCache const thumbnails{dataRoot.getThumbnailsPath()};

  std::vector<storage::ModelMetadata> modelList;
  std::vector<storage::TrajectoryMetadata> trajectoryList;

  // Pruning against a partial listing would delete live thumbnails.
  if (models.list(modelList) != storage::StorageResult::success ||
      trajectories.list(std::nullopt, trajectoryList) !=
          storage::StorageResult::success) {
    MOTLIB_LOG_ERR("Failed to list assets, nothing pruned.");
    return 1;
  }

  std::set<asset_id::AssetId> modelIds;
  for (storage::ModelMetadata const& model : modelList) {
    modelIds.insert(model.id);
  }

  std::set<asset_id::AssetId> trajectoryIds;
  for (storage::TrajectoryMetadata const& trajectory : trajectoryList) {
    trajectoryIds.insert(trajectory.id);
  }

  std::size_t const removedCnt =
      render::pruneOrphanedThumbnails(thumbnails, storage::AssetKind::model,
                                      modelIds) +
      render::pruneOrphanedThumbnails(
          thumbnails, storage::AssetKind::trajectory, trajectoryIds);

  std::cout << removedCnt << " orphaned thumbnails removed" << std::endl;

  return 0;
}

} /*namespace*/

int main(int argc, char const** argv) {
  CommandLine cmd;

  if (!parseCommandLine(argc, argv, cmd)) {
    reportInvalidArguments();
    return 1;
  }

  bool const validCommand =
      (cmd.command == renderModelCommand && cmd.modelPath) ||
      (cmd.command == renderTrajectoryCommand && cmd.modelPath &&
       cmd.trajectoryPath) ||
      cmd.command == pruneThumbnailsCommand;

  if (!validCommand) {
    reportInvalidArguments();
    return 1;
  }

  config::Settings settings;
  if (!config::resolveToolSettings(cmd.configPath, cmd.dataDir, settings)) {
    return 1;
  }

  library::DataRoot dataRoot;
  if (!dataRoot.open(config::modelsPath(settings),
                     config::trajectoriesPath(settings),
                     config::thumbnailsPath(settings))) {
    MOTLIB_LOG_ERR("Failed to open data directory " +
                   settings.dataDir.string());
    return 1;
  }

  if (cmd.command == pruneThumbnailsCommand) {
    return pruneThumbnails(dataRoot);
  }

  mujoco_backend::MujocoRenderBackend backend;
  if (!backend.init()) {
    MOTLIB_LOG_ERR("Failed to initialize the render backend.");
    return 1;
  }

  storage::ThumbnailCache const thumbnails{dataRoot.getThumbnailsPath()};
  render::ThumbnailGenerator generator{
      backend, thumbnails, dataRoot.getModelsPath(),
      dataRoot.getTrajectoriesPath(), optionsFor(settings)};

  core::CameraParams const camera = cameraFor(cmd, settings);
  render::BatchSummary summary;

  if (cmd.command == renderModelCommand) {
    summary.outcomes.push_back(generator.renderModel(*cmd.modelPath, camera));
    return reportSummary(summary);
  }

  std::error_code ec;
  if (fs::is_directory(dataRoot.getTrajectoriesPath() / *cmd.trajectoryPath,
                       ec)) {
    if (!generator.renderTrajectoriesInFolder(
            *cmd.trajectoryPath, *cmd.modelPath, camera, summary)) {
      return 1;
    }

    if (summary.outcomes.empty()) {
      MOTLIB_LOG_WARN("No trajectory files in " + *cmd.trajectoryPath);
    }
  } else {
    summary.outcomes.push_back(generator.renderTrajectory(
        *cmd.trajectoryPath, *cmd.modelPath, camera));
  }

  return reportSummary(summary);
}
