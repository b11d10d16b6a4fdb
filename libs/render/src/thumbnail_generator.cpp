#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>
#include <motlib/core/utils/path_utils.hpp>
#include <motlib/core/utils/texture_utils.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/render/frame_sampling.hpp>
#include <motlib/render/thumbnail_generator.hpp>
#include <motlib/storage/trajectory_data.hpp>
#include <motlib/storage/trajectory_repository.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace motlib::render {

namespace {

void fail(RenderOutcome& outcome, std::string message) {
  outcome.failedStage = outcome.stage;
  outcome.stage = RenderStage::failed;
  outcome.message = std::move(message);

  MOTLIB_LOG_ERR("Rendering " + outcome.assetPath + " failed while " +
                 renderStageToString(outcome.failedStage) + ": " +
                 outcome.message);
}

// Normalizes relativePath and places it under root. Fails for absolute paths
// and for paths climbing out of root.
bool resolveUnderRoot(fs::path const& root, std::string const& relativePath,
                      fs::path& outPath, std::string& outGenericPath) {
  fs::path const normalPath = fs::path{relativePath}.lexically_normal();

  if (relativePath.empty() || normalPath.has_root_path() ||
      !core::utils::isLexicallyWithin(root / normalPath, root)) {
    return false;
  }

  outPath = root / normalPath;
  outGenericPath = core::utils::genericRelativePath(outPath, root);

  return true;
}

bool resolveModelFile(fs::path const& modelsRoot, std::string const& modelPath,
                      fs::path& outPath, std::string& outError) {
  std::string genericPath;

  if (!resolveUnderRoot(modelsRoot, modelPath, outPath, genericPath) ||
      genericPath.empty()) {
    outError = "Model path " + modelPath + " is outside the models root.";
    return false;
  }

  // Only root-level and first-level description files are listed as
  // models, deeper ones would get thumbnails nothing refers to.
  if (std::count(genericPath.cbegin(), genericPath.cend(), '/') > 1) {
    outError = "Model " + modelPath + " is nested below a model directory.";
    return false;
  }

  std::error_code ec;

  if (outPath.extension() != globals::modelDescriptionExt ||
      !fs::is_regular_file(outPath, ec)) {
    outError = "Model " + modelPath + " is not a model description file.";
    return false;
  }

  return true;
}

} /*namespace*/

char const* renderStageToString(RenderStage stage) {
  switch (stage) {
  case RenderStage::pending:
    return "pending";
  case RenderStage::loading:
    return "loading";
  case RenderStage::rendering:
    return "rendering";
  case RenderStage::encoding:
    return "encoding";
  case RenderStage::done:
    return "done";
  case RenderStage::failed:
    return "failed";
  }

  return "unknown";
}

std::size_t BatchSummary::successCount() const {
  return std::count_if(
      outcomes.cbegin(), outcomes.cend(),
      [](RenderOutcome const& outcome) { return outcome.succeeded(); });
}

ThumbnailGenerator::ThumbnailGenerator(
    IRenderBackend& backend, storage::ThumbnailCache const& thumbnailCache,
    fs::path const& modelsRoot, fs::path const& trajectoriesRoot,
    ThumbnailOptions const& options)
    : _backend{backend}, _thumbnailCache{thumbnailCache},
      _modelsRoot{core::utils::normalizedDirPath(modelsRoot)},
      _trajectoriesRoot{core::utils::normalizedDirPath(trajectoriesRoot)},
      _options{options} {}

RenderOutcome
ThumbnailGenerator::renderModel(std::string const& modelPath,
                                core::CameraParams const& camera) {
  ZoneScoped;

  RenderOutcome outcome;
  outcome.assetPath = modelPath;
  outcome.stage = RenderStage::loading;

  fs::path modelFile;
  std::string error;

  if (!resolveModelFile(_modelsRoot, modelPath, modelFile, error)) {
    fail(outcome, error);
    return outcome;
  }

  outcome.assetPath = core::utils::genericRelativePath(modelFile, _modelsRoot);
  outcome.id = asset_id::idFromString(outcome.assetPath);

  std::unique_ptr<IRenderModel> const model = _backend.loadModel(modelFile);

  if (!model) {
    fail(outcome, "Could not load model " + modelFile.string());
    return outcome;
  }

  if (!model->setRestPose()) {
    fail(outcome, "Could not set the rest pose.");
    return outcome;
  }

  outcome.stage = RenderStage::rendering;

  Image image;
  if (!renderFrame(*model, camera, image, outcome)) {
    return outcome;
  }

  outcome.stage = RenderStage::encoding;

  std::vector<char> encoded;
  if (!encodeStillWebP(image, _options.webp, encoded)) {
    fail(outcome, "WebP encoding failed.");
    return outcome;
  }

  if (!writeThumbnail(storage::AssetKind::model, encoded, outcome)) {
    return outcome;
  }

  outcome.stage = RenderStage::done;
  MOTLIB_LOG_MSG("Rendered " + outcome.assetPath + " to " +
                 outcome.thumbnailPath.string());

  return outcome;
}

RenderOutcome
ThumbnailGenerator::renderTrajectory(std::string const& trajectoryPath,
                                     std::string const& modelPath,
                                     core::CameraParams const& camera) {
  ZoneScoped;

  RenderOutcome outcome;
  outcome.assetPath = trajectoryPath;
  outcome.stage = RenderStage::loading;

  fs::path trajectoryFile;
  std::string genericPath;
  std::error_code ec;

  if (!resolveUnderRoot(_trajectoriesRoot, trajectoryPath, trajectoryFile,
                        genericPath) ||
      genericPath.empty()) {
    fail(outcome, "Trajectory path is outside the trajectories root.");
    return outcome;
  }

  if (!storage::isTrajectoryFile(trajectoryFile) ||
      !fs::is_regular_file(trajectoryFile, ec)) {
    fail(outcome, "Not a trajectory file: " + trajectoryFile.string());
    return outcome;
  }

  outcome.assetPath = genericPath;
  outcome.id = asset_id::idFromString(genericPath);

  fs::path modelFile;
  std::string error;

  if (!resolveModelFile(_modelsRoot, modelPath, modelFile, error)) {
    fail(outcome, error);
    return outcome;
  }

  std::unique_ptr<IRenderModel> const model = _backend.loadModel(modelFile);

  if (!model) {
    fail(outcome, "Could not load model " + modelFile.string());
    return outcome;
  }

  animateTrajectory(*model, trajectoryFile, camera, outcome);

  return outcome;
}

bool ThumbnailGenerator::renderTrajectoriesInFolder(
    std::string const& folderPath, std::string const& modelPath,
    core::CameraParams const& camera, BatchSummary& outSummary) {
  ZoneScoped;

  fs::path folder;
  std::string genericFolder;

  if (!resolveUnderRoot(_trajectoriesRoot, folderPath, folder,
                        genericFolder)) {
    MOTLIB_LOG_ERR("Folder " + folderPath +
                   " is outside the trajectories root.");
    return false;
  }

  std::vector<fs::path> trajectoryFiles;

  try {
    if (!fs::is_directory(folder)) {
      MOTLIB_LOG_ERR(folder.string() + " is not a directory.");
      return false;
    }

    for (fs::directory_entry const& entry : fs::directory_iterator(folder)) {
      if (entry.is_regular_file() && storage::isTrajectoryFile(entry.path())) {
        trajectoryFiles.push_back(entry.path());
      }
    }
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR(e.what());
    return false;
  }

  std::sort(trajectoryFiles.begin(), trajectoryFiles.end());

  outSummary.outcomes.clear();

  fs::path modelFile;
  std::string modelError;
  std::unique_ptr<IRenderModel> model;

  if (resolveModelFile(_modelsRoot, modelPath, modelFile, modelError)) {
    model = _backend.loadModel(modelFile);
    if (!model) {
      modelError = "Could not load model " + modelFile.string();
    }
  }

  for (fs::path const& trajectoryFile : trajectoryFiles) {
    RenderOutcome& outcome = outSummary.outcomes.emplace_back();
    outcome.assetPath =
        core::utils::genericRelativePath(trajectoryFile, _trajectoriesRoot);
    outcome.id = asset_id::idFromString(outcome.assetPath);
    outcome.stage = RenderStage::loading;

    if (!model) {
      fail(outcome, modelError);
      continue;
    }

    animateTrajectory(*model, trajectoryFile, camera, outcome);
  }

  return true;
}

bool ThumbnailGenerator::renderFrame(IRenderModel& model,
                                     core::CameraParams const& camera,
                                     Image& outImage, RenderOutcome& outcome) {
  ZoneScoped;

  int const supersampling = _options.supersampling;

  if (_options.width <= 0 || _options.height <= 0 || supersampling <= 0) {
    fail(outcome, "Invalid thumbnail extent.");
    return false;
  }

  int const renderWidth = _options.width * supersampling;
  int const renderHeight = _options.height * supersampling;

  Image rendered;
  if (!_backend.render(model, camera, renderWidth, renderHeight, rendered)) {
    fail(outcome, "Backend failed to render a frame.");
    return false;
  }

  if (rendered.width != renderWidth || rendered.height != renderHeight ||
      rendered.pixels.size() != rendered.rowSize() * renderHeight) {
    fail(outcome, "Backend returned a frame of unexpected size.");
    return false;
  }

  if (supersampling == 1) {
    outImage = std::move(rendered);
    return true;
  }

  outImage.width = _options.width;
  outImage.height = _options.height;
  outImage.pixels = core::utils::downsamplePixels(
      rendered.pixels.data(), Image::channelCount, renderWidth, renderHeight,
      supersampling, Image::channelCount);

  return true;
}

void ThumbnailGenerator::animateTrajectory(IRenderModel& model,
                                           fs::path const& trajectoryFile,
                                           core::CameraParams const& camera,
                                           RenderOutcome& outcome) {
  ZoneScoped;

  storage::TrajectoryData trajectoryData;

  if (!storage::loadTrajectoryData(trajectoryFile, trajectoryData)) {
    fail(outcome, "Could not load " + trajectoryFile.string());
    return;
  }

  if (!trajectoryData.poses) {
    fail(outcome, "No pose sequence in " + trajectoryFile.string());
    return;
  }

  array_io::NumericArray const& poses = *trajectoryData.poses;

  std::size_t frameCount = 0;
  std::size_t poseWidth = 0;

  if (poses.shape.size() == 2) {
    frameCount = poses.shape[0];
    poseWidth = poses.shape[1];
  } else if (poses.shape.size() == 1) {
    // One scalar coordinate per frame.
    frameCount = poses.shape[0];
    poseWidth = 1;
  } else {
    fail(outcome, "Pose sequence must have one or two dimensions.");
    return;
  }

  if (!frameCount) {
    fail(outcome, "Empty pose sequence.");
    return;
  }

  if (!poseWidth || poses.values.size() / poseWidth != frameCount ||
      poses.values.size() % poseWidth) {
    fail(outcome, "Pose values do not match the sequence shape.");
    return;
  }

  if (poseWidth != model.getPoseSize()) {
    fail(outcome, "Pose width " + std::to_string(poseWidth) +
                      " does not match the model's " +
                      std::to_string(model.getPoseSize()) + " coordinates.");
    return;
  }

  std::vector<std::size_t> const frameIndices =
      sampleFrameIndices(frameCount, _options.sampleFrames);

  if (frameIndices.empty()) {
    fail(outcome, "No frames to sample.");
    return;
  }

  outcome.stage = RenderStage::rendering;

  std::vector<Image> frames;
  frames.reserve(frameIndices.size());

  for (std::size_t const frameIndex : frameIndices) {
    ZoneScopedN("Render sampled frame");

    std::span<double const> const pose{
        poses.values.data() + frameIndex * poseWidth, poseWidth};

    if (!model.setPose(pose)) {
      fail(outcome, "Could not apply pose " + std::to_string(frameIndex));
      return;
    }

    if (!renderFrame(model, camera, frames.emplace_back(), outcome)) {
      return;
    }
  }

  outcome.stage = RenderStage::encoding;

  std::vector<char> encoded;
  if (!encodeAnimatedWebP(frames, _options.frameDurationMs, _options.webp,
                          encoded)) {
    fail(outcome, "Animated WebP encoding failed.");
    return;
  }

  if (!writeThumbnail(storage::AssetKind::trajectory, encoded, outcome)) {
    return;
  }

  outcome.stage = RenderStage::done;
  MOTLIB_LOG_MSG("Rendered " + outcome.assetPath + " to " +
                 outcome.thumbnailPath.string());
}

bool ThumbnailGenerator::writeThumbnail(storage::AssetKind kind,
                                        std::vector<char> const& bytes,
                                        RenderOutcome& outcome) {
  fs::path const thumbnailPath =
      _thumbnailCache.mirroredPath(kind, outcome.assetPath);

  if (!core::utils::writeFileAtomically(thumbnailPath, bytes)) {
    fail(outcome, "Could not write " + thumbnailPath.string());
    return false;
  }

  outcome.thumbnailPath = thumbnailPath;

  return true;
}

std::size_t
pruneOrphanedThumbnails(storage::ThumbnailCache const& thumbnailCache,
                        storage::AssetKind kind,
                        std::set<asset_id::AssetId> const& liveIds) {
  ZoneScoped;

  std::size_t removedCount = 0;

  for (fs::path const& thumbnail : thumbnailCache.listThumbnailFiles(kind)) {
    if (liveIds.contains(thumbnail.stem().string())) {
      continue;
    }

    std::error_code ec;
    if (fs::remove(thumbnail, ec)) {
      MOTLIB_LOG_MSG("Removed orphaned thumbnail " + thumbnail.string());
      ++removedCount;
    } else if (ec) {
      MOTLIB_LOG_ERR("Failed to remove " + thumbnail.string() + ": " +
                     ec.message());
    }
  }

  return removedCount;
}

} /*namespace motlib::render*/
