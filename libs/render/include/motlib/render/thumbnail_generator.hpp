#pragma once

#include <motlib/asset_id/asset_id.hpp>
#include <motlib/core/camera_params.hpp>
#include <motlib/render/image.hpp>
#include <motlib/render/render_backend.hpp>
#include <motlib/render/webp_encoding.hpp>
#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/thumbnail_cache.hpp>

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace motlib::render {

enum class RenderStage { pending, loading, rendering, encoding, done, failed };

char const* renderStageToString(RenderStage stage);

struct RenderOutcome {
  // Relative to the models root for still renders, to the trajectories root
  // for animated ones.
  std::string assetPath;
  asset_id::AssetId id;
  RenderStage stage = RenderStage::pending;
  // Stage that was running when the render failed.
  RenderStage failedStage = RenderStage::pending;
  std::string message;
  std::filesystem::path thumbnailPath;

  bool succeeded() const { return stage == RenderStage::done; }
};

struct BatchSummary {
  std::vector<RenderOutcome> outcomes;

  std::size_t successCount() const;
  std::size_t totalCount() const { return outcomes.size(); }
};

struct ThumbnailOptions {
  int width = 160;
  int height = 160;
  // Frames are rasterized at supersampling times the output extent and box
  // filtered down.
  int supersampling = 2;
  std::size_t sampleFrames = 30;
  int frameDurationMs = 100;
  WebPParams webp;
};

// Offline writer of the thumbnail tree. Renders run one at a time on the
// calling thread; the backend is never entered concurrently.
class ThumbnailGenerator {
public:
  ThumbnailGenerator(IRenderBackend& backend,
                     storage::ThumbnailCache const& thumbnailCache,
                     std::filesystem::path const& modelsRoot,
                     std::filesystem::path const& trajectoriesRoot,
                     ThumbnailOptions const& options);

  RenderOutcome renderModel(std::string const& modelPath,
                            core::CameraParams const& camera);

  RenderOutcome renderTrajectory(std::string const& trajectoryPath,
                                 std::string const& modelPath,
                                 core::CameraParams const& camera);

  // Every .npy/.npz file directly inside folderPath, in name order. A failed
  // file does not stop the batch. Returns false only if folderPath is not a
  // directory under the trajectories root.
  bool renderTrajectoriesInFolder(std::string const& folderPath,
                                  std::string const& modelPath,
                                  core::CameraParams const& camera,
                                  BatchSummary& outSummary);

private:
  bool renderFrame(IRenderModel& model, core::CameraParams const& camera,
                   Image& outImage, RenderOutcome& outcome);

  void animateTrajectory(IRenderModel& model,
                         std::filesystem::path const& trajectoryFile,
                         core::CameraParams const& camera,
                         RenderOutcome& outcome);

  bool writeThumbnail(storage::AssetKind kind, std::vector<char> const& bytes,
                      RenderOutcome& outcome);

  IRenderBackend& _backend;
  storage::ThumbnailCache const& _thumbnailCache;
  std::filesystem::path _modelsRoot;
  std::filesystem::path _trajectoriesRoot;
  ThumbnailOptions _options;
};

// Deletes thumbnails of kind whose stem is not in liveIds. Returns the number
// of files removed.
std::size_t
pruneOrphanedThumbnails(storage::ThumbnailCache const& thumbnailCache,
                        storage::AssetKind kind,
                        std::set<asset_id::AssetId> const& liveIds);

} /*namespace motlib::render*/
