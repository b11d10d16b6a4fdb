#include <motlib/array_io/array_io.hpp>
#include <motlib/core/logging.hpp>
#include <motlib/globals/file_extensions.hpp>
#include <motlib/storage/trajectory_data.hpp>

#include <tracy/Tracy.hpp>

#include <exception>

namespace fs = std::filesystem;

namespace motlib::storage {

namespace {

bool readTrajectoryData(fs::path const& path, TrajectoryData& outData) {
  fs::path const extension = path.extension();

  if (extension == globals::arrayFileExt) {
    array_io::NumericArray poses;
    if (!array_io::loadArrayFromFile(path, poses)) {
      return false;
    }

    outData.poses = std::move(poses);
    outData.frameRate.reset();
    return true;
  }

  if (extension == globals::arrayBundleFileExt) {
    array_io::ArrayBundle bundle;
    if (!array_io::loadArrayBundleFromFile(path, bundle)) {
      return false;
    }

    array_io::NumericArray const* const poses = array_io::findArray(
        bundle, {poseSequenceFieldName, poseSequenceFallbackFieldName});
    array_io::NumericArray const* const frameRate = array_io::findArray(
        bundle, {frameRateFieldName, frameRateFallbackFieldName});

    outData.poses.reset();
    outData.frameRate.reset();

    if (poses) {
      outData.poses = *poses;
    }

    if (frameRate) {
      if (frameRate->values.size() != 1) {
        MOTLIB_LOG_ERR("Frame rate of " + path.string() +
                       " is not a single value.");
        return false;
      }
      outData.frameRate = frameRate->values.front();
    }

    return true;
  }

  MOTLIB_LOG_ERR("Unsupported trajectory file " + path.string());
  return false;
}

} /*namespace*/

bool loadTrajectoryData(fs::path const& path, TrajectoryData& outData) {
  ZoneScoped;

  try {
    return readTrajectoryData(path, outData);
  } catch (std::exception const& e) {
    MOTLIB_LOG_ERR("Failed to load trajectory " + path.string() + ": " +
                   e.what());
    return false;
  }
}

TrajectoryShape poseSequenceShape(array_io::NumericArray const& poses) {
  TrajectoryShape shape;

  if (poses.shape.size() > 1) {
    shape.frameCount = poses.shape[0];
    shape.numJoints = poses.shape[1];
  } else if (poses.shape.size() == 1) {
    shape.frameCount = poses.shape[0];
  }

  return shape;
}

} /*namespace motlib::storage*/
