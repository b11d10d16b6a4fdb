#pragma once

#include <motlib/array_io/numeric_array.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>

namespace motlib::storage {

constexpr char const* poseSequenceFieldName = "qpos";
constexpr char const* poseSequenceFallbackFieldName = "qpos_traj";
constexpr char const* frameRateFieldName = "frame_rate";
constexpr char const* frameRateFallbackFieldName = "framerate";

struct TrajectoryData {
  // Unset when a bundle has no pose-sequence field.
  std::optional<array_io::NumericArray> poses;
  // Only bundles carry a frame rate.
  std::optional<double> frameRate;
};

// Loads a .npy file as a bare pose sequence or a .npz bundle by field name.
bool loadTrajectoryData(std::filesystem::path const& path,
                        TrajectoryData& outData);

struct TrajectoryShape {
  std::optional<std::size_t> frameCount;
  std::optional<std::size_t> numJoints;
};

// First axis is frames, second is pose dimensionality. A one-dimensional
// sequence has no pose dimensionality.
TrajectoryShape poseSequenceShape(array_io::NumericArray const& poses);

} /*namespace motlib::storage*/
