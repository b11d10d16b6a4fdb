#pragma once

namespace motlib::globals {

constexpr char const* dataDirName = "data";
constexpr char const* modelsDirName = "models";
constexpr char const* trajectoriesDirName = "trajectories";
constexpr char const* thumbnailsDirName = "thumbnails";

constexpr char const* dataDirEnvVar = "MOTLIB_DATA_DIR";

} /*namespace motlib::globals*/
