#pragma once

#include <motlib/storage/asset_metadata.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <vector>

namespace motlib::serialization {

bool serializeModel(storage::ModelMetadata const& model,
                    nlohmann::json& outJson);

bool serializeTrajectory(storage::TrajectoryMetadata const& trajectory,
                         nlohmann::json& outJson);

// {"models": [...], "total": n}
bool serializeModelList(std::vector<storage::ModelMetadata> const& models,
                        nlohmann::json& outJson);

// {"trajectories": [...], "total": n}
bool serializeTrajectoryList(
    std::vector<storage::TrajectoryMetadata> const& trajectories,
    nlohmann::json& outJson);

// {"files": [{"path": ..., "file_size": ...}, ...]}
bool serializeModelDirectoryFiles(
    std::vector<storage::ModelDirectoryFile> const& files,
    nlohmann::json& outJson);

// Media type served for a thumbnail or model directory file.
char const* mediaTypeForPath(std::filesystem::path const& path);

} /*namespace motlib::serialization*/
