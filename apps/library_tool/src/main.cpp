#include <motlib/asset_id/asset_id.hpp>
#include <motlib/config/settings.hpp>
#include <motlib/core/logging.hpp>
#include <motlib/core/utils/file_utils.hpp>
#include <motlib/library/data_root.hpp>
#include <motlib/serialization/asset_metadata_serialization.hpp>
#include <motlib/storage/asset_catalog.hpp>
#include <motlib/storage/asset_metadata.hpp>
#include <motlib/storage/storage_result.hpp>

#include <nlohmann/json.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace motlib;
using storage::StorageResult;

namespace {

constexpr char const* errorJsonName = "error";
constexpr char const* deletedJsonName = "deleted";
constexpr char const* pathJsonName = "path";
constexpr char const* mediaTypeJsonName = "media_type";

// Exit codes, 1 is reserved for usage errors.
int exitCodeFor(StorageResult result) {
  switch (result) {
  case StorageResult::success:
    return 0;
  case StorageResult::notFound:
    return 2;
  case StorageResult::invalidInput:
    return 3;
  case StorageResult::forbidden:
    return 4;
  case StorageResult::ioFailure:
    return 5;
  default:
    return 1;
  }
}

void reportInvalidArguments() {
  MOTLIB_LOG_ERR("Invalid command line arguments. Usage:\n"
                 "list-models\n"
                 "list-trajectories [--category <name>]\n"
                 "get-model <id> | get-trajectory <id>\n"
                 "save-model <file> [--model-name <name>]\n"
                 "save-trajectory <file> [--category <name>]\n"
                 "delete-model <id> | delete-trajectory <id>\n"
                 "model-files <id> | model-file <id> <path>\n"
                 "model-thumbnail <id> | trajectory-thumbnail <id>\n"
                 "Options: --data-dir <path> --config <settings-json>");
}

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> category;
  std::optional<std::string> modelName;
  std::optional<fs::path> dataDir;
  std::optional<fs::path> configPath;
};

bool parseCommandLine(int argc, char const** argv, CommandLine& outCmd) {
  if (argc < 2) {
    return false;
  }

  outCmd.command = argv[1];

  for (int i = 2; i < argc; ++i) {
    bool const hasValue = i + 1 < argc;

    if (std::strcmp(argv[i], "--category") == 0 && hasValue) {
      outCmd.category = argv[++i];
    } else if (std::strcmp(argv[i], "--model-name") == 0 && hasValue) {
      outCmd.modelName = argv[++i];
    } else if (std::strcmp(argv[i], "--data-dir") == 0 && hasValue) {
      outCmd.dataDir = argv[++i];
    } else if (std::strcmp(argv[i], "--config") == 0 && hasValue) {
      outCmd.configPath = argv[++i];
    } else if (std::strncmp(argv[i], "--", 2) == 0) {
      MOTLIB_LOG_ERR(std::string{"Unexpected option "} + argv[i]);
      return false;
    } else {
      outCmd.positional.push_back(argv[i]);
    }
  }

  return true;
}

int respond(StorageResult result, nlohmann::json const& payloadJson) {
  if (result == StorageResult::success) {
    std::cout << payloadJson.dump(2) << std::endl;
  } else {
    nlohmann::json errorJson;
    errorJson[errorJsonName] = storage::storageResultToString(result);
    std::cout << errorJson.dump(2) << std::endl;
  }

  return exitCodeFor(result);
}

int respondWithFile(StorageResult result, fs::path const& path) {
  nlohmann::json fileJson;

  if (result == StorageResult::success) {
    fileJson[pathJsonName] = path.string();
    fileJson[mediaTypeJsonName] = serialization::mediaTypeForPath(path);
  }

  return respond(result, fileJson);
}

// Serialization failures are reported as I/O failures of the command.
StorageResult checkSerialized(bool serialized) {
  return serialized ? StorageResult::success : StorageResult::ioFailure;
}

int saveAsset(storage::AssetCatalog& catalog, CommandLine const& cmd,
              storage::AssetKind kind) {
  fs::path const sourcePath = cmd.positional.front();

  std::vector<char> content;
  if (!core::utils::readFileBytes(sourcePath, content)) {
    return respond(StorageResult::ioFailure, {});
  }

  std::string const filename = sourcePath.filename().string();
  nlohmann::json savedJson;

  if (kind == storage::AssetKind::model) {
    storage::ModelMetadata model;
    StorageResult const result =
        catalog.getModels().save(filename, content, cmd.modelName, model);
    if (result != StorageResult::success) {
      return respond(result, {});
    }
    return respond(
        checkSerialized(serialization::serializeModel(model, savedJson)),
        savedJson);
  }

  storage::TrajectoryMetadata trajectory;
  StorageResult const result = catalog.getTrajectories().save(
      filename, content, cmd.category, trajectory);
  if (result != StorageResult::success) {
    return respond(result, {});
  }
  return respond(checkSerialized(serialization::serializeTrajectory(
                     trajectory, savedJson)),
                 savedJson);
}

int runCommand(storage::AssetCatalog& catalog, CommandLine const& cmd) {
  std::string const& command = cmd.command;
  nlohmann::json outJson;

  if (command == "list-models") {
    std::vector<storage::ModelMetadata> models;
    StorageResult result = catalog.listModels(models);
    if (result == StorageResult::success) {
      result = checkSerialized(
          serialization::serializeModelList(models, outJson));
    }
    return respond(result, outJson);
  }

  if (command == "list-trajectories") {
    std::vector<storage::TrajectoryMetadata> trajectories;
    StorageResult result =
        catalog.listTrajectories(cmd.category, trajectories);
    if (result == StorageResult::success) {
      result = checkSerialized(
          serialization::serializeTrajectoryList(trajectories, outJson));
    }
    return respond(result, outJson);
  }

  if (cmd.positional.empty()) {
    reportInvalidArguments();
    return 1;
  }

  std::string const& argument = cmd.positional.front();

  if (command == "get-model") {
    storage::ModelMetadata model;
    StorageResult result = catalog.getModel(argument, model);
    if (result == StorageResult::success) {
      result = checkSerialized(serialization::serializeModel(model, outJson));
    }
    return respond(result, outJson);
  }

  if (command == "get-trajectory") {
    storage::TrajectoryMetadata trajectory;
    StorageResult result = catalog.getTrajectory(argument, trajectory);
    if (result == StorageResult::success) {
      result = checkSerialized(
          serialization::serializeTrajectory(trajectory, outJson));
    }
    return respond(result, outJson);
  }

  if (command == "save-model") {
    return saveAsset(catalog, cmd, storage::AssetKind::model);
  }

  if (command == "save-trajectory") {
    return saveAsset(catalog, cmd, storage::AssetKind::trajectory);
  }

  if (command == "delete-model" || command == "delete-trajectory") {
    StorageResult const result =
        command == "delete-model" ? catalog.getModels().remove(argument)
                                  : catalog.getTrajectories().remove(argument);
    outJson[deletedJsonName] = argument;
    return respond(result, outJson);
  }

  if (command == "model-files") {
    std::vector<storage::ModelDirectoryFile> files;
    StorageResult result =
        catalog.getModels().listDirectoryFiles(argument, files);
    if (result == StorageResult::success) {
      result = checkSerialized(
          serialization::serializeModelDirectoryFiles(files, outJson));
    }
    return respond(result, outJson);
  }

  if (command == "model-file") {
    if (cmd.positional.size() < 2) {
      reportInvalidArguments();
      return 1;
    }

    fs::path filePath;
    StorageResult const result = catalog.getModels().getDirectoryFile(
        argument, cmd.positional[1], filePath);
    return respondWithFile(result, filePath);
  }

  if (command == "model-thumbnail" || command == "trajectory-thumbnail") {
    storage::AssetKind const kind = command == "model-thumbnail"
                                        ? storage::AssetKind::model
                                        : storage::AssetKind::trajectory;
    fs::path thumbnailPath;
    StorageResult const result =
        catalog.getThumbnail(argument, kind, thumbnailPath);
    return respondWithFile(result, thumbnailPath);
  }

  reportInvalidArguments();
  return 1;
}

} /*namespace*/

int main(int argc, char const** argv) {
  CommandLine cmd;

  if (!parseCommandLine(argc, argv, cmd)) {
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

  storage::AssetCatalog catalog{dataRoot};

  return runCommand(catalog, cmd);
}
