#include <motlib/asset_id/asset_id.hpp>
#include <motlib/storage/model_repository.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace motlib;
using namespace motlib::storage;

namespace {

constexpr char const* modelXml = "<mujoco model=\"test\"/>";

void writeFile(fs::path const& path, std::string const& content) {
  fs::create_directories(path.parent_path());
  std::ofstream{path, std::ios_base::binary} << content;
}

} /*namespace*/

class ModelRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    _tempDir = fs::temp_directory_path() /
               ("motlib_models_" + std::to_string(rd()));
    _modelsDir = _tempDir / "models";
    fs::create_directories(_modelsDir);
  }

  void TearDown() override { fs::remove_all(_tempDir); }

  fs::path _tempDir;
  fs::path _modelsDir;
};

TEST_F(ModelRepositoryTest, empty_root_lists_nothing) {
  // arrange
  ModelRepository repository{_modelsDir};
  std::vector<ModelMetadata> models;

  // act
  StorageResult const result = repository.list(models);

  // assert
  EXPECT_EQ(result, StorageResult::success);
  EXPECT_TRUE(models.empty());
}

TEST_F(ModelRepositoryTest, lists_root_and_first_level_description_files) {
  // arrange
  writeFile(_modelsDir / "humanoid.xml", modelXml);
  writeFile(_modelsDir / "MS-Human-700" / "MS-Human-700-MJX.xml", modelXml);
  writeFile(_modelsDir / "MS-Human-700" / "assets" / "muscle.xml", modelXml);
  writeFile(_modelsDir / "MS-Human-700" / "meshes" / "femur.stl", "solid");
  writeFile(_modelsDir / "readme.txt", "not a model");

  ModelRepository repository{_modelsDir};
  std::vector<ModelMetadata> models;

  // act
  ASSERT_EQ(repository.list(models), StorageResult::success);

  // assert
  ASSERT_EQ(models.size(), 2u);

  for (ModelMetadata const& model : models) {
    if (model.filename == "humanoid.xml") {
      EXPECT_EQ(model.id, "afc3d5d3e65b26a9");
      EXPECT_FALSE(model.modelName.has_value());
      EXPECT_EQ(model.relativePath, "humanoid.xml");
    } else {
      EXPECT_EQ(model.filename, "MS-Human-700-MJX.xml");
      EXPECT_EQ(model.id, "a38ce9076c8205a1");
      EXPECT_EQ(model.modelName, "MS-Human-700");
      EXPECT_EQ(model.relativePath, "MS-Human-700/MS-Human-700-MJX.xml");
    }
    EXPECT_EQ(model.fileSize, std::string{modelXml}.size());
  }
}

TEST_F(ModelRepositoryTest, lists_most_recently_modified_first) {
  // arrange
  writeFile(_modelsDir / "old.xml", modelXml);
  writeFile(_modelsDir / "new.xml", modelXml);
  writeFile(_modelsDir / "middle" / "middle.xml", modelXml);

  auto const now = fs::file_time_type::clock::now();
  fs::last_write_time(_modelsDir / "old.xml", now - std::chrono::hours{2});
  fs::last_write_time(_modelsDir / "middle" / "middle.xml",
                      now - std::chrono::hours{1});
  fs::last_write_time(_modelsDir / "new.xml", now);

  ModelRepository repository{_modelsDir};
  std::vector<ModelMetadata> models;

  // act
  ASSERT_EQ(repository.list(models), StorageResult::success);

  // assert
  ASSERT_EQ(models.size(), 3u);
  EXPECT_EQ(models[0].filename, "new.xml");
  EXPECT_EQ(models[1].filename, "middle.xml");
  EXPECT_EQ(models[2].filename, "old.xml");
}

TEST_F(ModelRepositoryTest, get_by_id_resolves_until_deleted) {
  // arrange
  writeFile(_modelsDir / "arm" / "arm.xml", modelXml);
  writeFile(_modelsDir / "arm" / "meshes" / "hand.stl", "solid");

  ModelRepository repository{_modelsDir};
  asset_id::AssetId const id = asset_id::idFromString("arm/arm.xml");

  // act
  ModelMetadata found;
  StorageResult const getResult = repository.get(id, found);
  StorageResult const removeResult = repository.remove(id);
  ModelMetadata afterRemove;
  StorageResult const getAfterRemove = repository.get(id, afterRemove);

  // assert
  EXPECT_EQ(getResult, StorageResult::success);
  EXPECT_EQ(found.relativePath, "arm/arm.xml");
  EXPECT_EQ(removeResult, StorageResult::success);
  EXPECT_EQ(getAfterRemove, StorageResult::notFound);
  EXPECT_EQ(repository.remove(id), StorageResult::notFound);
  EXPECT_TRUE(fs::exists(_modelsDir / "arm" / "meshes" / "hand.stl"));
}

TEST_F(ModelRepositoryTest, unknown_or_malformed_id_is_not_found) {
  writeFile(_modelsDir / "humanoid.xml", modelXml);
  ModelRepository repository{_modelsDir};

  ModelMetadata model;
  EXPECT_EQ(repository.get("0000000000000000", model),
            StorageResult::notFound);
  EXPECT_EQ(repository.get("../humanoid.xml", model),
            StorageResult::notFound);
  EXPECT_FALSE(repository.find("").has_value());
}

TEST_F(ModelRepositoryTest, save_creates_model_directory_and_overwrites) {
  // arrange
  ModelRepository repository{_modelsDir};
  std::string const first = "<mujoco/>";
  std::string const second = "<mujoco model=\"v2\"/>";

  // act
  ModelMetadata saved;
  StorageResult const firstResult =
      repository.save("walker.xml", first, std::string{"walker"}, saved);
  ModelMetadata overwritten;
  StorageResult const secondResult =
      repository.save("walker.xml", second, std::string{"walker"}, overwritten);

  // assert
  EXPECT_EQ(firstResult, StorageResult::success);
  EXPECT_EQ(secondResult, StorageResult::success);
  EXPECT_EQ(saved.id, overwritten.id);
  EXPECT_EQ(overwritten.relativePath, "walker/walker.xml");
  EXPECT_EQ(overwritten.modelName, "walker");
  EXPECT_EQ(overwritten.fileSize, second.size());
  EXPECT_EQ(repository.find(saved.id), _modelsDir / "walker" / "walker.xml");
}

TEST_F(ModelRepositoryTest, save_without_model_name_writes_to_root) {
  ModelRepository repository{_modelsDir};

  ModelMetadata saved;
  ASSERT_EQ(repository.save("humanoid.xml", std::string{modelXml},
                            std::string{}, saved),
            StorageResult::success);

  EXPECT_EQ(saved.id, "afc3d5d3e65b26a9");
  EXPECT_FALSE(saved.modelName.has_value());
  EXPECT_TRUE(fs::is_regular_file(_modelsDir / "humanoid.xml"));
}

TEST_F(ModelRepositoryTest, save_rejects_bad_names) {
  ModelRepository repository{_modelsDir};
  std::string const content = modelXml;
  ModelMetadata saved;

  EXPECT_EQ(repository.save("model.urdf", content, std::nullopt, saved),
            StorageResult::invalidInput);
  EXPECT_EQ(repository.save("../escape.xml", content, std::nullopt, saved),
            StorageResult::invalidInput);
  EXPECT_EQ(repository.save("model.xml", content, std::string{".."}, saved),
            StorageResult::invalidInput);
  EXPECT_EQ(repository.save("model.xml", content, std::string{"a/b"}, saved),
            StorageResult::invalidInput);
  EXPECT_FALSE(fs::exists(_tempDir / "escape.xml"));
}

TEST_F(ModelRepositoryTest, lists_files_of_model_directory) {
  // arrange
  writeFile(_modelsDir / "arm" / "arm.xml", modelXml);
  writeFile(_modelsDir / "arm" / "meshes" / "hand.stl", "solid hand");
  writeFile(_modelsDir / "arm" / "textures" / "skin.png", "png");
  writeFile(_modelsDir / "leg" / "leg.xml", modelXml);

  ModelRepository repository{_modelsDir};
  std::vector<ModelDirectoryFile> files;

  // act
  StorageResult const result = repository.listDirectoryFiles(
      asset_id::idFromString("arm/arm.xml"), files);

  // assert
  ASSERT_EQ(result, StorageResult::success);
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].relativePath, "arm.xml");
  EXPECT_EQ(files[1].relativePath, "meshes/hand.stl");
  EXPECT_EQ(files[1].fileSize, 10u);
  EXPECT_EQ(files[2].relativePath, "textures/skin.png");
}

TEST_F(ModelRepositoryTest, root_level_model_owns_only_its_file) {
  writeFile(_modelsDir / "humanoid.xml", modelXml);
  writeFile(_modelsDir / "arm" / "arm.xml", modelXml);

  ModelRepository repository{_modelsDir};
  asset_id::AssetId const id = asset_id::idFromString("humanoid.xml");

  std::vector<ModelDirectoryFile> files;
  ASSERT_EQ(repository.listDirectoryFiles(id, files), StorageResult::success);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].relativePath, "humanoid.xml");

  fs::path path;
  EXPECT_EQ(repository.getDirectoryFile(id, "humanoid.xml", path),
            StorageResult::success);
  EXPECT_EQ(repository.getDirectoryFile(id, "arm/arm.xml", path),
            StorageResult::forbidden);
}

class ModelFileGuardTest : public ModelRepositoryTest {
protected:
  void SetUp() override {
    ModelRepositoryTest::SetUp();

    writeFile(_modelsDir / "arm" / "arm.xml", modelXml);
    writeFile(_modelsDir / "arm" / "meshes" / "hand.stl", "solid hand");
    writeFile(_modelsDir / "leg" / "leg.xml", modelXml);
    writeFile(_modelsDir / "leg" / "meshes" / "foot.stl", "solid foot");
    writeFile(_tempDir / "secret.txt", "secret");

    _armId = asset_id::idFromString("arm/arm.xml");
  }

  asset_id::AssetId _armId;
};

TEST_F(ModelFileGuardTest, resolves_file_inside_model_directory) {
  // arrange
  ModelRepository repository{_modelsDir};
  fs::path path;

  // act
  StorageResult const result =
      repository.getDirectoryFile(_armId, "meshes/hand.stl", path);

  // assert
  ASSERT_EQ(result, StorageResult::success);
  EXPECT_EQ(path, fs::canonical(_modelsDir / "arm" / "meshes" / "hand.stl"));
}

TEST_F(ModelFileGuardTest, allows_dot_segments_that_stay_inside) {
  ModelRepository repository{_modelsDir};
  fs::path path;

  EXPECT_EQ(repository.getDirectoryFile(_armId, "meshes/../meshes/./hand.stl",
                                        path),
            StorageResult::success);
}

TEST_F(ModelFileGuardTest, rejects_sibling_model_directory) {
  // arrange
  ModelRepository repository{_modelsDir};
  fs::path path;

  // act
  StorageResult const result =
      repository.getDirectoryFile(_armId, "../leg/meshes/foot.stl", path);

  // assert
  EXPECT_EQ(result, StorageResult::forbidden);
  EXPECT_TRUE(path.empty());
}

TEST_F(ModelFileGuardTest, rejects_paths_outside_models_root) {
  ModelRepository repository{_modelsDir};
  fs::path path;

  EXPECT_EQ(repository.getDirectoryFile(_armId, "../../secret.txt", path),
            StorageResult::forbidden);
  EXPECT_EQ(
      repository.getDirectoryFile(_armId, "meshes/../../../secret.txt", path),
      StorageResult::forbidden);
  EXPECT_EQ(repository.getDirectoryFile(
                _armId, (_tempDir / "secret.txt").string(), path),
            StorageResult::forbidden);
  EXPECT_EQ(repository.getDirectoryFile(_armId, "/etc/passwd", path),
            StorageResult::forbidden);
}

TEST_F(ModelFileGuardTest, rejects_symlink_escaping_model_directory) {
  // arrange
  std::error_code errorCode;
  fs::create_symlink(_tempDir / "secret.txt",
                     _modelsDir / "arm" / "meshes" / "link.stl", errorCode);
  if (errorCode) {
    GTEST_SKIP() << "symlinks unavailable: " << errorCode.message();
  }

  ModelRepository repository{_modelsDir};
  fs::path path;

  // act
  StorageResult const result =
      repository.getDirectoryFile(_armId, "meshes/link.stl", path);

  // assert
  EXPECT_EQ(result, StorageResult::forbidden);
}

TEST_F(ModelFileGuardTest, missing_file_is_not_found) {
  ModelRepository repository{_modelsDir};
  fs::path path;

  EXPECT_EQ(repository.getDirectoryFile(_armId, "meshes/elbow.stl", path),
            StorageResult::notFound);
  EXPECT_EQ(repository.getDirectoryFile("0123456789abcdef", "arm.xml", path),
            StorageResult::notFound);
}

TEST_F(ModelFileGuardTest, root_with_trailing_separator_confines_root_model) {
  // arrange
  writeFile(_modelsDir / "a.xml", modelXml);
  ModelRepository repository{_modelsDir.string() + "/"};
  asset_id::AssetId const id = asset_id::idFromString("a.xml");

  // act
  fs::path path;
  StorageResult const siblingResult =
      repository.getDirectoryFile(id, "leg/meshes/foot.stl", path);

  std::vector<ModelDirectoryFile> files;
  StorageResult const listResult = repository.listDirectoryFiles(id, files);

  ModelMetadata model;
  StorageResult const getResult = repository.get(id, model);

  // assert
  EXPECT_EQ(siblingResult, StorageResult::forbidden);
  EXPECT_TRUE(path.empty());

  ASSERT_EQ(listResult, StorageResult::success);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].relativePath, "a.xml");

  ASSERT_EQ(getResult, StorageResult::success);
  EXPECT_FALSE(model.modelName.has_value());
  EXPECT_EQ(model.relativePath, "a.xml");
}

TEST_F(ModelFileGuardTest, unscannable_root_is_io_failure) {
  // arrange
  std::error_code errorCode;
  fs::create_symlink(_modelsDir / "loop", _modelsDir / "loop", errorCode);
  if (errorCode) {
    GTEST_SKIP() << "symlinks unavailable: " << errorCode.message();
  }

  ModelRepository repository{_modelsDir};
  fs::path path;
  ModelMetadata model;
  std::vector<ModelDirectoryFile> files;

  // act & assert
  EXPECT_EQ(repository.locate(_armId, path), StorageResult::ioFailure);
  EXPECT_EQ(repository.get(_armId, model), StorageResult::ioFailure);
  EXPECT_EQ(repository.listDirectoryFiles(_armId, files),
            StorageResult::ioFailure);
  EXPECT_EQ(repository.getDirectoryFile(_armId, "meshes/hand.stl", path),
            StorageResult::ioFailure);
  EXPECT_EQ(repository.remove(_armId), StorageResult::ioFailure);
  EXPECT_TRUE(fs::exists(_modelsDir / "arm" / "arm.xml"));
}
