#include <motlib/array_io/array_io.hpp>
#include <motlib/asset_id/asset_id.hpp>
#include <motlib/storage/trajectory_repository.hpp>

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

array_io::NumericArray makePoses(std::size_t frames, std::size_t joints) {
  array_io::NumericArray poses;
  poses.shape = {frames, joints};
  poses.values.resize(frames * joints);
  for (std::size_t i = 0; i < poses.values.size(); ++i) {
    poses.values[i] = 0.01 * static_cast<double>(i);
  }
  return poses;
}

std::vector<char> encodePoses(array_io::NumericArray const& poses) {
  std::vector<char> bytes;
  array_io::encodeArray(poses, bytes);
  return bytes;
}

// An .npy header announcing shape with only a few payload bytes behind it.
void writeOversizedNpy(fs::path const& path, std::string const& shape) {
  std::string dict =
      "{'descr': '<f8', 'fortran_order': False, 'shape': " + shape + ", }";
  std::size_t const unpadded = 10 + dict.size() + 1;
  dict.append((64 - unpadded % 64) % 64, ' ');
  dict.push_back('\n');

  std::string bytes{"\x93NUMPY\x01\x00", 8};
  bytes.push_back(static_cast<char>(dict.size() & 0xff));
  bytes.push_back(static_cast<char>(dict.size() >> 8));
  bytes += dict;
  bytes.append(64, '\0');

  fs::create_directories(path.parent_path());
  std::ofstream{path, std::ios_base::binary} << bytes;
}

} /*namespace*/

class TrajectoryRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    _tempDir = fs::temp_directory_path() /
               ("motlib_trajectories_" + std::to_string(rd()));
    _trajectoriesDir = _tempDir / "trajectories";
    fs::create_directories(_trajectoriesDir);
  }

  void TearDown() override { fs::remove_all(_tempDir); }

  fs::path _tempDir;
  fs::path _trajectoriesDir;
};

TEST_F(TrajectoryRepositoryTest, saved_walk_lists_with_derived_shape) {
  // arrange
  TrajectoryRepository repository{_trajectoriesDir};
  std::vector<char> const content = encodePoses(makePoses(120, 12));

  // act
  TrajectoryMetadata saved;
  StorageResult const saveResult = repository.save(
      "walk.npy", content, std::string{"locomotion"}, saved);

  std::vector<TrajectoryMetadata> trajectories;
  StorageResult const listResult = repository.list(std::nullopt, trajectories);

  // assert
  ASSERT_EQ(saveResult, StorageResult::success);
  ASSERT_EQ(listResult, StorageResult::success);
  ASSERT_EQ(trajectories.size(), 1u);

  TrajectoryMetadata const& walk = trajectories.front();
  EXPECT_EQ(walk.id, "8dd65a9be6716014");
  EXPECT_EQ(walk.filename, "walk.npy");
  EXPECT_EQ(walk.category, "locomotion");
  EXPECT_EQ(walk.frameCount, 120u);
  EXPECT_EQ(walk.numJoints, 12u);
  EXPECT_FALSE(walk.frameRate.has_value());
  EXPECT_EQ(walk.fileSize, content.size());
  EXPECT_EQ(saved.id, walk.id);
}

TEST_F(TrajectoryRepositoryTest, root_level_file_has_no_category) {
  TrajectoryRepository repository{_trajectoriesDir};

  TrajectoryMetadata saved;
  ASSERT_EQ(repository.save("walk.npy", encodePoses(makePoses(5, 3)),
                            std::nullopt, saved),
            StorageResult::success);

  EXPECT_EQ(saved.id, "05ca7a0c324f796c");
  EXPECT_FALSE(saved.category.has_value());
}

TEST_F(TrajectoryRepositoryTest, one_dimensional_sequence_has_no_joint_count) {
  // arrange
  array_io::NumericArray poses;
  poses.shape = {50};
  poses.values.assign(50, 1.0);
  ASSERT_TRUE(array_io::saveArrayToFile(_trajectoriesDir / "line.npy", poses));

  TrajectoryRepository repository{_trajectoriesDir};

  // act
  TrajectoryMetadata trajectory;
  StorageResult const result =
      repository.get(asset_id::idFromString("line.npy"), trajectory);

  // assert
  ASSERT_EQ(result, StorageResult::success);
  EXPECT_EQ(trajectory.frameCount, 50u);
  EXPECT_FALSE(trajectory.numJoints.has_value());
}

TEST_F(TrajectoryRepositoryTest, bundle_reads_fallback_fields) {
  // arrange
  array_io::ArrayBundle bundle;
  bundle.arrays["qpos_traj"] = makePoses(30, 7);
  array_io::NumericArray& frameRate = bundle.arrays["framerate"];
  frameRate.shape = {};
  frameRate.values = {50.0};

  ASSERT_TRUE(array_io::saveArrayBundleToFile(
      _trajectoriesDir / "dance" / "spin.npz", bundle));

  TrajectoryRepository repository{_trajectoriesDir};

  // act
  std::vector<TrajectoryMetadata> trajectories;
  ASSERT_EQ(repository.list(std::string{"dance"}, trajectories),
            StorageResult::success);

  // assert
  ASSERT_EQ(trajectories.size(), 1u);
  EXPECT_EQ(trajectories[0].frameCount, 30u);
  EXPECT_EQ(trajectories[0].numJoints, 7u);
  ASSERT_TRUE(trajectories[0].frameRate.has_value());
  EXPECT_DOUBLE_EQ(*trajectories[0].frameRate, 50.0);
}

TEST_F(TrajectoryRepositoryTest, bundle_without_poses_keeps_frame_rate) {
  array_io::ArrayBundle bundle;
  array_io::NumericArray& frameRate = bundle.arrays["frame_rate"];
  frameRate.shape = {};
  frameRate.values = {30.0};
  ASSERT_TRUE(
      array_io::saveArrayBundleToFile(_trajectoriesDir / "empty.npz", bundle));

  TrajectoryRepository repository{_trajectoriesDir};
  TrajectoryMetadata trajectory;
  ASSERT_EQ(repository.get(asset_id::idFromString("empty.npz"), trajectory),
            StorageResult::success);

  EXPECT_FALSE(trajectory.frameCount.has_value());
  EXPECT_FALSE(trajectory.numJoints.has_value());
  EXPECT_EQ(trajectory.frameRate, 30.0);
}

TEST_F(TrajectoryRepositoryTest, corrupt_payload_still_lists) {
  // arrange
  std::ofstream{_trajectoriesDir / "broken.npy", std::ios_base::binary}
      << "definitely not numpy";

  TrajectoryRepository repository{_trajectoriesDir};

  // act
  std::vector<TrajectoryMetadata> trajectories;
  StorageResult const result = repository.list(std::nullopt, trajectories);

  // assert
  ASSERT_EQ(result, StorageResult::success);
  ASSERT_EQ(trajectories.size(), 1u);
  EXPECT_EQ(trajectories[0].filename, "broken.npy");
  EXPECT_FALSE(trajectories[0].frameCount.has_value());
  EXPECT_FALSE(trajectories[0].frameRate.has_value());
  EXPECT_FALSE(trajectories[0].numJoints.has_value());
}

TEST_F(TrajectoryRepositoryTest, oversized_shape_still_lists) {
  // arrange
  writeOversizedNpy(_trajectoriesDir / "huge.npy", "(2305843009213693952,)");
  writeOversizedNpy(_trajectoriesDir / "wide.npy",
                    "(2305843009213693952, 8)");

  TrajectoryRepository repository{_trajectoriesDir};

  // act
  std::vector<TrajectoryMetadata> trajectories;
  StorageResult const result = repository.list(std::nullopt, trajectories);

  // assert
  ASSERT_EQ(result, StorageResult::success);
  ASSERT_EQ(trajectories.size(), 2u);
  for (TrajectoryMetadata const& trajectory : trajectories) {
    EXPECT_FALSE(trajectory.frameCount.has_value());
    EXPECT_FALSE(trajectory.numJoints.has_value());
  }
}

TEST_F(TrajectoryRepositoryTest, filters_by_category_and_orders_by_mtime) {
  // arrange
  TrajectoryRepository repository{_trajectoriesDir};
  std::vector<char> const content = encodePoses(makePoses(4, 2));
  TrajectoryMetadata saved;

  ASSERT_EQ(repository.save("a.npy", content, std::string{"run"}, saved),
            StorageResult::success);
  ASSERT_EQ(repository.save("b.npy", content, std::string{"run"}, saved),
            StorageResult::success);
  ASSERT_EQ(repository.save("c.npy", content, std::string{"jump"}, saved),
            StorageResult::success);
  ASSERT_EQ(repository.save("d.npy", content, std::nullopt, saved),
            StorageResult::success);

  auto const now = fs::file_time_type::clock::now();
  fs::last_write_time(_trajectoriesDir / "run" / "a.npy", now);
  fs::last_write_time(_trajectoriesDir / "run" / "b.npy",
                      now - std::chrono::minutes{10});

  // act
  std::vector<TrajectoryMetadata> run;
  ASSERT_EQ(repository.list(std::string{"run"}, run), StorageResult::success);
  std::vector<TrajectoryMetadata> all;
  ASSERT_EQ(repository.list(std::string{}, all), StorageResult::success);

  // assert
  ASSERT_EQ(run.size(), 2u);
  EXPECT_EQ(run[0].filename, "a.npy");
  EXPECT_EQ(run[1].filename, "b.npy");
  EXPECT_EQ(all.size(), 4u);
}

TEST_F(TrajectoryRepositoryTest, delete_makes_id_unresolvable) {
  // arrange
  TrajectoryRepository repository{_trajectoriesDir};
  TrajectoryMetadata saved;
  ASSERT_EQ(repository.save("walk.npy", encodePoses(makePoses(3, 3)),
                            std::string{"locomotion"}, saved),
            StorageResult::success);

  // act
  StorageResult const removeResult = repository.remove(saved.id);

  // assert
  EXPECT_EQ(removeResult, StorageResult::success);
  EXPECT_FALSE(repository.find(saved.id).has_value());
  TrajectoryMetadata afterRemove;
  EXPECT_EQ(repository.get(saved.id, afterRemove), StorageResult::notFound);
  EXPECT_EQ(repository.remove(saved.id), StorageResult::notFound);
}

TEST_F(TrajectoryRepositoryTest, save_rejects_wrong_kind_and_bad_category) {
  TrajectoryRepository repository{_trajectoriesDir};
  std::vector<char> const content = encodePoses(makePoses(3, 3));
  TrajectoryMetadata saved;

  EXPECT_EQ(repository.save("walk.csv", content, std::nullopt, saved),
            StorageResult::invalidInput);
  EXPECT_EQ(repository.save("walk.npy", content, std::string{"../up"}, saved),
            StorageResult::invalidInput);
  EXPECT_EQ(repository.save("", content, std::nullopt, saved),
            StorageResult::invalidInput);

  std::vector<TrajectoryMetadata> trajectories;
  ASSERT_EQ(repository.list(std::nullopt, trajectories),
            StorageResult::success);
  EXPECT_TRUE(trajectories.empty());
}

TEST_F(TrajectoryRepositoryTest, unscannable_root_is_io_failure) {
  // arrange
  TrajectoryRepository repository{_trajectoriesDir};
  TrajectoryMetadata saved;
  ASSERT_EQ(repository.save("walk.npy", encodePoses(makePoses(4, 2)),
                            std::nullopt, saved),
            StorageResult::success);

  std::error_code errorCode;
  fs::create_symlink(_trajectoriesDir / "loop.npy",
                     _trajectoriesDir / "loop.npy", errorCode);
  if (errorCode) {
    GTEST_SKIP() << "symlinks unavailable: " << errorCode.message();
  }

  // act & assert
  TrajectoryMetadata trajectory;
  EXPECT_EQ(repository.get(saved.id, trajectory), StorageResult::ioFailure);
  EXPECT_EQ(repository.remove(saved.id), StorageResult::ioFailure);
  EXPECT_EQ(repository.get("0123456789abcdef", trajectory),
            StorageResult::ioFailure);
}
