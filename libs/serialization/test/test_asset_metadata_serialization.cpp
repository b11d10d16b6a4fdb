#include <motlib/serialization/asset_metadata_serialization.hpp>
#include <motlib/serialization/serialization.hpp>

#include <glm/vec3.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

using namespace motlib;
using namespace motlib::serialization;

TEST(serialization, trajectory_fields_use_null_for_unknowns) {
  // arrange
  storage::TrajectoryMetadata trajectory;
  trajectory.id = "8dd65a9be6716014";
  trajectory.filename = "walk.npy";
  trajectory.category = "locomotion";
  trajectory.relativePath = "locomotion/walk.npy";
  trajectory.fileSize = 11648;
  trajectory.modifiedTime = fs::file_time_type::clock::now();
  trajectory.frameCount = 120;
  trajectory.numJoints = 12;

  // act
  nlohmann::json json;
  bool const serialized = serializeTrajectory(trajectory, json);

  // assert
  ASSERT_TRUE(serialized);
  EXPECT_EQ(json["id"], "8dd65a9be6716014");
  EXPECT_EQ(json["category"], "locomotion");
  EXPECT_EQ(json["frame_count"], 120);
  EXPECT_EQ(json["num_joints"], 12);
  EXPECT_TRUE(json["frame_rate"].is_null());
  EXPECT_TRUE(json["thumbnail_path"].is_null());
  EXPECT_EQ(json["file_size"], 11648);
}

TEST(serialization, model_list_carries_total) {
  // arrange
  storage::ModelMetadata model;
  model.id = "a38ce9076c8205a1";
  model.filename = "MS-Human-700-MJX.xml";
  model.modelName = "MS-Human-700";
  model.relativePath = "MS-Human-700/MS-Human-700-MJX.xml";
  model.thumbnailPath = "models/MS-Human-700/a38ce9076c8205a1.webp";

  // act
  nlohmann::json json;
  ASSERT_TRUE(serializeModelList({model, model}, json));

  // assert
  EXPECT_EQ(json["total"], 2);
  ASSERT_EQ(json["models"].size(), 2u);
  EXPECT_EQ(json["models"][0]["model_name"], "MS-Human-700");
  EXPECT_EQ(json["models"][0]["thumbnail_path"],
            "models/MS-Human-700/a38ce9076c8205a1.webp");
}

TEST(serialization, empty_list_is_an_empty_array) {
  nlohmann::json json;
  ASSERT_TRUE(serializeTrajectoryList({}, json));

  EXPECT_TRUE(json["trajectories"].is_array());
  EXPECT_TRUE(json["trajectories"].empty());
  EXPECT_EQ(json["total"], 0);
}

TEST(serialization, timestamp_is_iso_utc) {
  std::string const timestamp =
      toIsoTimestamp(fs::file_time_type::clock::now());

  EXPECT_TRUE(std::regex_match(
      timestamp, std::regex{R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)"}));
}

TEST(serialization, timestamp_converts_file_time_exactly) {
  // arrange
  auto const systemTime =
      std::chrono::system_clock::from_time_t(1704164645) +
      std::chrono::milliseconds{999};
  fs::file_time_type const fileTime =
      fs::file_time_type::clock::from_sys(systemTime);

  // act
  std::string const first = toIsoTimestamp(fileTime);
  std::string const second = toIsoTimestamp(fileTime);

  // assert
  EXPECT_EQ(first, "2024-01-02T03:04:05Z");
  EXPECT_EQ(second, first);
}

TEST(serialization, timestamp_preserves_ordering) {
  auto const now = fs::file_time_type::clock::now();

  EXPECT_LT(toIsoTimestamp(now - std::chrono::hours{30}), toIsoTimestamp(now));
}

TEST(serialization, media_types_follow_extension) {
  EXPECT_STREQ(mediaTypeForPath("a/b.webp"), "image/webp");
  EXPECT_STREQ(mediaTypeForPath("b.png"), "image/png");
  EXPECT_STREQ(mediaTypeForPath("b.jpg"), "image/jpeg");
  EXPECT_STREQ(mediaTypeForPath("b.gif"), "image/gif");
  EXPECT_STREQ(mediaTypeForPath("model.xml"), "application/xml");
  EXPECT_STREQ(mediaTypeForPath("meshes/femur.stl"), "model/stl");
  EXPECT_STREQ(mediaTypeForPath("meshes/femur.obj"), "model/mesh");
  EXPECT_STREQ(mediaTypeForPath("textures/skin.ktx"),
               "application/octet-stream");
}

TEST(serialization, vector_round_trips_through_json_array) {
  // arrange
  glm::vec3 const lookAt = {0.5f, -1.0f, 2.0f};

  // act
  nlohmann::json json = vecToArray(lookAt);
  glm::vec3 restored;
  arrayToVector(json, restored);

  // assert
  EXPECT_EQ(restored, lookAt);
}

TEST(serialization, short_array_throws) {
  nlohmann::json const json = {1.0f, 2.0f};
  glm::vec3 restored;

  EXPECT_THROW(arrayToVector(json, restored), nlohmann::json::exception);
}
