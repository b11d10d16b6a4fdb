#include <motlib/mujoco_backend/mujoco_render_model.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace motlib::mujoco_backend;

namespace {

constexpr char const* pendulumXml = R"(<mujoco model="pendulum">
  <worldbody>
    <body name="pole" pos="0 0 1">
      <joint name="hinge" type="hinge" axis="0 1 0" ref="0.25"/>
      <geom type="capsule" fromto="0 0 0 0 0 -0.5" size="0.05"/>
      <body name="tip" pos="0 0 -0.5">
        <joint name="slide" type="slide" axis="1 0 0"/>
        <geom type="sphere" size="0.08"/>
      </body>
    </body>
  </worldbody>
</mujoco>
)";

} /*namespace*/

class MujocoRenderModelTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    _tempDir =
        fs::temp_directory_path() / ("motlib_mujoco_" + std::to_string(rd()));
    fs::create_directories(_tempDir);
  }

  void TearDown() override { fs::remove_all(_tempDir); }

  fs::path writeModel(std::string const& name, std::string const& xml) {
    fs::path const path = _tempDir / name;
    std::ofstream file{path};
    file << xml;
    return path;
  }

  fs::path _tempDir;
};

TEST_F(MujocoRenderModelTest, pose_size_is_nq) {
  std::unique_ptr<MujocoRenderModel> const model =
      loadMujocoModel(writeModel("pendulum.xml", pendulumXml), 7);

  ASSERT_NE(model, nullptr);
  EXPECT_EQ(model->getPoseSize(), 2u);
  EXPECT_EQ(model->getSerial(), 7u);
}

TEST_F(MujocoRenderModelTest, rest_pose_is_reference_configuration) {
  // arrange
  std::unique_ptr<MujocoRenderModel> const model =
      loadMujocoModel(writeModel("pendulum.xml", pendulumXml), 0);
  ASSERT_NE(model, nullptr);

  std::vector<double> const pose = {1.0, 0.5};
  ASSERT_TRUE(model->setPose(pose));

  // act
  bool const rested = model->setRestPose();

  // assert
  ASSERT_TRUE(rested);
  EXPECT_DOUBLE_EQ(model->getData()->qpos[0], model->getModel()->qpos0[0]);
  EXPECT_DOUBLE_EQ(model->getData()->qpos[1], model->getModel()->qpos0[1]);
}

TEST_F(MujocoRenderModelTest, set_pose_copies_coordinates) {
  std::unique_ptr<MujocoRenderModel> const model =
      loadMujocoModel(writeModel("pendulum.xml", pendulumXml), 0);
  ASSERT_NE(model, nullptr);

  std::vector<double> const pose = {0.3, -0.2};

  ASSERT_TRUE(model->setPose(pose));
  EXPECT_DOUBLE_EQ(model->getData()->qpos[0], 0.3);
  EXPECT_DOUBLE_EQ(model->getData()->qpos[1], -0.2);
}

TEST_F(MujocoRenderModelTest, set_pose_rejects_wrong_width) {
  std::unique_ptr<MujocoRenderModel> const model =
      loadMujocoModel(writeModel("pendulum.xml", pendulumXml), 0);
  ASSERT_NE(model, nullptr);

  std::vector<double> const tooShort = {0.3};
  std::vector<double> const tooLong = {0.3, 0.1, 0.0};

  EXPECT_FALSE(model->setPose(tooShort));
  EXPECT_FALSE(model->setPose(tooLong));
}

TEST_F(MujocoRenderModelTest, malformed_description_fails_to_load) {
  EXPECT_EQ(loadMujocoModel(writeModel("broken.xml", "<mujoco><body"), 0),
            nullptr);
  EXPECT_EQ(loadMujocoModel(_tempDir / "missing.xml", 0), nullptr);
}
