#include <motlib/core/logging.hpp>
#include <motlib/mujoco_backend/mujoco_render_model.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace motlib::mujoco_backend {

MujocoRenderModel::MujocoRenderModel(
    std::unique_ptr<mjModel, ModelDeleter> model,
    std::unique_ptr<mjData, DataDeleter> data, std::uint64_t serial)
    : _model{std::move(model)}, _data{std::move(data)}, _serial{serial} {}

std::size_t MujocoRenderModel::getPoseSize() const {
  return static_cast<std::size_t>(_model->nq);
}

bool MujocoRenderModel::setRestPose() {
  std::copy_n(_model->qpos0, _model->nq, _data->qpos);
  mj_forward(_model.get(), _data.get());

  return true;
}

bool MujocoRenderModel::setPose(std::span<double const> pose) {
  if (pose.size() != getPoseSize()) {
    MOTLIB_LOG_ERR("Pose has " + std::to_string(pose.size()) +
                   " coordinates, model expects " +
                   std::to_string(getPoseSize()));
    return false;
  }

  std::copy(pose.begin(), pose.end(), _data->qpos);
  mj_forward(_model.get(), _data.get());

  return true;
}

mjModel const* MujocoRenderModel::getModel() const { return _model.get(); }

mjData* MujocoRenderModel::getData() const { return _data.get(); }

std::uint64_t MujocoRenderModel::getSerial() const { return _serial; }

std::unique_ptr<MujocoRenderModel> loadMujocoModel(fs::path const& modelPath,
                                                   std::uint64_t serial) {
  ZoneScoped;

  char error[1000] = "";

  std::unique_ptr<mjModel, MujocoRenderModel::ModelDeleter> model{
      mj_loadXML(modelPath.string().c_str(), nullptr, error, sizeof(error)),
      [](mjModel* m) {
        if (m)
          mj_deleteModel(m);
      }};

  if (!model) {
    MOTLIB_LOG_ERR("Failed to load " + modelPath.string() + ": " + error);
    return nullptr;
  }

  std::unique_ptr<mjData, MujocoRenderModel::DataDeleter> data{
      mj_makeData(model.get()), [](mjData* d) {
        if (d)
          mj_deleteData(d);
      }};

  if (!data) {
    MOTLIB_LOG_ERR("Failed to allocate simulation data for " +
                   modelPath.string());
    return nullptr;
  }

  return std::make_unique<MujocoRenderModel>(std::move(model), std::move(data),
                                             serial);
}

} /*namespace motlib::mujoco_backend*/
