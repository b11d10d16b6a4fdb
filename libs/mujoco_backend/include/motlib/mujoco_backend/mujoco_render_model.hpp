#pragma once

#include <motlib/render/render_backend.hpp>

#include <mujoco/mujoco.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace motlib::mujoco_backend {

class MujocoRenderModel : public render::IRenderModel {
public:
  using ModelDeleter = void (*)(mjModel*);
  using DataDeleter = void (*)(mjData*);

  MujocoRenderModel(std::unique_ptr<mjModel, ModelDeleter> model,
                    std::unique_ptr<mjData, DataDeleter> data,
                    std::uint64_t serial);

  std::size_t getPoseSize() const override;

  // qpos0 followed by forward kinematics.
  bool setRestPose() override;

  bool setPose(std::span<double const> pose) override;

  mjModel const* getModel() const;
  mjData* getData() const;

  // Distinguishes models that happen to be allocated at the same address.
  std::uint64_t getSerial() const;

private:
  std::unique_ptr<mjModel, ModelDeleter> _model;
  std::unique_ptr<mjData, DataDeleter> _data;
  std::uint64_t _serial;
};

// Parses an MJCF file. No OpenGL context is needed. Returns nullptr and logs
// the compiler message on failure.
std::unique_ptr<MujocoRenderModel>
loadMujocoModel(std::filesystem::path const& modelPath, std::uint64_t serial);

} /*namespace motlib::mujoco_backend*/
