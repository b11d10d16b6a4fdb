#pragma once

#include <motlib/core/camera_params.hpp>
#include <motlib/render/image.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>

namespace motlib::render {

// A loaded articulated model with its simulation state.
class IRenderModel {
public:
  IRenderModel() = default;
  IRenderModel(IRenderModel const& other) = delete;

  virtual ~IRenderModel() = default;

  IRenderModel& operator=(IRenderModel const& other) = delete;

  // Number of generalized coordinates a pose vector must carry.
  virtual std::size_t getPoseSize() const = 0;

  virtual bool setRestPose() = 0;

  virtual bool setPose(std::span<double const> pose) = 0;
};

// Offscreen rasterizer. Implementations need not be reentrant, the generator
// renders one frame at a time.
class IRenderBackend {
public:
  IRenderBackend() = default;
  IRenderBackend(IRenderBackend const& other) = delete;

  virtual ~IRenderBackend() = default;

  IRenderBackend& operator=(IRenderBackend const& other) = delete;

  // Returns nullptr if the model description cannot be loaded.
  virtual std::unique_ptr<IRenderModel>
  loadModel(std::filesystem::path const& modelPath) = 0;

  virtual bool render(IRenderModel& model, core::CameraParams const& camera,
                      int width, int height, Image& outImage) = 0;
};

} /*namespace motlib::render*/
