#pragma once

#include <motlib/core/camera_params.hpp>
#include <motlib/render/image.hpp>
#include <motlib/render/render_backend.hpp>
#include <motlib/sdl_wrapper/sdl_gl_context.hpp>

#include <mujoco/mujoco.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace motlib::mujoco_backend {

// Offscreen MuJoCo rasterizer on a hidden SDL OpenGL context. Scene and
// render context are rebuilt whenever a different model is rendered.
class MujocoRenderBackend : public render::IRenderBackend {
public:
  MujocoRenderBackend();
  ~MujocoRenderBackend() override;

  bool init();

  std::unique_ptr<render::IRenderModel>
  loadModel(std::filesystem::path const& modelPath) override;

  bool render(render::IRenderModel& model, core::CameraParams const& camera,
              int width, int height, render::Image& outImage) override;

private:
  bool prepareForModel(mjModel const* model, std::uint64_t serial);
  void releaseScene();

  std::unique_ptr<sdl_wrapper::SDLGLContext> _glContext;
  mjvScene _scene;
  mjrContext _context;
  mjvOption _option;
  std::optional<std::uint64_t> _preparedSerial;
  std::uint64_t _nextSerial = 0;
};

} /*namespace motlib::mujoco_backend*/
