#include <motlib/core/logging.hpp>
#include <motlib/core/utils/texture_utils.hpp>
#include <motlib/mujoco_backend/mujoco_render_backend.hpp>
#include <motlib/mujoco_backend/mujoco_render_model.hpp>
#include <motlib/sdl_wrapper/sdl_backend.hpp>

#include <tracy/Tracy.hpp>

namespace fs = std::filesystem;

namespace motlib::mujoco_backend {

namespace {

constexpr int maxSceneGeoms = 10000;
// Initial extent of the hidden window, the offscreen buffer is resized per
// render request.
constexpr int contextWindowSize = 64;

} /*namespace*/

MujocoRenderBackend::MujocoRenderBackend() {
  mjv_defaultScene(&_scene);
  mjr_defaultContext(&_context);
  mjv_defaultOption(&_option);
}

MujocoRenderBackend::~MujocoRenderBackend() { releaseScene(); }

bool MujocoRenderBackend::init() {
  sdl_wrapper::SDLBackend& sdlBackend = sdl_wrapper::SDLBackend::instance();

  if (!sdlBackend.isInitialized()) {
    return false;
  }

  _glContext = sdlBackend.createOffscreenContext(contextWindowSize,
                                                 contextWindowSize);

  return _glContext != nullptr;
}

std::unique_ptr<render::IRenderModel>
MujocoRenderBackend::loadModel(fs::path const& modelPath) {
  return loadMujocoModel(modelPath, _nextSerial++);
}

bool MujocoRenderBackend::render(render::IRenderModel& model,
                                 core::CameraParams const& camera, int width,
                                 int height, render::Image& outImage) {
  ZoneScoped;

  if (!_glContext) {
    MOTLIB_LOG_ERR("Render backend has no OpenGL context.");
    return false;
  }

  MujocoRenderModel* const mujocoModel =
      dynamic_cast<MujocoRenderModel*>(&model);

  if (!mujocoModel) {
    MOTLIB_LOG_ERR("Model was not loaded by the MuJoCo backend.");
    return false;
  }

  mjModel const* const m = mujocoModel->getModel();

  if (!prepareForModel(m, mujocoModel->getSerial())) {
    return false;
  }

  if (_context.offWidth < width || _context.offHeight < height) {
    mjr_resizeOffscreen(width, height, &_context);
  }

  mjr_setBuffer(mjFB_OFFSCREEN, &_context);

  if (_context.currentBuffer != mjFB_OFFSCREEN) {
    MOTLIB_LOG_ERR("Offscreen framebuffer is not supported.");
    return false;
  }

  mjvCamera mjCamera;
  mjv_defaultFreeCamera(m, &mjCamera);
  mjCamera.distance = camera.distance;
  mjCamera.azimuth = camera.azimuthDeg;
  mjCamera.elevation = camera.elevationDeg;
  mjCamera.lookat[0] = camera.lookAt.x;
  mjCamera.lookat[1] = camera.lookAt.y;
  mjCamera.lookat[2] = camera.lookAt.z;

  mjv_updateScene(m, mujocoModel->getData(), &_option, nullptr, &mjCamera,
                  mjCAT_ALL, &_scene);

  mjrRect const viewport = {0, 0, width, height};
  mjr_render(viewport, &_scene, &_context);

  outImage.width = width;
  outImage.height = height;
  outImage.pixels.resize(outImage.rowSize() * height);
  mjr_readPixels(outImage.pixels.data(), nullptr, viewport, &_context);

  core::utils::flipRowsInPlace(outImage.pixels.data(), outImage.rowSize(),
                               height);

  return true;
}

bool MujocoRenderBackend::prepareForModel(mjModel const* model,
                                          std::uint64_t serial) {
  if (_preparedSerial == serial) {
    return true;
  }

  ZoneScopedN("Build render context");

  releaseScene();

  mjv_makeScene(model, &_scene, maxSceneGeoms);
  mjr_makeContext(model, &_context, mjFONTSCALE_100);

  if (!_context.offFBO) {
    MOTLIB_LOG_ERR("Failed to create the offscreen render context.");
    mjv_freeScene(&_scene);
    mjr_freeContext(&_context);
    return false;
  }

  _preparedSerial = serial;

  return true;
}

void MujocoRenderBackend::releaseScene() {
  if (_preparedSerial) {
    mjv_freeScene(&_scene);
    mjr_freeContext(&_context);
    _preparedSerial.reset();
  }
}

} /*namespace motlib::mujoco_backend*/
