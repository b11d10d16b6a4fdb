#include <motlib/core/logging.hpp>
#include <motlib/sdl_wrapper/sdl_backend.hpp>
#include <motlib/sdl_wrapper/sdl_gl_context.hpp>

#include <SDL2/SDL.h>
#include <SDL2/SDL_video.h>

#include <memory>
#include <string>

using namespace motlib;
using namespace motlib::sdl_wrapper;

SDLBackend& SDLBackend::instance() {
  static SDLBackend instance;

  if (!instance._initialized) {
    instance.init();
  }

  return instance;
}

SDLBackend::~SDLBackend() {
  if (_initialized) {
    SDL_Quit();
  }
}

bool SDLBackend::init() {
  if (SDL_Init(SDL_INIT_VIDEO) != 0) {
    MOTLIB_LOG_ERR(std::string("SDL initialization failed: ") +
                   SDL_GetError());
    return false;
  }

  _initialized = true;

  return true;
}

bool SDLBackend::isInitialized() const { return _initialized; }

std::unique_ptr<SDLGLContext>
SDLBackend::createOffscreenContext(int width, int height) const {
  if (!_initialized) {
    MOTLIB_LOG_ERR("SDL is not initialized.");
    return nullptr;
  }

  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
  SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
  SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

  SDL_WindowFlags const flags =
      static_cast<SDL_WindowFlags>(SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN);

  using UniquePtr =
      std::unique_ptr<SDL_Window, SDLGLContext::SDLWindowDeleter>;
  UniquePtr sdlWindowUnique =
      UniquePtr(SDL_CreateWindow("motlib offscreen", SDL_WINDOWPOS_UNDEFINED,
                                 SDL_WINDOWPOS_UNDEFINED, width, height, flags),
                [](SDL_Window* w) {
                  if (w)
                    SDL_DestroyWindow(w);
                });

  if (!sdlWindowUnique) {
    MOTLIB_LOG_ERR(std::string("Failed to create SDL window: ") +
                   SDL_GetError());
    return nullptr;
  }

  SDL_GLContext const glContext = SDL_GL_CreateContext(sdlWindowUnique.get());

  if (!glContext) {
    MOTLIB_LOG_ERR(std::string("Failed to create OpenGL context: ") +
                   SDL_GetError());
    return nullptr;
  }

  auto context =
      std::make_unique<SDLGLContext>(std::move(sdlWindowUnique), glContext);

  if (!context->makeCurrent()) {
    return nullptr;
  }

  return context;
}
