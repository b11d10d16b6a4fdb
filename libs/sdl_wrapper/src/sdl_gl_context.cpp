#include <motlib/core/logging.hpp>
#include <motlib/sdl_wrapper/sdl_gl_context.hpp>

#include <SDL2/SDL.h>
#include <SDL2/SDL_video.h>

#include <string>
#include <utility>

using namespace motlib;
using namespace motlib::sdl_wrapper;

SDLGLContext::SDLGLContext(
    std::unique_ptr<SDL_Window, SDLWindowDeleter> sdlWindow,
    GLContextHandle glContext)
    : _sdlWindowUnique{std::move(sdlWindow)}, _glContext{glContext} {}

SDLGLContext::~SDLGLContext() {
  // The context has to go before the window it was created on.
  if (_glContext) {
    SDL_GL_DeleteContext(_glContext);
  }
}

bool SDLGLContext::makeCurrent() const {
  if (SDL_GL_MakeCurrent(_sdlWindowUnique.get(), _glContext) != 0) {
    MOTLIB_LOG_ERR(std::string("Failed to make OpenGL context current: ") +
                   SDL_GetError());
    return false;
  }

  return true;
}
