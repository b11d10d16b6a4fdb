#pragma once

#include <memory>

struct SDL_Window;

namespace motlib::sdl_wrapper {

class SDLGLContext {
public:
  using SDLWindowDeleter = void (*)(SDL_Window*);
  // SDL_GLContext
  using GLContextHandle = void*;

  SDLGLContext(std::unique_ptr<SDL_Window, SDLWindowDeleter> sdlWindow,
               GLContextHandle glContext);
  SDLGLContext(SDLGLContext const& other) = delete;

  ~SDLGLContext();

  SDLGLContext& operator=(SDLGLContext const& other) = delete;

  bool makeCurrent() const;

private:
  std::unique_ptr<SDL_Window, SDLWindowDeleter> _sdlWindowUnique;
  GLContextHandle _glContext;
};

} /*namespace motlib::sdl_wrapper*/
