#pragma once

#include <motlib/sdl_wrapper/sdl_gl_context.hpp>

#include <memory>

namespace motlib::sdl_wrapper {

class SDLBackend {
public:
  static SDLBackend& instance();

  ~SDLBackend();

  bool init();
  bool isInitialized() const;

  // Hidden window with a current OpenGL context. The window is never shown,
  // it only anchors the context used for offscreen rendering. Returns nullptr
  // on failure.
  std::unique_ptr<SDLGLContext> createOffscreenContext(int width,
                                                       int height) const;

private:
  SDLBackend() = default;

  bool _initialized = false;
};

} /*namespace motlib::sdl_wrapper*/
