#pragma once

#include <glm/vec3.hpp>

namespace motlib::core {

// Orbit camera around lookAt. Angles are in degrees, elevation below the
// horizon is negative.
struct CameraParams {
  float distance = 3.0f;
  float azimuthDeg = 45.0f;
  float elevationDeg = -20.0f;
  glm::vec3 lookAt = {0.0f, 0.0f, 1.0f};
};

} /*namespace motlib::core*/
