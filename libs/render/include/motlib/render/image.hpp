#pragma once

#include <cstddef>
#include <vector>

namespace motlib::render {

// 8-bit RGB, rows top to bottom, tightly packed.
struct Image {
  static constexpr std::size_t channelCount = 3;

  int width = 0;
  int height = 0;
  std::vector<unsigned char> pixels;

  std::size_t rowSize() const { return width * channelCount; }
};

} /*namespace motlib::render*/
