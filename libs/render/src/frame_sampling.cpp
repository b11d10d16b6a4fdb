#include <motlib/render/frame_sampling.hpp>

#include <numeric>

namespace motlib::render {

std::vector<std::size_t> sampleFrameIndices(std::size_t frameCount,
                                            std::size_t sampleCount) {
  if (!frameCount || !sampleCount) {
    return {};
  }

  if (sampleCount >= frameCount) {
    std::vector<std::size_t> indices(frameCount);
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    return indices;
  }

  if (sampleCount == 1) {
    return {0};
  }

  std::vector<std::size_t> indices(sampleCount);
  double const step = static_cast<double>(frameCount - 1) /
                      static_cast<double>(sampleCount - 1);

  for (std::size_t i = 0; i < sampleCount; ++i) {
    indices[i] = static_cast<std::size_t>(static_cast<double>(i) * step);
  }

  // Rounding in step must not lose the final frame.
  indices.back() = frameCount - 1;

  return indices;
}

} /*namespace motlib::render*/
