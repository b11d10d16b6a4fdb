#pragma once

#include <cstddef>
#include <vector>

namespace motlib::render {

// sampleCount indices evenly spaced over [0, frameCount - 1], truncated
// towards zero, first and last included. Asking for at least as many samples
// as there are frames returns every frame once.
std::vector<std::size_t> sampleFrameIndices(std::size_t frameCount,
                                            std::size_t sampleCount);

} /*namespace motlib::render*/
