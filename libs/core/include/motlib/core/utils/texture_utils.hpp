#pragma once

#include <cstddef>
#include <vector>

namespace motlib::core::utils {

// Box-filters an 8-bit interleaved image down by reductionFactor along both
// axes. The first nonLinearChannelCnt channels are treated as sRGB encoded and
// averaged in linear light. w and h must be multiples of reductionFactor,
// otherwise an empty buffer is returned.
std::vector<unsigned char> downsamplePixels(unsigned char const* srcData,
                                            std::size_t channelCnt,
                                            std::size_t w, std::size_t h,
                                            std::size_t reductionFactor,
                                            std::size_t nonLinearChannelCnt);

// OpenGL read-backs are bottom-up, image encoders expect top-down rows.
void flipRowsInPlace(unsigned char* data, std::size_t rowSize, std::size_t h);

} // namespace motlib::core::utils
