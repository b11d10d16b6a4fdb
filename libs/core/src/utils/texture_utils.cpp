#include <motlib/core/utils/texture_utils.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <vector>

namespace motlib::core::utils {

std::vector<unsigned char> downsamplePixels(unsigned char const* srcData,
                                            std::size_t channelCnt,
                                            std::size_t w, std::size_t h,
                                            std::size_t reductionFactor,
                                            std::size_t nonLinearChannelCnt) {
  assert(nonLinearChannelCnt <= channelCnt);

  if (!reductionFactor || w % reductionFactor || h % reductionFactor) {
    return {};
  }

  auto const linearizeF = [](float v) {
    // Formula taken from https://en.wikipedia.org/wiki/SRGB
    return v <= 0.04045f ? v / 12.92f : std::pow((v + 0.055f) / 1.055f, 2.4f);
  };

  auto const delinearizeF = [](float v) {
    // Formula taken from https://en.wikipedia.org/wiki/SRGB
    return (v <= 0.04045f / 12.92f) ? v * 12.92f
                                    : std::pow(v, 1 / 2.4f) * 1.055f - 0.055f;
  };

  std::size_t const newW = w / reductionFactor;
  std::size_t const newH = h / reductionFactor;
  float const samplesPerPixel =
      static_cast<float>(reductionFactor * reductionFactor);

  std::vector<unsigned char> result(newW * newH * channelCnt);
  std::vector<float> sumPix(channelCnt);

  for (std::size_t y = 0; y < newH; ++y) {
    for (std::size_t x = 0; x < newW; ++x) {
      std::fill(sumPix.begin(), sumPix.end(), 0.0f);

      for (std::size_t blockY = 0; blockY < reductionFactor; ++blockY) {
        unsigned char const* const srcRow =
            srcData + channelCnt * (w * (reductionFactor * y + blockY) +
                                    reductionFactor * x);

        for (std::size_t blockX = 0; blockX < reductionFactor; ++blockX) {
          unsigned char const* const srcPixData = srcRow + channelCnt * blockX;

          for (std::size_t i = 0; i < nonLinearChannelCnt; ++i) {
            sumPix[i] += linearizeF(srcPixData[i] / 255.0f);
          }

          for (std::size_t i = nonLinearChannelCnt; i < channelCnt; ++i) {
            sumPix[i] += srcPixData[i] / 255.0f;
          }
        }
      }

      unsigned char* const dstPixData =
          result.data() + channelCnt * (y * newW + x);

      for (std::size_t i = 0; i < nonLinearChannelCnt; ++i) {
        float const delinearized =
            delinearizeF(sumPix[i] / samplesPerPixel) * 255.0f;
        dstPixData[i] = static_cast<unsigned char>(
            std::lround(std::clamp(delinearized, 0.0f, 255.0f)));
      }

      for (std::size_t i = nonLinearChannelCnt; i < channelCnt; ++i) {
        dstPixData[i] = static_cast<unsigned char>(
            std::lround(255.0f * sumPix[i] / samplesPerPixel));
      }
    }
  }

  return result;
}

void flipRowsInPlace(unsigned char* data, std::size_t rowSize, std::size_t h) {
  for (std::size_t top = 0, bottom = h ? h - 1 : 0; top < bottom;
       ++top, --bottom) {
    std::swap_ranges(data + top * rowSize, data + (top + 1) * rowSize,
                     data + bottom * rowSize);
  }
}

} // namespace motlib::core::utils
