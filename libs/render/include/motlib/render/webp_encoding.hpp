#pragma once

#include <motlib/render/image.hpp>

#include <vector>

namespace motlib::render {

struct WebPParams {
  float quality = 85.0f;
  // 0 is fastest, 6 compresses best.
  int method = 6;
};

bool encodeStillWebP(Image const& image, WebPParams const& params,
                     std::vector<char>& outBytes);

// Every frame must have the extent of the first. The animation loops forever.
bool encodeAnimatedWebP(std::vector<Image> const& frames, int frameDurationMs,
                        WebPParams const& params, std::vector<char>& outBytes);

} /*namespace motlib::render*/
