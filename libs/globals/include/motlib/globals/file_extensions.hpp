#pragma once

#include <array>

namespace motlib::globals {

constexpr char const* modelDescriptionExt = ".xml";
constexpr char const* arrayFileExt = ".npy";
constexpr char const* arrayBundleFileExt = ".npz";

constexpr char const* webpExt = ".webp";
constexpr char const* pngExt = ".png";
constexpr char const* jpgExt = ".jpg";
constexpr char const* gifExt = ".gif";

// Read-side lookup order, first match wins.
constexpr std::array<char const*, 4> thumbnailExtPriority = {webpExt, pngExt,
                                                             jpgExt, gifExt};

// Extension the thumbnail generator writes.
constexpr char const* thumbnailWriteExt = webpExt;

} /*namespace motlib::globals*/
