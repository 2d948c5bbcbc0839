#pragma once

#include <array>
#include <string>

#include "Array.hpp"

// Blends src into dst with its top-left pixel at pos, clipped to dst.
// Samples of src are in [0, srcMax]. The blend factor of a pixel is alpha,
// multiplied by the pixel's own normalized alpha when srcOrder has an 'A'.
// A mono ('M') source feeds R, G and B. With fill, the alpha channel of
// dst is made opaque under the footprint, otherwise it is blended too.
template <typename T>
void overlayImage(RGBArray& dst, const std::array<int, 2>& pos, const Array<T>& src, float srcMax,
                  const std::string& dstOrder, const std::string& srcOrder,
                  float alpha = 1.f, bool fill = false, bool flipy = false);
