#pragma once

#include <string>
#include <vector>

#include "Array.hpp"

struct Image;

#define DEFAULT_INTERPOLATION ("basic")

const std::vector<std::string>& getInterpolationMethods();
bool isInterpolationMethod(const std::string& name);

// Unknown names resolve to DEFAULT_INTERPOLATION.
std::string resolveInterpolation(const std::string& name);

// Resamples the half-open source rectangle [x1,x2) x [y1,y2) of img by (sx, sy).
// The result has round((x2-x1)*sx) x round((y2-y1)*sy) pixels, and is empty
// when either size rounds to zero.
FloatArray resample(const Image& img, int x1, int y1, int x2, int y2,
                    float sx, float sy, const std::string& method);
