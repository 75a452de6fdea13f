// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_COLOR_H
#define TFILM_UTIL_COLOR_H

// util/color.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/math.h>

#include <cmath>
#include <string>

namespace tfilm {

class RGB {
  public:
    RGB() = default;
    RGB(Float r, Float g, Float b) : r(r), g(g), b(b) {}

    std::string ToString() const;

    Float r = 0, g = 0, b = 0;
};

inline Float LinearToSRGBFull(Float value) {
    if (value <= 0.0031308f)
        return 12.92f * value;
    return 1.055f * std::pow(value, (Float)(1.f / 2.4f)) - 0.055f;
}

}  // namespace tfilm

#endif  // TFILM_UTIL_COLOR_H
