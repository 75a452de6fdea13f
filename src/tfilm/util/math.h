// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_MATH_H
#define TFILM_UTIL_MATH_H

// util/math.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/float.h>

#include <algorithm>
#include <cmath>

namespace tfilm {

// Global Constants
static constexpr Float Pi = 3.14159265358979323846;

template <typename T>
inline constexpr T Sqr(T v) {
    return v * v;
}

template <int n>
inline constexpr Float Pow(Float v) {
    static_assert(n > 0, "Power can't be negative");
    Float n2 = Pow<n / 2>(v);
    return n2 * n2 * Pow<n & 1>(v);
}

template <>
inline constexpr Float Pow<1>(Float v) {
    return v;
}
template <>
inline constexpr Float Pow<0>(Float v) {
    return 1;
}

inline Float Gaussian(Float x, Float mu = 0, Float sigma = 1) {
    return 1 / std::sqrt(2 * Pi * sigma * sigma) *
           std::exp(-Sqr(x - mu) / (2 * sigma * sigma));
}

inline Float Sinc(Float x) {
    // http://www.plunk.org/~hatch/rightway.php
    // The power series expansion of sin(x)/x is 1 - x^2/3! + x^4/5! - ...
    // So if x is small and 1 - x^2/3! rounds to 1, then sin(x)/x will
    // also round to one.
    if (1 + Pow<2>(Pi * x) == 1)
        return 1;
    return std::sin(Pi * x) / (Pi * x);
}

inline Float WindowedSinc(Float x, Float radius, Float tau) {
    if (std::abs(x) > radius)
        return 0;
    return Sinc(x) * Sinc(x / tau);
}

}  // namespace tfilm

#endif  // TFILM_UTIL_MATH_H
