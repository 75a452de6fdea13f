// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_FLOAT_H
#define TFILM_UTIL_FLOAT_H

// util/float.h*
#include <tfilm/tfilm.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

namespace tfilm {

static constexpr Float Infinity = std::numeric_limits<Float>::infinity();
static constexpr Float MachineEpsilon = std::numeric_limits<Float>::epsilon() * 0.5;

inline uint64_t FloatToBits(double f) {
    uint64_t ui;
    std::memcpy(&ui, &f, sizeof(double));
    return ui;
}

inline double BitsToFloat(uint64_t ui) {
    double f;
    std::memcpy(&f, &ui, sizeof(uint64_t));
    return f;
}

template <typename T>
inline typename std::enable_if_t<std::is_floating_point<T>::value, bool> IsNaN(T v) {
    return std::isnan(v);
}

template <typename T>
inline typename std::enable_if_t<std::is_floating_point<T>::value, bool> IsInf(T v) {
    return std::isinf(v);
}

}  // namespace tfilm

#endif  // TFILM_UTIL_FLOAT_H
