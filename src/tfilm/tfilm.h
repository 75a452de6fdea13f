// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_TFILM_H
#define TFILM_TFILM_H

// tfilm.h*

#include <stdint.h>

// From ABSL_ARRAYSIZE
#define TFILM_ARRAYSIZE(array) (sizeof(::tfilm::detail::ArraySizeHelper(array)))

namespace tfilm {
namespace detail {

template <typename T, uint64_t N>
auto ArraySizeHelper(const T (&array)[N]) -> char (&)[N];

}  // namespace detail
}  // namespace tfilm

namespace pstd {

enum class byte : unsigned char {};

inline bool operator==(byte a, byte b) {
    return (unsigned char)a == (unsigned char)b;
}
inline bool operator!=(byte a, byte b) {
    return !(a == b);
}

namespace pmr {
template <typename T>
class polymorphic_allocator;
}

}  // namespace pstd

namespace tfilm {

#ifdef TFILM_FLOAT_AS_DOUBLE
using Float = double;
using FloatBits = uint64_t;
#else
using Float = float;
using FloatBits = uint32_t;
#endif  // TFILM_FLOAT_AS_DOUBLE
static_assert(sizeof(Float) == sizeof(FloatBits),
              "Float and FloatBits must have the same size");

// Global Forward Declarations
template <typename T>
class ArrayND;
class RGB;
class BoxFilter;
class GaussianFilter;
class MitchellFilter;
class LanczosSincFilter;
class TriangleFilter;
class FunctionFilter;
class FilterHandle;
class SeparableFilterCache;
class BlockGeometry;
class TransientBlock;
struct SampleBatch;
class TransientFilm;
class ParameterDictionary;
struct FileLoc;
struct TFilmOptions;
struct LogConfig;

using Allocator = pstd::pmr::polymorphic_allocator<pstd::byte>;

// Block limits
static constexpr int MaxBlockDimensions = 8;
static constexpr int MaxFilterTaps = 256;

void InitTFilm(const TFilmOptions &opt, const LogConfig &logConfig);
void CleanupTFilm();

}  // namespace tfilm

#endif  // TFILM_TFILM_H
