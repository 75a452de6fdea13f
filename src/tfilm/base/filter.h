// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#ifndef TFILM_BASE_FILTER_H
#define TFILM_BASE_FILTER_H

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#include <tfilm/tfilm.h>

#include <tfilm/util/float.h>
#include <tfilm/util/taggedptr.h>

#include <string>

namespace tfilm {

// Kernel support is shrunk by this much before tap counts and borders are
// computed so that a radius that is an exact half-integer doesn't pick up
// an extra cell due to round-off.
static constexpr Float FilterEpsilon = 1500 * MachineEpsilon;

// Filter Declarations
class FilterHandle
    : public TaggedPointer<BoxFilter, GaussianFilter, MitchellFilter, LanczosSincFilter,
                           TriangleFilter, FunctionFilter> {
  public:
    using TaggedPointer::TaggedPointer;

    static FilterHandle Create(const std::string &name,
                               const ParameterDictionary &parameters, const FileLoc *loc,
                               Allocator alloc);

    inline Float Evaluate(Float x) const;

    inline Float Radius() const;

    // Number of cells a sample can reach along one axis.
    int TapCount() const;
    // Number of cells the kernel reaches past the edge of the image.
    int BorderSize() const;
    bool IsBox() const { return Is<BoxFilter>(); }
    // A box of radius at most half a cell always lands in exactly one cell.
    bool IsNarrowBox() const { return IsBox() && Radius() <= 0.5f + FilterEpsilon; }

    std::string ToString() const;
};

}  // namespace tfilm

#endif  // TFILM_BASE_FILTER_H
