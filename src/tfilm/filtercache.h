// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_FILTERCACHE_H
#define TFILM_FILTERCACHE_H

// filtercache.h*
#include <tfilm/tfilm.h>

#include <tfilm/base/filter.h>
#include <tfilm/util/check.h>
#include <tfilm/util/pstd.h>

#include <absl/types/span.h>

#include <cstdint>
#include <string>

namespace tfilm {

// SeparableFilterCache records, for each axis of a block, how many cells a
// sample's filter reaches and where that axis's weights live in a flat
// per-sample weight table of TotalTaps() entries. The table itself is
// owned by the caller so that concurrent puts never share it.
class SeparableFilterCache {
  public:
    // SeparableFilterCache Public Methods
    SeparableFilterCache() = default;

    void Configure(absl::Span<const FilterHandle> filters, bool normalize,
                   const FileLoc *loc = nullptr);

    int NumAxes() const { return nAxes; }
    FilterHandle Filter(int axis) const {
        DCHECK(axis >= 0 && axis < nAxes);
        return filters[axis];
    }
    int TapCount(int axis) const {
        DCHECK(axis >= 0 && axis < nAxes);
        return taps[axis];
    }
    int TapOffset(int axis) const {
        DCHECK(axis >= 0 && axis < nAxes);
        return offsets[axis];
    }
    int TotalTaps() const { return totalTaps; }
    bool IsNarrowBox(int axis) const {
        DCHECK(axis >= 0 && axis < nAxes);
        return narrowBox[axis] != 0;
    }
    bool AllNarrowBox() const { return allNarrowBox; }
    bool Normalize() const { return normalize; }

    // Returns the number of cells along _axis_ that the filter centered at
    // buffer-local coordinate _coord_ reaches; the first is stored in *lo.
    int Support(int axis, Float coord, int *lo) const;

    // Writes the filter response for the cells starting at _base_ cells
    // from the sample, one per entry of _weights_.
    void EvaluateAxis(int axis, Float base, absl::Span<Float> weights) const;

    static void NormalizeWeights(absl::Span<Float> weights);

    std::string ToString() const;

  private:
    // SeparableFilterCache Private Data
    int nAxes = 0;
    pstd::array<FilterHandle, MaxBlockDimensions> filters;
    pstd::array<int, MaxBlockDimensions> taps, offsets;
    pstd::array<uint8_t, MaxBlockDimensions> narrowBox;
    int totalTaps = 0;
    bool allNarrowBox = false;
    bool normalize = false;
};

}  // namespace tfilm

#endif  // TFILM_FILTERCACHE_H
