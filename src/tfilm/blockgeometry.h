// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_BLOCKGEOMETRY_H
#define TFILM_BLOCKGEOMETRY_H

// blockgeometry.h*
#include <tfilm/tfilm.h>

#include <tfilm/base/filter.h>
#include <tfilm/util/check.h>
#include <tfilm/util/pstd.h>

#include <absl/types/span.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tfilm {

// BlockGeometry tracks the logical shape of a block, the filter border
// around it and the extent of the allocation backing it. The allocation
// is sized by the widest border seen since it was made; when a later
// configuration uses a narrower border, the logical window is shifted
// inward by the difference instead of reallocating.
class BlockGeometry {
  public:
    // BlockGeometry Public Methods
    BlockGeometry() = default;

    // Validates the configuration and broadcasts a single filter to all
    // axes. Returns true if the storage backing the block must be
    // (re)allocated.
    bool Configure(absl::Span<const int> dimensions,
                   absl::Span<const FilterHandle> filters, bool useBorder,
                   const FileLoc *loc = nullptr);

    int NumDimensions() const { return nDims; }
    int Dimension(int axis) const {
        DCHECK(axis >= 0 && axis < nDims);
        return dims[axis];
    }
    int BorderSize(int axis) const {
        DCHECK(axis >= 0 && axis < nDims);
        return border[axis];
    }
    int MaxBorderSize(int axis) const {
        DCHECK(axis >= 0 && axis < nDims);
        return maxBorder[axis];
    }
    int OriginShift(int axis) const {
        DCHECK(axis >= 0 && axis < nDims);
        return shift[axis];
    }
    // Physical size of the allocation along _axis_.
    int Extent(int axis) const { return Dimension(axis) + 2 * MaxBorderSize(axis); }
    // Cells [WindowStart(), WindowEnd()) along _axis_ may receive samples.
    int WindowStart(int axis) const { return OriginShift(axis); }
    int WindowEnd(int axis) const { return Extent(axis) - OriginShift(axis); }

    absl::Span<const FilterHandle> Filters() const {
        return absl::MakeConstSpan(filters.data(), nDims);
    }

    std::vector<int> Dimensions() const;
    std::vector<int> Extents() const;
    int64_t CellCount() const;

    std::string ToString() const;

  private:
    // BlockGeometry Private Data
    int nDims = 0;
    pstd::array<int, MaxBlockDimensions> dims, border, maxBorder, shift;
    pstd::array<FilterHandle, MaxBlockDimensions> filters;
};

}  // namespace tfilm

#endif  // TFILM_BLOCKGEOMETRY_H
