// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// blockgeometry.cpp*
#include <tfilm/blockgeometry.h>

#include <tfilm/filters.h>
#include <tfilm/util/error.h>
#include <tfilm/util/log.h>
#include <tfilm/util/print.h>

#include <algorithm>

namespace tfilm {

bool BlockGeometry::Configure(absl::Span<const int> dimensions,
                              absl::Span<const FilterHandle> f, bool useBorder,
                              const FileLoc *loc) {
    // Everything is validated before the geometry is touched.
    int n = dimensions.size();
    if (f.empty())
        ErrorExit(loc, "No filter was provided for the block.");
    if (n == 0)
        ErrorExit(loc, "A block must have at least one dimension.");
    if (n > MaxBlockDimensions)
        ErrorExit(loc, "%d: too many block dimensions; the maximum is %d.", n,
                  MaxBlockDimensions);
    if (f.size() != 1 && int(f.size()) != n)
        ErrorExit(loc,
                  "%d filters were provided for a block with %d dimensions. "
                  "Provide either one filter or one per dimension.",
                  f.size(), n);
    for (int i = 0; i < n; ++i) {
        if (dimensions[i] <= 0)
            ErrorExit(loc, "%d: block dimension %d must be positive.", dimensions[i], i);
        if (!f[f.size() == 1 ? 0 : i])
            ErrorExit(loc, "Filter for block dimension %d is missing.", i);
    }

    bool realloc = (n != nDims);
    for (int i = 0; i < n && !realloc; ++i)
        realloc = (dimensions[i] != dims[i]);

    nDims = n;
    for (int i = 0; i < n; ++i) {
        dims[i] = dimensions[i];
        filters[i] = f[f.size() == 1 ? 0 : i];
        border[i] = useBorder ? filters[i].BorderSize() : 0;
    }

    if (realloc) {
        for (int i = 0; i < n; ++i) {
            maxBorder[i] = border[i];
            shift[i] = 0;
        }
        return true;
    }

    // The allocation is kept unless some border no longer fits in it.
    for (int i = 0; i < n; ++i) {
        if (border[i] > maxBorder[i]) {
            LOG_VERBOSE("Border %d on axis %d exceeds allocated border %d; reallocating",
                        border[i], i, maxBorder[i]);
            maxBorder[i] = border[i];
            realloc = true;
        }
    }
    for (int i = 0; i < n; ++i)
        shift[i] = maxBorder[i] - border[i];
    return realloc;
}

std::vector<int> BlockGeometry::Dimensions() const {
    return std::vector<int>(dims.begin(), dims.begin() + nDims);
}

std::vector<int> BlockGeometry::Extents() const {
    std::vector<int> extents(nDims);
    for (int i = 0; i < nDims; ++i)
        extents[i] = Extent(i);
    return extents;
}

int64_t BlockGeometry::CellCount() const {
    if (nDims == 0)
        return 0;
    int64_t count = 1;
    for (int i = 0; i < nDims; ++i)
        count *= Extent(i);
    return count;
}

std::string BlockGeometry::ToString() const {
    return StringPrintf("[ BlockGeometry dimensions: %s border: %s maxBorder: %s "
                        "originShift: %s ]",
                        Dimensions(), std::vector<int>(border.begin(), border.begin() + nDims),
                        std::vector<int>(maxBorder.begin(), maxBorder.begin() + nDims),
                        std::vector<int>(shift.begin(), shift.begin() + nDims));
}

}  // namespace tfilm
