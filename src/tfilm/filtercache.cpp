// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// filtercache.cpp*
#include <tfilm/filtercache.h>

#include <tfilm/filters.h>
#include <tfilm/util/error.h>
#include <tfilm/util/log.h>
#include <tfilm/util/print.h>

#include <algorithm>
#include <cmath>

namespace tfilm {

void SeparableFilterCache::Configure(absl::Span<const FilterHandle> f, bool norm,
                                     const FileLoc *loc) {
    CHECK_LE(int(f.size()), MaxBlockDimensions);
    nAxes = f.size();
    normalize = norm;
    allNarrowBox = true;
    totalTaps = 0;
    for (int i = 0; i < nAxes; ++i) {
        CHECK(f[i]);
        filters[i] = f[i];
        taps[i] = f[i].TapCount();
        offsets[i] = totalTaps;
        narrowBox[i] = f[i].IsNarrowBox();
        allNarrowBox &= f[i].IsNarrowBox();
        totalTaps += taps[i];
    }
    if (totalTaps > MaxFilterTaps)
        ErrorExit(loc, "%d: total filter taps exceed the maximum of %d.", totalTaps,
                  MaxFilterTaps);
    VLOG(1, "Configured filter cache %s", *this);
}

int SeparableFilterCache::Support(int axis, Float coord, int *lo) const {
    FilterHandle filter = Filter(axis);
    int hi;
    if (narrowBox[axis]) {
        // Cell i owns [i - 0.5, i + 0.5).
        *lo = hi = int(std::floor(coord + 0.5f));
    } else if (filter.IsBox()) {
        // Wide boxes cover the half-open interval (coord - r, coord + r].
        Float r = filter.Radius();
        *lo = int(std::floor(coord - r)) + 1;
        hi = int(std::floor(coord + r));
    } else {
        Float r = filter.Radius();
        *lo = int(std::ceil(coord - r));
        hi = int(std::floor(coord + r));
    }
    return std::min(taps[axis], hi - *lo + 1);
}

void SeparableFilterCache::EvaluateAxis(int axis, Float base,
                                        absl::Span<Float> weights) const {
    DCHECK_LE(int(weights.size()), taps[axis]);
    if (narrowBox[axis]) {
        std::fill(weights.begin(), weights.end(), Float(1));
        return;
    }
    FilterHandle filter = Filter(axis);
    for (size_t i = 0; i < weights.size(); ++i)
        weights[i] = filter.Evaluate(base + i);
}

void SeparableFilterCache::NormalizeWeights(absl::Span<Float> weights) {
    Float sum = 0;
    for (Float w : weights)
        sum += w;
    if (sum == 0)
        return;
    Float invSum = 1 / sum;
    for (Float &w : weights)
        w *= invSum;
}

std::string SeparableFilterCache::ToString() const {
    std::string s = StringPrintf("[ SeparableFilterCache nAxes: %d totalTaps: %d "
                                 "allNarrowBox: %s normalize: %s axes: [ ",
                                 nAxes, totalTaps, allNarrowBox, normalize);
    for (int i = 0; i < nAxes; ++i)
        s += StringPrintf("[ filter: %s taps: %d offset: %d ] ", filters[i], taps[i],
                          offsets[i]);
    return s + "] ]";
}

}  // namespace tfilm
