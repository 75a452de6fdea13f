// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// transientblock.cpp*
#include <tfilm/transientblock.h>

#include <tfilm/filters.h>
#include <tfilm/paramdict.h>
#include <tfilm/util/color.h>
#include <tfilm/util/float.h>
#include <tfilm/util/log.h>
#include <tfilm/util/print.h>

#include <algorithm>
#include <cmath>

namespace tfilm {

std::string SampleBatch::ToString() const {
    return StringPrintf("[ SampleBatch nCoords: %d nValues: %d size: %d ]", nCoords,
                        nValues, size());
}

// TransientBlock Method Definitions
TransientBlock::TransientBlock(absl::Span<const int> dimensions,
                               absl::Span<const FilterHandle> filters, int channelCount,
                               bool useBorder, bool normalize, bool warnInvalid,
                               bool warnNegative, Allocator alloc, const FileLoc *l)
    : channelCount(channelCount),
      useBorder(useBorder),
      normalize(normalize),
      warnInvalid(warnInvalid),
      warnNegative(warnNegative),
      alloc(alloc),
      buffer(alloc) {
    if (l)
        loc = *l;
    if (channelCount < 1)
        ErrorExit(l, "%d: a block needs at least one channel for the filter weights.",
                  channelCount);
    offset.fill(0);
    Configure(dimensions, filters);
}

void TransientBlock::Configure(absl::Span<const int> dimensions,
                               absl::Span<const FilterHandle> filters) {
    int prevDims = geometry.NumDimensions();
    bool realloc = geometry.Configure(dimensions, filters, useBorder, Loc());
    filterCache.Configure(geometry.Filters(), normalize, Loc());

    if (geometry.NumDimensions() != prevDims)
        offset.fill(0);

    if (realloc) {
        std::vector<int> shape = geometry.Extents();
        shape.push_back(channelCount);
        buffer = ArrayND<AtomicDouble>(shape, alloc);
        LOG_VERBOSE("Allocated transient block buffer of shape %s", shape);
    } else
        Clear();
}

void TransientBlock::SetOffset(absl::Span<const int> o) {
    if (int(o.size()) != NumDimensions())
        ErrorExit(Loc(), "%d offset values provided for a block with %d dimensions.",
                  o.size(), NumDimensions());
    for (int i = 0; i < NumDimensions(); ++i)
        offset[i] = o[i];
}

void TransientBlock::Clear() {
    for (AtomicDouble &v : buffer)
        v = 0.;
}

void TransientBlock::checkSample(absl::Span<const Float> values) const {
    for (Float v : values) {
        if (warnInvalid && (IsNaN(v) || IsInf(v)))
            Warning(Loc(), "TransientBlock::Put(): invalid (NaN or infinite) sample "
                          "value; the sample is still accumulated.");
        if (warnNegative && v < 0)
            Warning(Loc(), "TransientBlock::Put(): negative sample value; the sample "
                          "is still accumulated.");
    }
}

bool TransientBlock::Put(absl::Span<const Float> position, Float time,
                         absl::Span<const Float> values, bool active) {
    CHECK_EQ(int(position.size()) + 1, NumDimensions());
    pstd::array<Float, MaxBlockDimensions> coords;
    std::copy(position.begin(), position.end(), coords.begin());
    coords[position.size()] = time;
    return Put(absl::MakeConstSpan(coords.data(), NumDimensions()), values, active);
}

bool TransientBlock::Put(absl::Span<const Float> p, absl::Span<const Float> values,
                         bool active) {
    if (!active)
        return active;
    const int n = NumDimensions();
    CHECK_EQ(int(p.size()), n);
    CHECK_EQ(int(values.size()), channelCount - 1);
    if (warnInvalid || warnNegative)
        checkSample(values);

    // Convert to buffer-local coordinates; cell i is centered at i. A
    // sample whose support cannot reach the buffer is dropped here, before
    // any conversion to integer cells; NaN fails the range test too.
    pstd::array<Float, MaxBlockDimensions> coord;
    for (int i = 0; i < n; ++i) {
        coord[i] = p[i] - offset[i] + geometry.MaxBorderSize(i) - 0.5f;
        Float r = filterCache.Filter(i).Radius();
        if (!(coord[i] >= -r && coord[i] <= geometry.Extent(i) + r))
            return active;
    }

    if (filterCache.AllNarrowBox()) {
        // Every axis lands in exactly one cell with unit weight.
        int64_t cell = 0;
        for (int i = 0; i < n; ++i) {
            int c = int(std::floor(coord[i] + 0.5f));
            if (c < geometry.WindowStart(i) || c >= geometry.WindowEnd(i))
                return active;
            cell = cell * geometry.Extent(i) + c;
        }
        accumulate(cell, values, 1);
        return active;
    }

    // Compute the separable weights for each axis and clip their support
    // to the active window.
    pstd::array<Float, MaxFilterTaps> weights;
    pstd::array<int, MaxBlockDimensions> first, skip, count;
    for (int i = 0; i < n; ++i) {
        int lo;
        int nTaps = filterCache.Support(i, coord[i], &lo);
        if (nTaps <= 0)
            return active;

        absl::Span<Float> w(&weights[filterCache.TapOffset(i)], nTaps);
        filterCache.EvaluateAxis(i, lo - coord[i], w);
        if (normalize)
            SeparableFilterCache::NormalizeWeights(w);

        int start = std::max(lo, geometry.WindowStart(i));
        int end = std::min(lo + nTaps, geometry.WindowEnd(i));
        if (start >= end)
            return active;
        first[i] = start;
        skip[i] = start - lo;
        count[i] = end - start;
    }

    // Visit every cell in the support with a mixed-radix counter; the last
    // axis varies fastest.
    pstd::array<int, MaxBlockDimensions> index;
    index.fill(0);
    while (true) {
        Float weight = 1;
        int64_t cell = 0;
        for (int i = 0; i < n; ++i) {
            weight *= weights[filterCache.TapOffset(i) + skip[i] + index[i]];
            cell = cell * geometry.Extent(i) + first[i] + index[i];
        }
        if (weight != 0)
            accumulate(cell, values, weight);

        int axis = n - 1;
        for (; axis >= 0; --axis) {
            if (++index[axis] < count[axis])
                break;
            index[axis] = 0;
        }
        if (axis < 0)
            break;
    }
    return active;
}

void TransientBlock::PutBatch(const SampleBatch &batch) {
    CHECK_EQ(batch.nCoords, NumDimensions());
    CHECK_EQ(batch.nValues, channelCount - 1);
    ParallelFor(0, batch.size(), [&](int64_t i) {
        Put(batch.Coords(i), batch.Values(i), batch.Active(i));
    });
}

ArrayND<Float> TransientBlock::Develop(bool applyTransferCurve, bool raw,
                                       Allocator outAlloc) const {
    const int n = NumDimensions();
    if (raw) {
        std::vector<int> shape = geometry.Extents();
        shape.push_back(channelCount);
        ArrayND<Float> out(shape, outAlloc);
        std::transform(buffer.begin(), buffer.end(), out.begin(),
                       [](const AtomicDouble &v) { return Float(double(v)); });
        return out;
    }

    std::vector<int> shape = geometry.Dimensions();
    const int nOut = channelCount - 1;
    shape.push_back(nOut);
    ArrayND<Float> out(shape, outAlloc);

    int64_t nCells = 1;
    for (int i = 0; i < n; ++i)
        nCells *= geometry.Dimension(i);

    ParallelFor(0, nCells, [&](int64_t start, int64_t end) {
        for (int64_t o = start; o < end; ++o) {
            // Find the buffer cell for output cell _o_, skipping the border.
            int64_t rem = o, cell = 0, stride = 1;
            for (int i = n - 1; i >= 0; --i) {
                int c = rem % geometry.Dimension(i) + geometry.MaxBorderSize(i);
                rem /= geometry.Dimension(i);
                cell += c * stride;
                stride *= geometry.Extent(i);
            }

            const AtomicDouble *v = buffer.begin() + cell * channelCount;
            double weight = v[channelCount - 1];
            Float *dst = out.begin() + o * nOut;
            for (int k = 0; k < nOut; ++k) {
                Float value = weight != 0 ? Float(double(v[k]) / weight) : Float(0);
                if (applyTransferCurve)
                    value = LinearToSRGBFull(value);
                dst[k] = value;
            }
        }
    });
    return out;
}

TransientBlock *TransientBlock::Create(const ParameterDictionary &dict,
                                       absl::Span<const FilterHandle> filters,
                                       const FileLoc *loc, Allocator alloc) {
    std::vector<int> dimensions = dict.GetIntArray("dimensions");
    if (dimensions.empty())
        ErrorExit(loc, "\"dimensions\" must be provided for a transient block.");
    int channelCount = dict.GetOneInt("channelcount", 0);
    bool border = dict.GetOneBool("border", true);
    bool normalize = dict.GetOneBool("normalize", false);
    bool warnInvalid = dict.GetOneBool("warninvalid", false);
    bool warnNegative = dict.GetOneBool("warnnegative", false);
    std::vector<int> offset = dict.GetIntArray("offset");
    dict.ReportUnused();

    TransientBlock *block = alloc.new_object<TransientBlock>(
        dimensions, filters, channelCount, border, normalize, warnInvalid,
        warnNegative, alloc, loc);
    if (!offset.empty())
        block->SetOffset(offset);
    return block;
}

std::string TransientBlock::ToString() const {
    return StringPrintf("[ TransientBlock geometry: %s filterCache: %s channelCount: %d "
                        "useBorder: %s normalize: %s warnInvalid: %s warnNegative: %s "
                        "offset: %s ]",
                        geometry, filterCache, channelCount, useBorder, normalize,
                        warnInvalid, warnNegative,
                        std::vector<int>(offset.begin(), offset.begin() + NumDimensions()));
}

}  // namespace tfilm
