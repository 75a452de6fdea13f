// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_TRANSIENTBLOCK_H
#define TFILM_TRANSIENTBLOCK_H

// transientblock.h*
#include <tfilm/tfilm.h>

#include <tfilm/base/filter.h>
#include <tfilm/blockgeometry.h>
#include <tfilm/filtercache.h>
#include <tfilm/util/arraynd.h>
#include <tfilm/util/error.h>
#include <tfilm/util/parallel.h>
#include <tfilm/util/pstd.h>

#include <absl/types/span.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tfilm {

// SampleBatch stores many samples in structure-of-arrays form so that
// they can be splatted in parallel with TransientBlock::PutBatch().
struct SampleBatch {
    SampleBatch(int nCoords, int nValues) : nCoords(nCoords), nValues(nValues) {}

    void Add(absl::Span<const Float> c, absl::Span<const Float> v, bool a = true) {
        CHECK_EQ(int(c.size()), nCoords);
        CHECK_EQ(int(v.size()), nValues);
        coords.insert(coords.end(), c.begin(), c.end());
        values.insert(values.end(), v.begin(), v.end());
        active.push_back(a);
    }
    void Add(absl::Span<const Float> position, Float time, absl::Span<const Float> v,
             bool a = true) {
        CHECK_EQ(int(position.size()) + 1, nCoords);
        coords.insert(coords.end(), position.begin(), position.end());
        coords.push_back(time);
        CHECK_EQ(int(v.size()), nValues);
        values.insert(values.end(), v.begin(), v.end());
        active.push_back(a);
    }

    size_t size() const { return active.size(); }

    absl::Span<const Float> Coords(size_t i) const {
        return absl::MakeConstSpan(coords.data() + i * nCoords, nCoords);
    }
    absl::Span<const Float> Values(size_t i) const {
        return absl::MakeConstSpan(values.data() + i * nValues, nValues);
    }
    bool Active(size_t i) const { return active[i] != 0; }

    std::string ToString() const;

    int nCoords, nValues;
    std::vector<Float> coords, values;
    std::vector<uint8_t> active;
};

// TransientBlock accumulates filtered samples into a dense N-dimensional
// buffer whose last axis is typically time. Each cell holds channelCount
// values; the last one is the sum of the filter weights that reached the
// cell. Samples are splatted with atomic adds, so Put() may be called
// concurrently from any number of threads. Develop() divides by the
// weight channel and crops the filter border.
class TransientBlock {
  public:
    // TransientBlock Public Methods
    TransientBlock(absl::Span<const int> dimensions,
                   absl::Span<const FilterHandle> filters, int channelCount,
                   bool useBorder = true, bool normalize = false,
                   bool warnInvalid = false, bool warnNegative = false,
                   Allocator alloc = {}, const FileLoc *loc = nullptr);

    static TransientBlock *Create(const ParameterDictionary &dict,
                                  absl::Span<const FilterHandle> filters,
                                  const FileLoc *loc, Allocator alloc);

    TransientBlock(const TransientBlock &) = delete;
    TransientBlock &operator=(const TransientBlock &) = delete;

    // Rebuilds the filter set, possibly with new dimensions. The buffer is
    // reallocated only if the dimensions change or a border no longer
    // fits; it is always zeroed.
    void Configure(absl::Span<const int> dimensions,
                   absl::Span<const FilterHandle> filters);
    void SetOffset(absl::Span<const int> offset);
    void Clear();

    bool Put(absl::Span<const Float> coords, absl::Span<const Float> values,
             bool active = true);
    bool Put(absl::Span<const Float> position, Float time,
             absl::Span<const Float> values, bool active = true);
    void PutBatch(const SampleBatch &batch);

    ArrayND<Float> Develop(bool applyTransferCurve = false, bool raw = false,
                           Allocator alloc = {}) const;

    int ChannelCount() const { return channelCount; }
    int NumDimensions() const { return geometry.NumDimensions(); }
    int Offset(int axis) const { return offset[axis]; }
    bool UseBorder() const { return useBorder; }
    bool Normalize() const { return normalize; }
    const BlockGeometry &Geometry() const { return geometry; }
    const SeparableFilterCache &FilterCache() const { return filterCache; }
    // Number of values in the backing storage, including the border.
    int64_t BufferSize() const { return buffer.size(); }

    std::string ToString() const;

  private:
    // TransientBlock Private Methods
    void accumulate(int64_t cell, absl::Span<const Float> values, Float weight) {
        AtomicDouble *v = buffer.begin() + cell * channelCount;
        for (size_t k = 0; k < values.size(); ++k)
            v[k].Add(double(weight) * double(values[k]));
        v[channelCount - 1].Add(weight);
    }
    void checkSample(absl::Span<const Float> values) const;
    const FileLoc *Loc() const { return loc.filename.empty() ? nullptr : &loc; }

    // TransientBlock Private Data
    BlockGeometry geometry;
    SeparableFilterCache filterCache;
    int channelCount;
    bool useBorder, normalize, warnInvalid, warnNegative;
    pstd::array<int, MaxBlockDimensions> offset;
    FileLoc loc;
    Allocator alloc;
    ArrayND<AtomicDouble> buffer;
};

}  // namespace tfilm

#endif  // TFILM_TRANSIENTBLOCK_H
