// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_TRANSIENTFILM_H
#define TFILM_TRANSIENTFILM_H

// transientfilm.h*
#include <tfilm/tfilm.h>

#include <tfilm/base/filter.h>
#include <tfilm/filters.h>
#include <tfilm/transientblock.h>
#include <tfilm/util/arraynd.h>
#include <tfilm/util/color.h>

#include <string>

namespace tfilm {

// TransientFilm records both a steady-state image and a time-resolved
// volume. Time is measured in optical path length (OPL); the range
// [startOpl, EndOpl()) is divided into temporalBins bins of equal width.
// Each cell stores R, G, B, alpha and the filter weight.
class TransientFilm {
  public:
    // TransientFilm Public Methods
    TransientFilm(int xResolution, int yResolution, int temporalBins, Float startOpl,
                  Float binWidthOpl, FilterHandle filter,
                  const std::string &temporalFilter = "", Float gaussianStdDev = 2,
                  Float progressive = 0, bool sampleBorder = true,
                  bool normalize = false, Allocator alloc = {},
                  const FileLoc *loc = nullptr);

    static TransientFilm *Create(const ParameterDictionary &parameters,
                                 FilterHandle filter, const FileLoc *loc,
                                 Allocator alloc);

    TransientFilm(const TransientFilm &) = delete;
    TransientFilm &operator=(const TransientFilm &) = delete;

    // Rebuilds the filters for the given progressive iteration and clears
    // both blocks.
    void Prepare(int iteration);

    bool AddSample(Float px, Float py, const RGB &L, Float alpha, bool active = true);
    bool AddTransientSample(Float px, Float py, Float distance, const RGB &L,
                            bool active = true);

    ArrayND<Float> DevelopSteady(bool applyTransferCurve = false) const;
    ArrayND<Float> DevelopTransient(bool applyTransferCurve = false,
                                    bool raw = false) const;

    int XResolution() const { return xResolution; }
    int YResolution() const { return yResolution; }
    int TemporalBins() const { return temporalBins; }
    Float StartOpl() const { return startOpl; }
    Float BinWidthOpl() const { return binWidthOpl; }
    Float EndOpl() const { return startOpl + temporalBins * binWidthOpl; }

    FilterHandle SpatialFilter() const { return filter; }
    FilterHandle TemporalFilter() const { return temporal; }

    const TransientBlock &SteadyBlock() const { return steady; }
    const TransientBlock &TransientVolume() const { return transient; }

    std::string ToString() const;

  private:
    // TransientFilm Private Methods
    FilterHandle temporalFilterFor(int iteration);

    // TransientFilm Private Data
    int xResolution, yResolution, temporalBins;
    Float startOpl, binWidthOpl;
    FilterHandle filter;
    std::string temporalFilterName;
    Float gaussianStdDev, progressive;
    BoxFilter temporalBox;
    GaussianFilter temporalGaussian;
    FilterHandle temporal;
    TransientBlock steady, transient;
};

}  // namespace tfilm

#endif  // TFILM_TRANSIENTFILM_H
