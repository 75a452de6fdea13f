// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// transientfilm.cpp*
#include <tfilm/transientfilm.h>

#include <tfilm/paramdict.h>
#include <tfilm/util/error.h>
#include <tfilm/util/log.h>
#include <tfilm/util/print.h>

#include <algorithm>

namespace tfilm {

// TransientFilm Method Definitions
TransientFilm::TransientFilm(int xResolution, int yResolution, int temporalBins,
                             Float startOpl, Float binWidthOpl, FilterHandle filter,
                             const std::string &temporalFilter, Float gaussianStdDev,
                             Float progressive, bool sampleBorder, bool normalize,
                             Allocator alloc, const FileLoc *loc)
    : xResolution(xResolution),
      yResolution(yResolution),
      temporalBins(temporalBins),
      startOpl(startOpl),
      binWidthOpl(binWidthOpl),
      filter(filter),
      temporalFilterName(temporalFilter),
      gaussianStdDev(gaussianStdDev),
      progressive(progressive),
      temporalGaussian(4 * gaussianStdDev, gaussianStdDev),
      temporal(temporalFilterFor(0)),
      steady({xResolution, yResolution}, {filter}, 5, sampleBorder, normalize, false,
             false, alloc, loc),
      transient({xResolution, yResolution, temporalBins}, {filter, filter, temporal}, 5,
                sampleBorder, normalize, false, false, alloc, loc) {}

FilterHandle TransientFilm::temporalFilterFor(int iteration) {
    if (temporalFilterName == "box")
        return &temporalBox;
    if (temporalFilterName == "gaussian") {
        Float sigma = std::max<Float>(gaussianStdDev - iteration * progressive, 0.5f);
        temporalGaussian = GaussianFilter(4 * sigma, sigma);
        return &temporalGaussian;
    }
    return filter;
}

void TransientFilm::Prepare(int iteration) {
    temporal = temporalFilterFor(iteration);
    VLOG(1, "Iteration %d temporal filter %s", iteration, temporal);

    const int steadyDims[2] = {xResolution, yResolution};
    const FilterHandle steadyFilters[1] = {filter};
    steady.Configure(steadyDims, steadyFilters);

    const int transientDims[3] = {xResolution, yResolution, temporalBins};
    const FilterHandle transientFilters[3] = {filter, filter, temporal};
    transient.Configure(transientDims, transientFilters);
}

bool TransientFilm::AddSample(Float px, Float py, const RGB &L, Float alpha,
                              bool active) {
    const Float p[2] = {px, py};
    const Float values[4] = {L.r, L.g, L.b, alpha};
    return steady.Put(p, values, active);
}

bool TransientFilm::AddTransientSample(Float px, Float py, Float distance, const RGB &L,
                                       bool active) {
    // Map optical path length to a continuous bin coordinate; samples
    // outside the recorded range are masked.
    Float bin = (distance - startOpl) / binWidthOpl;
    active &= (bin >= 0 && bin < temporalBins);
    const Float p[2] = {px, py};
    const Float values[4] = {L.r, L.g, L.b, 1};
    return transient.Put(p, bin, values, active);
}

ArrayND<Float> TransientFilm::DevelopSteady(bool applyTransferCurve) const {
    return steady.Develop(applyTransferCurve);
}

ArrayND<Float> TransientFilm::DevelopTransient(bool applyTransferCurve, bool raw) const {
    return transient.Develop(applyTransferCurve, raw);
}

std::string TransientFilm::ToString() const {
    return StringPrintf("[ TransientFilm xResolution: %d yResolution: %d "
                        "temporalBins: %d startOpl: %f binWidthOpl: %f filter: %s "
                        "temporalFilterName: \"%s\" gaussianStdDev: %f progressive: %f "
                        "temporal: %s steady: %s transient: %s ]",
                        xResolution, yResolution, temporalBins, startOpl, binWidthOpl,
                        filter, temporalFilterName, gaussianStdDev, progressive,
                        temporal, steady, transient);
}

TransientFilm *TransientFilm::Create(const ParameterDictionary &parameters,
                                     FilterHandle filter, const FileLoc *loc,
                                     Allocator alloc) {
    int xResolution = parameters.GetOneInt("xresolution", 1280);
    int yResolution = parameters.GetOneInt("yresolution", 720);
    int temporalBins = parameters.GetOneInt("temporalbins", 128);
    Float startOpl = parameters.GetOneFloat("startopl", 0.f);
    Float binWidthOpl = parameters.GetOneFloat("binwidthopl", 1.f);
    std::string temporalFilter = parameters.GetOneString("temporalfilter", "");
    Float gaussianStdDev = parameters.GetOneFloat("gaussianstddev", 2.f);
    Float progressive = parameters.GetOneFloat("progressive", 0.f);
    bool sampleBorder = parameters.GetOneBool("sampleborder", true);
    bool normalize = parameters.GetOneBool("normalize", false);

    if (xResolution <= 0 || yResolution <= 0)
        ErrorExit(loc, "%d x %d: film resolution must be positive.", xResolution,
                  yResolution);
    if (temporalBins <= 0)
        ErrorExit(loc, "%d: \"temporalbins\" must be positive.", temporalBins);
    if (binWidthOpl <= 0)
        ErrorExit(loc, "%f: \"binwidthopl\" must be positive.", binWidthOpl);
    if (temporalFilter != "" && temporalFilter != "box" && temporalFilter != "gaussian")
        ErrorExit(loc, "%s: unknown temporal filter. Expected \"box\" or \"gaussian\".",
                  temporalFilter);
    if (temporalFilter == "gaussian" && gaussianStdDev <= 0)
        ErrorExit(loc, "%f: \"gaussianstddev\" must be positive.", gaussianStdDev);
    if (progressive != 0 && temporalFilter != "gaussian")
        Warning(loc, "\"progressive\" only affects the \"gaussian\" temporal filter.");

    parameters.ReportUnused();

    return alloc.new_object<TransientFilm>(xResolution, yResolution, temporalBins,
                                           startOpl, binWidthOpl, filter, temporalFilter,
                                           gaussianStdDev, progressive, sampleBorder,
                                           normalize, alloc, loc);
}

}  // namespace tfilm
