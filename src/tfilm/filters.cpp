// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// filters.cpp*
#include <tfilm/filters.h>

#include <tfilm/paramdict.h>
#include <tfilm/util/error.h>
#include <tfilm/util/print.h>
#include <tfilm/util/pstd.h>

#include <algorithm>
#include <cmath>

namespace tfilm {

// Box Filter Method Definitions
std::string BoxFilter::ToString() const {
    return StringPrintf("[ BoxFilter radius: %f ]", radius);
}

BoxFilter *BoxFilter::Create(const ParameterDictionary &dict, const FileLoc *loc,
                             Allocator alloc) {
    Float r = dict.GetOneFloat("radius", 0.5f);
    if (r <= 0)
        ErrorExit(loc, "%f: box filter radius must be positive.", r);
    return alloc.new_object<BoxFilter>(r);
}

// Gaussian Filter Method Definitions
std::string GaussianFilter::ToString() const {
    return StringPrintf("[ GaussianFilter radius: %f sigma: %f expR: %f ]", radius, sigma,
                        expR);
}

GaussianFilter *GaussianFilter::Create(const ParameterDictionary &dict,
                                       const FileLoc *loc, Allocator alloc) {
    Float sigma = dict.GetOneFloat("sigma", 0.5f);
    if (sigma <= 0)
        ErrorExit(loc, "%f: gaussian filter sigma must be positive.", sigma);
    Float r = dict.GetOneFloat("radius", 4 * sigma);
    if (r <= 0)
        ErrorExit(loc, "%f: gaussian filter radius must be positive.", r);
    return alloc.new_object<GaussianFilter>(r, sigma);
}

// Mitchell Filter Method Definitions
std::string MitchellFilter::ToString() const {
    return StringPrintf("[ MitchellFilter radius: %f B: %f C: %f ]", radius, B, C);
}

MitchellFilter *MitchellFilter::Create(const ParameterDictionary &dict,
                                       const FileLoc *loc, Allocator alloc) {
    Float r = dict.GetOneFloat("radius", 2.f);
    if (r <= 0)
        ErrorExit(loc, "%f: mitchell filter radius must be positive.", r);
    Float B = dict.GetOneFloat("B", 1.f / 3.f);
    Float C = dict.GetOneFloat("C", 1.f / 3.f);
    return alloc.new_object<MitchellFilter>(r, B, C);
}

// Sinc Filter Method Definitions
std::string LanczosSincFilter::ToString() const {
    return StringPrintf("[ LanczosSincFilter radius: %f tau: %f ]", radius, tau);
}

LanczosSincFilter *LanczosSincFilter::Create(const ParameterDictionary &dict,
                                             const FileLoc *loc, Allocator alloc) {
    Float r = dict.GetOneFloat("radius", 3.f);
    if (r <= 0)
        ErrorExit(loc, "%f: sinc filter radius must be positive.", r);
    Float tau = dict.GetOneFloat("tau", 3.f);
    return alloc.new_object<LanczosSincFilter>(r, tau);
}

// Triangle Filter Method Definitions
std::string TriangleFilter::ToString() const {
    return StringPrintf("[ TriangleFilter radius: %f ]", radius);
}

TriangleFilter *TriangleFilter::Create(const ParameterDictionary &dict,
                                       const FileLoc *loc, Allocator alloc) {
    Float r = dict.GetOneFloat("radius", 1.f);
    if (r <= 0)
        ErrorExit(loc, "%f: triangle filter radius must be positive.", r);
    return alloc.new_object<TriangleFilter>(r);
}

// Function Filter Method Definitions
std::string FunctionFilter::ToString() const {
    return StringPrintf("[ FunctionFilter radius: %f ]", radius);
}

// FilterHandle Method Definitions
int FilterHandle::TapCount() const {
    if (IsNarrowBox())
        return 1;
    return std::max(1, int(std::ceil(2 * (Radius() - 2 * FilterEpsilon))));
}

int FilterHandle::BorderSize() const {
    return std::max(0, int(std::ceil(Radius() - 0.5f - 2 * FilterEpsilon)));
}

std::string FilterHandle::ToString() const {
    if (!ptr())
        return "(nullptr)";

    switch (Tag()) {
    case TypeIndex<BoxFilter>():
        return Cast<BoxFilter>()->ToString();
    case TypeIndex<GaussianFilter>():
        return Cast<GaussianFilter>()->ToString();
    case TypeIndex<MitchellFilter>():
        return Cast<MitchellFilter>()->ToString();
    case TypeIndex<LanczosSincFilter>():
        return Cast<LanczosSincFilter>()->ToString();
    case TypeIndex<TriangleFilter>():
        return Cast<TriangleFilter>()->ToString();
    case TypeIndex<FunctionFilter>():
        return Cast<FunctionFilter>()->ToString();
    default:
        LOG_FATAL("Unhandled Filter type");
    }
}

FilterHandle FilterHandle::Create(const std::string &name,
                                  const ParameterDictionary &dict, const FileLoc *loc,
                                  Allocator alloc) {
    FilterHandle filter = nullptr;
    if (name == "box")
        filter = BoxFilter::Create(dict, loc, alloc);
    else if (name == "gaussian")
        filter = GaussianFilter::Create(dict, loc, alloc);
    else if (name == "mitchell")
        filter = MitchellFilter::Create(dict, loc, alloc);
    else if (name == "sinc")
        filter = LanczosSincFilter::Create(dict, loc, alloc);
    else if (name == "triangle")
        filter = TriangleFilter::Create(dict, loc, alloc);
    else
        ErrorExit(loc, "%s: filter type unknown.", name);

    if (!filter)
        ErrorExit(loc, "%s: unable to create filter.", name);

    dict.ReportUnused();
    return filter;
}

}  // namespace tfilm
