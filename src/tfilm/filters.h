// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_FILTERS_H
#define TFILM_FILTERS_H

// filters.h*
#include <tfilm/tfilm.h>

#include <tfilm/base/filter.h>
#include <tfilm/util/check.h>
#include <tfilm/util/log.h>
#include <tfilm/util/math.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>

namespace tfilm {

// All filters are one-dimensional and symmetric about the origin; a block
// uses one of them per axis.
class alignas(8) FilterBase {
  public:
    Float Radius() const { return radius; }

  protected:
    FilterBase(Float radius) : radius(radius) {}
    Float radius;
};

// Box Filter Declarations
class BoxFilter : public FilterBase {
  public:
    BoxFilter(Float radius = 0.5f) : FilterBase(radius) {}

    static BoxFilter *Create(const ParameterDictionary &dict, const FileLoc *loc,
                             Allocator alloc);

    Float Evaluate(Float x) const { return std::abs(x) <= radius ? 1 : 0; }

    std::string ToString() const;
};

// Gaussian Filter Declarations
class GaussianFilter : public FilterBase {
  public:
    // GaussianFilter Public Methods
    GaussianFilter(Float radius, Float sigma = 0.5f)
        : FilterBase(radius), sigma(sigma), expR(Gaussian(radius, 0, sigma)) {}

    static GaussianFilter *Create(const ParameterDictionary &dict, const FileLoc *loc,
                                  Allocator alloc);

    Float Evaluate(Float x) const {
        return std::max<Float>(0, Gaussian(x, 0, sigma) - expR);
    }

    Float Sigma() const { return sigma; }

    std::string ToString() const;

  private:
    // GaussianFilter Private Data
    Float sigma;
    Float expR;
};

// Mitchell Filter Declarations
class MitchellFilter : public FilterBase {
  public:
    // MitchellFilter Public Methods
    MitchellFilter(Float radius, Float B = 1.f / 3.f, Float C = 1.f / 3.f)
        : FilterBase(radius), B(B), C(C) {}

    static MitchellFilter *Create(const ParameterDictionary &dict, const FileLoc *loc,
                                  Allocator alloc);

    Float Evaluate(Float x) const { return Mitchell1D(x / radius); }

    std::string ToString() const;

  private:
    Float B, C;

    Float Mitchell1D(Float x) const {
        x = std::abs(2 * x);
        if (x <= 1)
            return ((12 - 9 * B - 6 * C) * x * x * x + (-18 + 12 * B + 6 * C) * x * x +
                    (6 - 2 * B)) *
                   (1.f / 6.f);
        else if (x <= 2)
            return ((-B - 6 * C) * x * x * x + (6 * B + 30 * C) * x * x +
                    (-12 * B - 48 * C) * x + (8 * B + 24 * C)) *
                   (1.f / 6.f);
        else
            return 0;
    }
};

// Sinc Filter Declarations
class LanczosSincFilter : public FilterBase {
  public:
    // LanczosSincFilter Public Methods
    LanczosSincFilter(Float radius, Float tau = 3.f) : FilterBase(radius), tau(tau) {}

    static LanczosSincFilter *Create(const ParameterDictionary &dict,
                                     const FileLoc *loc, Allocator alloc);

    Float Evaluate(Float x) const { return WindowedSinc(x, radius, tau); }

    std::string ToString() const;

  private:
    Float tau;
};

// Triangle Filter Declarations
class TriangleFilter : public FilterBase {
  public:
    TriangleFilter(Float radius = 1.f) : FilterBase(radius) {}

    static TriangleFilter *Create(const ParameterDictionary &dict, const FileLoc *loc,
                                  Allocator alloc);

    Float Evaluate(Float x) const {
        return std::max<Float>(0, 1 - std::abs(x) / radius);
    }

    std::string ToString() const;
};

// FunctionFilter wraps an arbitrary kernel supplied by the caller. The
// kernel should vanish at +/- radius.
class FunctionFilter : public FilterBase {
  public:
    FunctionFilter(Float radius, std::function<Float(Float)> kernel)
        : FilterBase(radius), kernel(std::move(kernel)) {}

    Float Evaluate(Float x) const { return std::abs(x) <= radius ? kernel(x) : 0; }

    std::string ToString() const;

  private:
    std::function<Float(Float)> kernel;
};

inline Float FilterHandle::Evaluate(Float x) const {
    switch (Tag()) {
    case TypeIndex<BoxFilter>():
        return Cast<BoxFilter>()->Evaluate(x);
    case TypeIndex<GaussianFilter>():
        return Cast<GaussianFilter>()->Evaluate(x);
    case TypeIndex<MitchellFilter>():
        return Cast<MitchellFilter>()->Evaluate(x);
    case TypeIndex<LanczosSincFilter>():
        return Cast<LanczosSincFilter>()->Evaluate(x);
    case TypeIndex<TriangleFilter>():
        return Cast<TriangleFilter>()->Evaluate(x);
    case TypeIndex<FunctionFilter>():
        return Cast<FunctionFilter>()->Evaluate(x);
    default:
        LOG_FATAL("Unhandled Filter type");
    }
}

inline Float FilterHandle::Radius() const {
    switch (Tag()) {
    case TypeIndex<BoxFilter>():
        return Cast<BoxFilter>()->Radius();
    case TypeIndex<GaussianFilter>():
        return Cast<GaussianFilter>()->Radius();
    case TypeIndex<MitchellFilter>():
        return Cast<MitchellFilter>()->Radius();
    case TypeIndex<LanczosSincFilter>():
        return Cast<LanczosSincFilter>()->Radius();
    case TypeIndex<TriangleFilter>():
        return Cast<TriangleFilter>()->Radius();
    case TypeIndex<FunctionFilter>():
        return Cast<FunctionFilter>()->Radius();
    default:
        LOG_FATAL("Unhandled Filter type");
    }
}

}  // namespace tfilm

#endif  // TFILM_FILTERS_H
