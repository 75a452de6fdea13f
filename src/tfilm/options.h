// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_OPTIONS_H
#define TFILM_OPTIONS_H

// options.h*
#include <tfilm/tfilm.h>

#include <string>

namespace tfilm {

struct TFilmOptions {
    // Zero selects one thread per available core.
    int nThreads = 0;
    bool quiet = false;

    std::string ToString() const;
};

extern TFilmOptions *Options;

}  // namespace tfilm

#endif  // TFILM_OPTIONS_H
