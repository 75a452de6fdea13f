// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// options.cpp*
#include <tfilm/options.h>

#include <tfilm/util/print.h>

namespace tfilm {

TFilmOptions *Options;

std::string TFilmOptions::ToString() const {
    return StringPrintf("[ TFilmOptions nThreads: %d quiet: %s ]", nThreads, quiet);
}

}  // namespace tfilm
