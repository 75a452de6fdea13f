// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// tfilm.cpp*
#include <tfilm/tfilm.h>

#include <tfilm/options.h>
#include <tfilm/util/log.h>
#include <tfilm/util/parallel.h>

namespace tfilm {

void InitTFilm(const TFilmOptions &opt, const LogConfig &logConfig) {
    Options = new TFilmOptions(opt);

    InitLogging(logConfig);

    int nThreads = Options->nThreads != 0 ? Options->nThreads : AvailableCores();
    ParallelInit(nThreads);

    LOG_VERBOSE("Initialized tfilm with %s", Options->ToString());
}

void CleanupTFilm() {
    ParallelCleanup();

    delete Options;
    Options = nullptr;
}

}  // namespace tfilm
