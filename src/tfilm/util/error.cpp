// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// util/error.cpp*
#include <tfilm/util/error.h>

#include <tfilm/options.h>
#include <tfilm/util/check.h>
#include <tfilm/util/parallel.h>
#include <tfilm/util/print.h>

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace tfilm {

std::string FileLoc::ToString() const {
    return StringPrintf("%s:%d:%d", filename, line, column);
}

static void processError(const char *errorType, const FileLoc *loc,
                         const char *message) {
    // Build up an entire formatted error string and print it all at once;
    // this way, if multiple threads are printing messages at once, they
    // don't get jumbled up...
    std::string errorString = Red(errorType);

    if (loc)
        errorString += ": " + loc->ToString();

    errorString += ": ";
    errorString += message;

    // Print the error message (but not more than one time).
    static std::string lastError;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (errorString != lastError) {
        fprintf(stderr, "%s\n", errorString.c_str());
        LOG_VERBOSE("%s", errorString);
        lastError = errorString;
    }
}

void Warning(const FileLoc *loc, const char *message) {
    if (Options && Options->quiet)
        return;
    processError("Warning", loc, message);
}

void Error(const FileLoc *loc, const char *message) {
    if (Options && Options->quiet)
        return;
    processError("Error", loc, message);
}

void ErrorExit(const FileLoc *loc, const char *message) {
    processError("Error", loc, message);
    // This is annoying, but gives a cleaner exit.
    ParallelCleanup();
    exit(1);
}

}  // namespace tfilm
