// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <tfilm/tfilm.h>

#include <tfilm/options.h>
#include <tfilm/util/args.h>
#include <tfilm/util/error.h>
#include <tfilm/util/log.h>
#include <tfilm/util/print.h>

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using namespace tfilm;

void usage(const std::string &msg = "") {
    if (!msg.empty())
        fprintf(stderr, "tfilm_test: %s\n\n", msg.c_str());

    fprintf(stderr, R"(
General tfilm_test arguments:
  --log-level <level>         Log messages at or above this level, where <level>
                              is "verbose", "error", or "fatal". Default: "error".
  --nthreads <num>            Use specified number of threads.
  --vlog-level <n>            Set VLOG verbosity. (Default: 0, disabled.)
)");

    exit(msg.empty() ? 0 : 1);
}

int main(int argc, char **argv) {
    TFilmOptions opt;
    opt.quiet = true;
    LogConfig logConfig;
    std::string logLevel = "error";

    testing::InitGoogleTest(&argc, argv);
    // ErrorExit() joins the worker threads before exiting, so death tests
    // must re-execute the binary rather than fork a multithreaded process.
    testing::GTEST_FLAG(death_test_style) = "threadsafe";

    // Process command-line arguments
    ++argv;
    while (*argv != nullptr) {
        auto onError = [](const std::string &err) {
            usage(err);
            exit(1);
        };

        if (ParseArg(&argv, "log-level", &logLevel, onError) ||
            ParseArg(&argv, "nthreads", &opt.nThreads, onError) ||
            ParseArg(&argv, "vlog-level", &logConfig.vlogLevel, onError)) {
            // success
        } else if ((strcmp(*argv, "--help") == 0) || (strcmp(*argv, "-h") == 0)) {
            usage();
            return 0;
        } else {
            usage(StringPrintf("argument \"%s\" unknown", *argv));
            return 1;
        }
    }

    logConfig.level = LogLevelFromString(logLevel);
    if (logConfig.level == LogLevel::Invalid)
        ErrorExit("%s: --log-level unknown", logLevel);

    InitTFilm(opt, logConfig);

    int ret = RUN_ALL_TESTS();

    CleanupTFilm();

    return ret;
}
