// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <tfilm/util/log.h>

#include <tfilm/util/check.h>
#include <tfilm/util/parallel.h>

#include <stdio.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace tfilm {

namespace {

std::string TimeNow() {
    std::time_t t = std::time(NULL);
    std::tm tm = *std::localtime(&t);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y%m%d.%H%M%S");
    return ss.str();
}

#define LOG_BASE_FMT "%d.%03d %s"
#define LOG_BASE_ARGS getpid(), ThreadIndex, TimeNow().c_str()

}  // namespace

LogConfig LOGGING_logConfig;

void InitLogging(LogConfig config, const char *argv0) {
    LOGGING_logConfig = config;
    if (config.level == LogLevel::Invalid)
        LOG_FATAL("Invalid --log-level specified.");
}

LogLevel LogLevelFromString(const std::string &s) {
    if (s == "verbose")
        return LogLevel::Verbose;
    else if (s == "error")
        return LogLevel::Error;
    else if (s == "fatal")
        return LogLevel::Fatal;
    return LogLevel::Invalid;
}

std::string ToString(LogLevel level) {
    switch (level) {
    case LogLevel::Verbose:
        return "VERBOSE";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "UNKNOWN";
    }
}

void Log(LogLevel level, const char *file, int line, const char *s) {
    if (strlen(s) == 0)
        return;
    fprintf(stderr, "[ " LOG_BASE_FMT " %s:%d ] %s %s\n", LOG_BASE_ARGS, file, line,
            ToString(level).c_str(), s);
}

void LogFatal(LogLevel level, const char *file, int line, const char *s) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    fprintf(stderr, "[ " LOG_BASE_FMT " %s:%d ] %s %s\n", LOG_BASE_ARGS, file, line,
            ToString(level).c_str(), s);

    CheckCallbackScope::Fail();
    abort();
}

}  // namespace tfilm
