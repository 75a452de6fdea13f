// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#ifndef TFILM_UTIL_LOG_H
#define TFILM_UTIL_LOG_H

#include <tfilm/tfilm.h>

#include <string>

namespace tfilm {

enum class LogLevel { Verbose, Error, Fatal, Invalid };

std::string ToString(LogLevel level);
LogLevel LogLevelFromString(const std::string &s);

struct LogConfig {
    LogLevel level = LogLevel::Error;
    int vlogLevel = 0;
};

void InitLogging(LogConfig config, const char *argv0 = nullptr);

extern LogConfig LOGGING_logConfig;

void Log(LogLevel level, const char *file, int line, const char *s);

[[noreturn]] void LogFatal(LogLevel level, const char *file, int line, const char *s);

template <typename... Args>
inline void Log(LogLevel level, const char *file, int line, const char *fmt,
                Args &&... args);

template <typename... Args>
[[noreturn]] inline void LogFatal(LogLevel level, const char *file, int line,
                                  const char *fmt, Args &&... args);

#define TO_STRING(x) TO_STRING2(x)
#define TO_STRING2(x) #x

#define LOG_VERBOSE(...)                                     \
    (tfilm::LogLevel::Verbose >= tfilm::LOGGING_logConfig.level && \
     (tfilm::Log(tfilm::LogLevel::Verbose, __FILE__, __LINE__, __VA_ARGS__), true))

#define LOG_ERROR(...)                                     \
    (tfilm::LogLevel::Error >= tfilm::LOGGING_logConfig.level && \
     (tfilm::Log(tfilm::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__), true))

#define LOG_FATAL(...) \
    tfilm::LogFatal(tfilm::LogLevel::Fatal, __FILE__, __LINE__, __VA_ARGS__)

#define VLOG(level, ...)                            \
    (level <= tfilm::LOGGING_logConfig.vlogLevel && \
     (tfilm::Log(tfilm::LogLevel::Verbose, __FILE__, __LINE__, __VA_ARGS__), true))

}  // namespace tfilm

#include <tfilm/util/print.h>

namespace tfilm {

template <typename... Args>
inline void Log(LogLevel level, const char *file, int line, const char *fmt,
                Args &&... args) {
    std::string s = StringPrintf(fmt, std::forward<Args>(args)...);
    Log(level, file, line, s.c_str());
}

template <typename... Args>
inline void LogFatal(LogLevel level, const char *file, int line, const char *fmt,
                     Args &&... args) {
    std::string s = StringPrintf(fmt, std::forward<Args>(args)...);
    LogFatal(level, file, line, s.c_str());
}

}  // namespace tfilm

#endif  // TFILM_UTIL_LOG_H
